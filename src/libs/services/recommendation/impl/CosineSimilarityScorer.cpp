/*
 * Copyright (C) 2025 TRS contributors
 *
 * This file is part of TRS.
 *
 * TRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * TRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with TRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "CosineSimilarityScorer.hpp"

#include <unordered_set>

#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"

#include "LearnerProfile.hpp"
#include "TopicDeficiency.hpp"

namespace trs::recommendation
{
    std::unique_ptr<ISimilarityScorer> createCosineSimilarityScorer(const SimilaritySettings& settings)
    {
        return std::make_unique<CosineSimilarityScorer>(settings);
    }

    CosineSimilarityScorer::CosineSimilarityScorer(const SimilaritySettings& settings)
        : _settings{ settings }
    {
        validateSettings(_settings);
    }

    ScoreMap CosineSimilarityScorer::score(const backend::InteractionHistory& history, const backend::Catalog& catalog, std::span<const backend::Item> candidates, bool includeCompleted) const
    {
        ScoreMap res;

        if (candidates.empty())
            return res;

        const std::vector<double> profile{ buildLearnerProfile(history, catalog, _settings) };
        if (profile.empty())
        {
            TRS_LOG(RECOMMENDATION, DEBUG, "No usable profile for learner '" << history.learnerId << "'");
            return res;
        }

        std::unordered_set<backend::ItemKey> completedItems;
        if (!includeCompleted)
        {
            for (const backend::Interaction& interaction : history.interactions)
            {
                if (interaction.type == backend::InteractionType::Completed)
                    completedItems.insert(backend::getItemKey(interaction));
            }
        }

        const std::span<const backend::TopicStat> topicStats{ history.attributes.topicStats };
        const double topicWeight{ topicStats.empty() ? 0 : _settings.topicWeight };

        for (const backend::Item& candidate : candidates)
        {
            if (completedItems.contains(backend::getItemKey(candidate)))
                continue;

            if (candidate.features.size() != profile.size())
                throw InvalidFeatureDimensionException{ candidate.id, profile.size(), candidate.features.size() };

            double score{ computeCosineSimilarity(profile, candidate.features) };
            if (topicWeight > 0)
                score = (1 - topicWeight) * score + topicWeight * computeTopicDeficiencyScore(candidate, topicStats);

            res.try_emplace(backend::getItemKey(candidate), score);
        }

        TRS_LOG(RECOMMENDATION, DEBUG, "Scored " << res.size() << "/" << candidates.size() << " candidates by similarity");
        return res;
    }
} // namespace trs::recommendation
