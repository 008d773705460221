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

#include "PopularityColdStartPolicy.hpp"

#include <algorithm>
#include <cmath>

#include "core/ILogger.hpp"

#include "TopicDeficiency.hpp"

namespace trs::recommendation
{
    std::unique_ptr<IColdStartPolicy> createPopularityColdStartPolicy(const ColdStartSettings& settings)
    {
        return std::make_unique<PopularityColdStartPolicy>(settings);
    }

    PopularityColdStartPolicy::PopularityColdStartPolicy(const ColdStartSettings& settings)
        : _settings{ settings }
    {
        validateSettings(_settings);
    }

    std::optional<double> PopularityColdStartPolicy::computeReferenceDifficulty(const backend::LearnerAttributes& attributes) const
    {
        if (!attributes.targetScore)
            return std::nullopt;

        // still below the goal: aim at the current level first
        if (attributes.currentScore && *attributes.currentScore < *attributes.targetScore)
            return *attributes.currentScore;

        return *attributes.targetScore + _settings.targetMargin;
    }

    double PopularityColdStartPolicy::computeAttributeMatch(const backend::Item& item, double referenceDifficulty) const
    {
        if (!item.difficulty)
            return 0;

        return 1 - std::min(1.0, std::abs(*item.difficulty - referenceDifficulty) / _settings.difficultyTolerance);
    }

    ScoreMap PopularityColdStartPolicy::score(const backend::LearnerAttributes& attributes, std::span<const backend::Item> candidates) const
    {
        ScoreMap res;

        double maxPopularity{};
        for (const backend::Item& candidate : candidates)
            maxPopularity = std::max(maxPopularity, candidate.popularity.value_or(0));

        const std::optional<double> referenceDifficulty{ computeReferenceDifficulty(attributes) };
        const std::span<const backend::TopicStat> topicStats{ attributes.topicStats };
        const double attributeWeight{ referenceDifficulty ? _settings.attributeWeight : 0 };
        const double topicWeight{ topicStats.empty() ? 0 : _settings.topicWeight };
        const double totalWeight{ _settings.popularityWeight + attributeWeight + topicWeight };

        for (const backend::Item& candidate : candidates)
        {
            const double popularity{ maxPopularity > 0 ? std::max(0.0, candidate.popularity.value_or(0)) / maxPopularity : 0 };

            double score{ popularity };
            if (totalWeight > 0 && (attributeWeight > 0 || topicWeight > 0))
            {
                score = _settings.popularityWeight * popularity;
                if (attributeWeight > 0)
                    score += attributeWeight * computeAttributeMatch(candidate, *referenceDifficulty);
                if (topicWeight > 0)
                    score += topicWeight * computeTopicDeficiencyScore(candidate, topicStats);
                score /= totalWeight;
            }

            res.try_emplace(backend::getItemKey(candidate), score);
        }

        TRS_LOG(RECOMMENDATION, DEBUG, "Scored " << res.size() << " candidates by cold start, max popularity = " << maxPopularity << ", reference difficulty = " << (referenceDifficulty ? std::to_string(*referenceDifficulty) : "none"));
        return res;
    }
} // namespace trs::recommendation
