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

#include "CollaborativeScorer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "core/ILogger.hpp"

namespace trs::recommendation
{
    namespace
    {
        constexpr double maxTargetDifference{ 500 };
        constexpr double maxScoreDifference{ 300 };

        constexpr std::size_t unpenalizedAttemptCount{ 2 };
        constexpr double attemptPenalty{ 0.15 };
        constexpr double minAttemptFactor{ 0.4 };
        constexpr double masteryOutcome{ 0.85 };
        constexpr double masteryBonusPerAttempt{ 0.1 };
        constexpr double maxMasteryBonus{ 0.3 };

        double computeNormalizedDifference(double a, double b, double maxDifference)
        {
            return std::min(1.0, std::abs(a - b) / maxDifference);
        }
    } // namespace

    std::optional<double> computeLearnerSimilarity(const backend::LearnerAttributes& a, const backend::LearnerAttributes& b)
    {
        if (!a.targetScore || !a.currentScore || !a.listeningScore || !a.readingScore
            || !b.targetScore || !b.currentScore || !b.listeningScore || !b.readingScore)
            return std::nullopt;

        const double averageDifference{ (computeNormalizedDifference(*a.targetScore, *b.targetScore, maxTargetDifference)
                                            + computeNormalizedDifference(*a.listeningScore, *b.listeningScore, maxScoreDifference)
                                            + computeNormalizedDifference(*a.readingScore, *b.readingScore, maxScoreDifference)
                                            + computeNormalizedDifference(*a.currentScore, *b.currentScore, maxScoreDifference))
                                        / 4 };

        return std::clamp(1 - averageDifference, 0.0, 1.0);
    }

    std::vector<Peer> findPeers(const backend::InteractionHistory& history, std::span<const backend::InteractionHistory> peerProfiles, std::size_t peerCount)
    {
        std::vector<Peer> peers;
        for (const backend::InteractionHistory& peerProfile : peerProfiles)
        {
            if (peerProfile.learnerId == history.learnerId)
                continue;

            if (const std::optional<double> similarity{ computeLearnerSimilarity(history.attributes, peerProfile.attributes) })
                peers.push_back(Peer{ .history = &peerProfile, .similarity = *similarity });
        }

        std::sort(std::begin(peers), std::end(peers), [](const Peer& a, const Peer& b) {
            if (a.similarity != b.similarity)
                return a.similarity > b.similarity;
            return a.history->learnerId < b.history->learnerId;
        });

        if (peers.size() > peerCount)
            peers.resize(peerCount);

        TRS_LOG(RECOMMENDATION, DEBUG, "Found " << peers.size() << " peers for learner '" << history.learnerId << "' among " << peerProfiles.size() << " profiles");
        return peers;
    }

    double computeEffectiveOutcome(const backend::Interaction& interaction)
    {
        const double outcome{ interaction.outcome.value_or(0) };
        if (interaction.itemType == backend::ItemType::Lecture)
            return outcome;

        double attemptFactor{ 1 };
        if (interaction.attemptCount > unpenalizedAttemptCount)
        {
            const double extraAttempts{ static_cast<double>(interaction.attemptCount - unpenalizedAttemptCount) };
            attemptFactor = std::max(minAttemptFactor, 1 - attemptPenalty * extraAttempts);
            if (outcome > masteryOutcome)
                attemptFactor += std::min(maxMasteryBonus, masteryBonusPerAttempt * extraAttempts);
        }

        return outcome * attemptFactor;
    }

    ScoreMap scoreFromPeers(std::span<const Peer> peers, std::span<const backend::Item> candidates)
    {
        struct Accumulator
        {
            double total{};
            std::size_t count{};
        };
        std::unordered_map<backend::ItemKey, Accumulator> accumulators;
        for (const backend::Item& candidate : candidates)
            accumulators.try_emplace(backend::getItemKey(candidate));

        for (const Peer& peer : peers)
        {
            for (const backend::Interaction& interaction : peer.history->interactions)
            {
                auto it{ accumulators.find(backend::getItemKey(interaction)) };
                if (it == std::end(accumulators))
                    continue;

                it->second.total += peer.similarity * computeEffectiveOutcome(interaction);
                it->second.count += 1;
            }
        }

        ScoreMap res;
        for (const auto& [itemKey, accumulator] : accumulators)
        {
            if (accumulator.count > 0)
                res.emplace(itemKey, accumulator.total / static_cast<double>(accumulator.count));
        }

        return res;
    }
} // namespace trs::recommendation
