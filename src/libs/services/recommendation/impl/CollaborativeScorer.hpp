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

#pragma once

#include <optional>
#include <span>
#include <vector>

#include "backend/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace trs::recommendation
{
    struct Peer
    {
        const backend::InteractionHistory* history;
        double similarity; // in [0, 1]
    };

    // Based on the target and average scores, not set if any of them is unknown
    std::optional<double> computeLearnerSimilarity(const backend::LearnerAttributes& a, const backend::LearnerAttributes& b);

    // Most similar first, the learner itself is excluded
    std::vector<Peer> findPeers(const backend::InteractionHistory& history, std::span<const backend::InteractionHistory> peerProfiles, std::size_t peerCount);

    // How well a learner did with an item: repeated attempts weigh less unless the item is mastered
    double computeEffectiveOutcome(const backend::Interaction& interaction);

    // Similarity weighted average of the peers effective outcomes
    // Candidates no peer interacted with get no score
    ScoreMap scoreFromPeers(std::span<const Peer> peers, std::span<const backend::Item> candidates);
} // namespace trs::recommendation
