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

#include <memory>
#include <span>

#include "backend/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace trs::recommendation
{
    class ISimilarityScorer
    {
    public:
        virtual ~ISimilarityScorer() = default;

        // catalog is used to resolve the interacted items, candidates are the items to score
        // An empty result means the history cannot be used
        // throws InvalidFeatureDimensionException
        virtual ScoreMap score(const backend::InteractionHistory& history, const backend::Catalog& catalog, std::span<const backend::Item> candidates, bool includeCompleted) const = 0;
    };

    std::unique_ptr<ISimilarityScorer> createCosineSimilarityScorer(const SimilaritySettings& settings);
} // namespace trs::recommendation
