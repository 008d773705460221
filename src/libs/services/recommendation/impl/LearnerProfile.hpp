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

#include <span>
#include <vector>

#include "backend/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"

namespace trs::recommendation
{
    // Weighted average of the feature vectors of the interacted items
    // Returns an empty vector if no interaction can be used or if the result is all-zero
    // throws InvalidFeatureDimensionException
    std::vector<double> buildLearnerProfile(const backend::InteractionHistory& history, const backend::Catalog& catalog, const SimilaritySettings& settings);

    double computeInteractionWeight(const backend::Interaction& interaction, const SimilaritySettings& settings);

    // Clamped to [0, 1], 0 if any of the vectors has a zero norm
    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b);
} // namespace trs::recommendation
