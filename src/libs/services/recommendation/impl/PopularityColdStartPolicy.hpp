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

#include "services/recommendation/IColdStartPolicy.hpp"

namespace trs::recommendation
{
    // Blend of the normalized popularity and of the match between the item
    // difficulty and the learner level
    class PopularityColdStartPolicy final : public IColdStartPolicy
    {
    public:
        explicit PopularityColdStartPolicy(const ColdStartSettings& settings);

        // Difficulty the learner should aim at, if known
        std::optional<double> computeReferenceDifficulty(const backend::LearnerAttributes& attributes) const;

    private:
        ScoreMap score(const backend::LearnerAttributes& attributes, std::span<const backend::Item> candidates) const override;

        double computeAttributeMatch(const backend::Item& item, double referenceDifficulty) const;

        const ColdStartSettings _settings;
    };
} // namespace trs::recommendation
