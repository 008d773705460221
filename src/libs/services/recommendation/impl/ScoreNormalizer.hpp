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

#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace trs::recommendation
{
    class ScoreNormalizer
    {
    public:
        struct MinMax
        {
            double min;
            double max;
        };

        explicit ScoreNormalizer(Normalization normalization)
            : _normalization{ normalization } {}

        // Maps the scores onto [0, 1]
        // MinMax: scores that are all equal are mapped to 1
        void normalize(ScoreMap& scores) const;

        static MinMax computeMinMax(const ScoreMap& scores);

    private:
        const Normalization _normalization;
    };
} // namespace trs::recommendation
