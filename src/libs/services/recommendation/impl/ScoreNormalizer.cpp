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

#include "ScoreNormalizer.hpp"

#include <algorithm>
#include <cassert>

namespace trs::recommendation
{
    ScoreNormalizer::MinMax ScoreNormalizer::computeMinMax(const ScoreMap& scores)
    {
        assert(!scores.empty());

        const auto [itMin, itMax]{ std::minmax_element(std::cbegin(scores), std::cend(scores), [](const auto& a, const auto& b) { return a.second < b.second; }) };
        return MinMax{ .min = itMin->second, .max = itMax->second };
    }

    void ScoreNormalizer::normalize(ScoreMap& scores) const
    {
        if (scores.empty())
            return;

        switch (_normalization)
        {
        case Normalization::None:
            break;

        case Normalization::MinMax:
            {
                const MinMax minMax{ computeMinMax(scores) };
                const double range{ minMax.max - minMax.min };

                for (auto& [itemId, score] : scores)
                    score = (range > 0) ? (score - minMax.min) / range : 1.0;
            }
            break;
        }
    }
} // namespace trs::recommendation
