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

#include <string>
#include <vector>

#include "backend/Types.hpp"

namespace trs::backend
{
    // Encodes items as a one-hot topic vector followed by a normalized difficulty
    class FeatureEncoder
    {
    public:
        FeatureEncoder(std::vector<std::string> topicVocabulary, double difficultyScale);

        // Only items with an empty feature vector are encoded
        void encode(Catalog& catalog) const;

        static std::vector<std::string> computeVocabulary(const Catalog& catalog);

    private:
        std::vector<double> encode(const Item& item, const std::vector<std::string>& vocabulary) const;

        const std::vector<std::string> _topicVocabulary;
        const double _difficultyScale;
    };
} // namespace trs::backend
