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

#include "FeatureEncoder.hpp"

#include <algorithm>
#include <set>

#include "backend/Exception.hpp"

namespace trs::backend
{
    FeatureEncoder::FeatureEncoder(std::vector<std::string> topicVocabulary, double difficultyScale)
        : _topicVocabulary{ std::move(topicVocabulary) }
        , _difficultyScale{ difficultyScale }
    {
        if (_difficultyScale <= 0)
            throw Exception{ "Difficulty scale must be strictly positive" };
    }

    std::vector<std::string> FeatureEncoder::computeVocabulary(const Catalog& catalog)
    {
        std::set<std::string> topics;
        for (const Item& item : catalog)
            topics.insert(std::cbegin(item.topics), std::cend(item.topics));

        return std::vector<std::string>(std::cbegin(topics), std::cend(topics));
    }

    void FeatureEncoder::encode(Catalog& catalog) const
    {
        const std::vector<std::string> vocabulary{ _topicVocabulary.empty() ? computeVocabulary(catalog) : _topicVocabulary };

        for (Item& item : catalog)
        {
            if (item.features.empty())
                item.features = encode(item, vocabulary);
        }
    }

    std::vector<double> FeatureEncoder::encode(const Item& item, const std::vector<std::string>& vocabulary) const
    {
        std::vector<double> features(vocabulary.size() + 1, 0.0);

        for (std::size_t i{}; i < vocabulary.size(); ++i)
        {
            if (std::find(std::cbegin(item.topics), std::cend(item.topics), vocabulary[i]) != std::cend(item.topics))
                features[i] = 1.0;
        }

        if (item.difficulty)
            features.back() = std::clamp(*item.difficulty / _difficultyScale, 0.0, 1.0);

        return features;
    }
} // namespace trs::backend
