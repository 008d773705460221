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

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend/Types.hpp"

namespace trs::recommendation
{
    enum class Provenance
    {
        Similarity,
        ColdStart,
        Blended,
    };
    std::string_view toString(Provenance provenance);

    // Ordered by item id then type, hence deterministic iteration
    using ScoreMap = std::map<backend::ItemKey, double>;

    struct CandidateScore
    {
        backend::ItemKey itemKey;
        double score{};
        Provenance provenance{ Provenance::Similarity };
    };

    // What the learner already did with a recommended item
    struct ItemProgress
    {
        std::size_t attemptCount{};
        std::optional<double> averageScore;      // tests, TOEIC scale
        std::optional<double> completionPercent; // lectures
    };

    struct Recommendation
    {
        backend::ItemId itemId;
        backend::ItemType itemType{ backend::ItemType::Test };
        std::string name;
        double score{};
        Provenance provenance{ Provenance::Similarity };
        std::string explanation;
        std::optional<ItemProgress> progress; // not set if never interacted with
    };

    // Most recommended first
    using RecommendationList = std::vector<Recommendation>;
    using RecommendationsPerItemType = std::map<backend::ItemType, RecommendationList>;

    struct RecommendOptions
    {
        std::optional<bool> includeCompleted; // not set: use the service default
        std::optional<backend::ItemType> itemTypeFilter;
    };
} // namespace trs::recommendation
