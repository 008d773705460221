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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Http/Request.h>

#include "backend/Types.hpp"

namespace trs::api
{
    enum class Route
    {
        Root,
        Health,
        Recommendations,
    };

    struct RouteMatch
    {
        Route route;
        std::string userId; // Recommendations only
    };

    struct RecommendationRequest
    {
        static constexpr std::size_t defaultLimit{ 5 };
        static constexpr std::size_t maxLimit{ 100 };

        backend::LearnerId learnerId;
        std::size_t limit{ defaultLimit };
        std::optional<backend::ItemType> itemType; // both types if not set
        std::optional<bool> includeCompleted;
    };

    // Path segments, empty segments are skipped
    std::vector<std::string_view> splitPath(std::string_view path);

    // throws NotFoundException
    RouteMatch matchRoute(std::string_view path);

    // throws BadParameterException
    RecommendationRequest parseRecommendationRequest(std::string_view userId, const Wt::Http::ParameterMap& parameters);
} // namespace trs::api
