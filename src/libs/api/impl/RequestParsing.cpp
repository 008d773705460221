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

#include "RequestParsing.hpp"

#include "core/String.hpp"

#include "Exception.hpp"

namespace trs::api
{
    namespace
    {
        // A parameter given several times is rejected
        std::optional<std::string> getSingleParameter(const Wt::Http::ParameterMap& parameters, const std::string& name)
        {
            auto it{ parameters.find(name) };
            if (it == std::cend(parameters) || it->second.empty())
                return std::nullopt;

            if (it->second.size() != 1)
                throw BadParameterException{ name, "expected a single value" };

            return it->second.front();
        }

        std::size_t parseLimit(const Wt::Http::ParameterMap& parameters)
        {
            const std::optional<std::string> str{ getSingleParameter(parameters, "limit") };
            if (!str)
                return RecommendationRequest::defaultLimit;

            const std::optional<long> limit{ core::stringUtils::readAs<long>(*str) };
            if (!limit || *limit < 1 || *limit > static_cast<long>(RecommendationRequest::maxLimit))
                throw BadParameterException{ "limit", "expected an integer in [1, " + std::to_string(RecommendationRequest::maxLimit) + "]" };

            return static_cast<std::size_t>(*limit);
        }

        std::optional<backend::ItemType> parseItemType(const Wt::Http::ParameterMap& parameters)
        {
            const std::optional<std::string> str{ getSingleParameter(parameters, "type") };
            if (!str)
                return std::nullopt;

            const std::optional<backend::ItemType> itemType{ backend::itemTypeFromString(*str) };
            if (!itemType)
                throw BadParameterException{ "type", "expected 'test' or 'lecture'" };

            return itemType;
        }

        std::optional<bool> parseIncludeCompleted(const Wt::Http::ParameterMap& parameters)
        {
            const std::optional<std::string> str{ getSingleParameter(parameters, "includeCompleted") };
            if (!str)
                return std::nullopt;

            const std::optional<bool> includeCompleted{ core::stringUtils::readAs<bool>(*str) };
            if (!includeCompleted)
                throw BadParameterException{ "includeCompleted", "expected 'true' or 'false'" };

            return includeCompleted;
        }
    } // namespace

    std::vector<std::string_view> splitPath(std::string_view path)
    {
        std::vector<std::string_view> res;
        for (std::string_view segment : core::stringUtils::splitString(path, '/'))
        {
            if (!segment.empty())
                res.push_back(segment);
        }

        return res;
    }

    RouteMatch matchRoute(std::string_view path)
    {
        const std::vector<std::string_view> segments{ splitPath(path) };

        if (segments.empty())
            return RouteMatch{ .route = Route::Root, .userId = {} };
        if (segments.size() == 1 && segments[0] == "health")
            return RouteMatch{ .route = Route::Health, .userId = {} };
        if (segments.size() == 2 && segments[0] == "recommendations")
            return RouteMatch{ .route = Route::Recommendations, .userId = std::string{ segments[1] } };

        throw NotFoundException{};
    }

    RecommendationRequest parseRecommendationRequest(std::string_view userId, const Wt::Http::ParameterMap& parameters)
    {
        const std::string_view trimmedUserId{ core::stringUtils::stringTrim(userId) };
        if (trimmedUserId.empty())
            throw BadParameterException{ "userId", "must not be empty" };

        return RecommendationRequest{
            .learnerId = backend::LearnerId{ std::string{ trimmedUserId } },
            .limit = parseLimit(parameters),
            .itemType = parseItemType(parameters),
            .includeCompleted = parseIncludeCompleted(parameters),
        };
    }
} // namespace trs::api
