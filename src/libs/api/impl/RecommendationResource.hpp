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

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/WResource.h>

#include "backend/Types.hpp"
#include "services/recommendation/Types.hpp"

#include "RequestParsing.hpp"

namespace trs::recommendation
{
    class IRecommendationService;
}

namespace trs::api
{
    class RecommendationResource final : public Wt::WResource
    {
    public:
        RecommendationResource(recommendation::IRecommendationService& recommendationService);
        ~RecommendationResource() override;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;
        void handleRecommendationRequest(const std::string& userId, const Wt::Http::Request& request, Wt::Http::Response& response);

        recommendation::IRecommendationService& _recommendationService;
    };
} // namespace trs::api
