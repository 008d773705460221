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

#include "RecommendationResource.hpp"

#include <atomic>
#include <exception>

#include "api/RecommendationResource.hpp"
#include "core/ILogger.hpp"
#include "services/recommendation/IRecommendationService.hpp"

#include "ErrorResponse.hpp"
#include "ResponseWriter.hpp"

#define LOG(sev, message) TRS_LOG(API, sev, "[Resource] " << message)

namespace trs::api
{
    std::unique_ptr<Wt::WResource> createRecommendationResource(recommendation::IRecommendationService& recommendationService)
    {
        return std::make_unique<RecommendationResource>(recommendationService);
    }

    namespace
    {
        void sendError(Wt::Http::Response& response, int status, std::string_view detail)
        {
            response.setStatus(status);
            writeError(response.out(), detail);
        }
    } // namespace

    RecommendationResource::RecommendationResource(recommendation::IRecommendationService& recommendationService)
        : _recommendationService{ recommendationService }
    {
    }

    RecommendationResource::~RecommendationResource()
    {
        beingDeleted();
    }

    void RecommendationResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        static std::atomic<std::size_t> curRequestId{};

        const std::size_t requestId{ curRequestId++ };
        const std::string requestPath{ request.path() + request.pathInfo() };

        LOG(DEBUG, "Handling request " << requestId << " '" << request.method() << " " << requestPath << "'");

        response.setMimeType("application/json");

        try
        {
            if (request.method() != "GET")
            {
                sendError(response, 405, "Method Not Allowed");
                return;
            }

            const RouteMatch routeMatch{ matchRoute(requestPath) };
            switch (routeMatch.route)
            {
            case Route::Root:
                writeServiceInfo(response.out());
                break;

            case Route::Health:
                writeHealth(response.out());
                break;

            case Route::Recommendations:
                handleRecommendationRequest(routeMatch.userId, request, response);
                break;
            }

            LOG(DEBUG, "Request " << requestId << " '" << requestPath << "' handled!");
        }
        catch (const std::exception&)
        {
            const ErrorResponse errorResponse{ handleRequestException(std::current_exception(), requestId) };
            sendError(response, errorResponse.status, errorResponse.detail);
        }
    }

    void RecommendationResource::handleRecommendationRequest(const std::string& userId, const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        const RecommendationRequest recommendationRequest{ parseRecommendationRequest(userId, request.getParameterMap()) };

        LOG(INFO, "Processing recommendation request for learner '" << recommendationRequest.learnerId << "', limit = " << recommendationRequest.limit
                                                                      << ", type = " << (recommendationRequest.itemType ? backend::toString(*recommendationRequest.itemType) : "any"));

        RecommendationResponse recommendationResponse{ .learnerId = recommendationRequest.learnerId, .tests = {}, .lectures = {} };
        if (recommendationRequest.itemType)
        {
            recommendation::RecommendationList recommendations{ _recommendationService.recommend(recommendationRequest.learnerId, recommendationRequest.limit, recommendation::RecommendOptions{ .includeCompleted = recommendationRequest.includeCompleted, .itemTypeFilter = recommendationRequest.itemType }) };
            if (*recommendationRequest.itemType == backend::ItemType::Test)
                recommendationResponse.tests = std::move(recommendations);
            else
                recommendationResponse.lectures = std::move(recommendations);
        }
        else
        {
            recommendation::RecommendationsPerItemType recommendations{ _recommendationService.recommendPerItemType(recommendationRequest.learnerId, recommendationRequest.limit, recommendationRequest.includeCompleted) };
            recommendationResponse.tests = std::move(recommendations[backend::ItemType::Test]);
            recommendationResponse.lectures = std::move(recommendations[backend::ItemType::Lecture]);
        }

        writeRecommendations(response.out(), recommendationResponse);
    }
} // namespace trs::api
