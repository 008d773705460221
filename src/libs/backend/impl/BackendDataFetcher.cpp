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

#include "BackendDataFetcher.hpp"

#include <algorithm>
#include <future>
#include <iterator>

#include <Wt/Utils.h>

#include "backend/Exception.hpp"
#include "core/ILogger.hpp"

#include "ResponseParser.hpp"

#define LOG(sev, message) TRS_LOG(BACKEND, sev, "[Backend] " << message)

namespace trs::backend
{
    namespace
    {
        constexpr std::string_view internalApiPrefix{ "/api/v1/internal" };
        constexpr int httpStatusUnauthorized{ 401 };
        constexpr int httpStatusForbidden{ 403 };
        constexpr int httpStatusNotFound{ 404 };
    } // namespace

    std::unique_ptr<IDataFetcher> createBackendDataFetcher(std::unique_ptr<core::http::IClient> client, const BackendSettings& settings)
    {
        return std::make_unique<BackendDataFetcher>(std::move(client), settings);
    }

    BackendDataFetcher::BackendDataFetcher(std::unique_ptr<core::http::IClient> client, const BackendSettings& settings)
        : _client{ std::move(client) }
        , _internalApiKey{ settings.internalApiKey }
        , _featureEncoder{ settings.topicVocabulary, settings.difficultyScale }
    {
        if (_internalApiKey.empty())
            LOG(WARNING, "No internal API key set, backend requests are likely to be rejected");

        LOG(INFO, "Started!");
    }

    BackendDataFetcher::~BackendDataFetcher()
    {
        LOG(INFO, "Stopped!");
    }

    InteractionHistory BackendDataFetcher::fetchInteractionHistory(const LearnerId& learnerId)
    {
        LOG(DEBUG, "Fetching profile of learner '" << learnerId << "'");

        const std::optional<std::string> body{ sendGETRequest("/users/" + Wt::Utils::urlEncode(learnerId.value()) + "/profile", NotFoundPolicy::ReturnNothing) };
        if (!body)
        {
            LOG(DEBUG, "Learner '" << learnerId << "' not found, using empty history");
            return InteractionHistory{ .learnerId = learnerId, .attributes = {}, .interactions = {} };
        }

        InteractionHistory history{ responseParser::parseLearnerProfile(learnerId, *body) };
        LOG(DEBUG, "Learner '" << learnerId << "' has " << history.interactions.size() << " interactions");

        return history;
    }

    Catalog BackendDataFetcher::fetchCatalog(std::optional<ItemType> itemType)
    {
        Catalog catalog;

        if (!itemType || *itemType == ItemType::Test)
        {
            LOG(DEBUG, "Fetching test candidates");
            Catalog tests{ responseParser::parseTestCandidates(*sendGETRequest("/tests/candidates", NotFoundPolicy::Fail)) };
            std::move(std::begin(tests), std::end(tests), std::back_inserter(catalog));
        }

        if (!itemType || *itemType == ItemType::Lecture)
        {
            LOG(DEBUG, "Fetching lecture candidates");
            Catalog lectures{ responseParser::parseLectureCandidates(*sendGETRequest("/lectures/candidates", NotFoundPolicy::Fail)) };
            std::move(std::begin(lectures), std::end(lectures), std::back_inserter(catalog));
        }

        _featureEncoder.encode(catalog);

        LOG(DEBUG, "Fetched " << catalog.size() << " catalog items");
        return catalog;
    }

    std::vector<InteractionHistory> BackendDataFetcher::fetchPeerProfiles()
    {
        LOG(DEBUG, "Fetching peer profiles");

        std::vector<InteractionHistory> profiles{ responseParser::parsePeerProfiles(*sendGETRequest("/users/profiles-for-similarity", NotFoundPolicy::Fail)) };
        LOG(DEBUG, "Fetched " << profiles.size() << " peer profiles");

        return profiles;
    }

    std::optional<std::string> BackendDataFetcher::sendGETRequest(const std::string& endpoint, NotFoundPolicy notFoundPolicy)
    {
        // shared with the callbacks, that may outlive this call on abort
        auto promise{ std::make_shared<std::promise<std::optional<std::string>>>() };
        std::future<std::optional<std::string>> future{ promise->get_future() };

        core::http::ClientRequestParameters request;
        request.relativeUrl = std::string{ internalApiPrefix } + endpoint;
        request.headers = {
            { "Content-Type", "application/json" },
            { "X-Internal-API-Key", _internalApiKey },
        };
        request.onSuccessFunc = [promise](const Wt::Http::Message& msg) {
            promise->set_value(msg.body());
        };
        request.onFailureFunc = [promise, endpoint, notFoundPolicy](std::optional<int> httpStatus) {
            if (!httpStatus)
            {
                LOG(ERROR, "Request to '" << endpoint << "' failed: backend unreachable");
                promise->set_exception(std::make_exception_ptr(UpstreamUnavailableException{ "Backend unreachable" }));
            }
            else if (*httpStatus == httpStatusNotFound && notFoundPolicy == NotFoundPolicy::ReturnNothing)
            {
                promise->set_value(std::nullopt);
            }
            else if (*httpStatus == httpStatusUnauthorized || *httpStatus == httpStatusForbidden)
            {
                LOG(ERROR, "Request to '" << endpoint << "' rejected, status = " << *httpStatus << ": check the internal API key");
                promise->set_exception(std::make_exception_ptr(UpstreamAuthException{ *httpStatus }));
            }
            else
            {
                LOG(ERROR, "Request to '" << endpoint << "' failed, status = " << *httpStatus);
                promise->set_exception(std::make_exception_ptr(UpstreamUnavailableException{ "Backend error, status = " + std::to_string(*httpStatus) }));
            }
        };
        request.onAbortFunc = [promise] {
            promise->set_exception(std::make_exception_ptr(UpstreamUnavailableException{ "Backend request aborted" }));
        };

        _client->sendGETRequest(std::move(request));

        return future.get();
    }
} // namespace trs::backend
