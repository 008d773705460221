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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend/Types.hpp"

namespace trs::core::http
{
    class IClient;
}

namespace trs::backend
{
    // Blocking access to the learner data and the item catalog
    // Calls must not be made from the io context that drives the underlying client
    class IDataFetcher
    {
    public:
        virtual ~IDataFetcher() = default;

        // An unknown learner gets an empty history
        // throws UpstreamUnavailableException, UpstreamAuthException
        virtual InteractionHistory fetchInteractionHistory(const LearnerId& learnerId) = 0;

        // throws UpstreamUnavailableException, UpstreamAuthException
        virtual Catalog fetchCatalog(std::optional<ItemType> itemType) = 0;

        // Profiles of all the learners, used to find learners alike
        // throws UpstreamUnavailableException, UpstreamAuthException
        virtual std::vector<InteractionHistory> fetchPeerProfiles() = 0;
    };

    struct BackendSettings
    {
        std::string internalApiKey;
        std::vector<std::string> topicVocabulary; // empty means sorted union of the catalog topics
        double difficultyScale{ 990 };
    };

    // client must be set up with the backend base URL
    std::unique_ptr<IDataFetcher> createBackendDataFetcher(std::unique_ptr<core::http::IClient> client, const BackendSettings& settings);
} // namespace trs::backend
