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

#include "backend/IDataFetcher.hpp"
#include "core/http/IClient.hpp"

#include "FeatureEncoder.hpp"

namespace trs::backend
{
    class BackendDataFetcher final : public IDataFetcher
    {
    public:
        BackendDataFetcher(std::unique_ptr<core::http::IClient> client, const BackendSettings& settings);
        ~BackendDataFetcher() override;
        BackendDataFetcher(const BackendDataFetcher&) = delete;
        BackendDataFetcher& operator=(const BackendDataFetcher&) = delete;

    private:
        InteractionHistory fetchInteractionHistory(const LearnerId& learnerId) override;
        Catalog fetchCatalog(std::optional<ItemType> itemType) override;
        std::vector<InteractionHistory> fetchPeerProfiles() override;

        enum class NotFoundPolicy
        {
            Fail,
            ReturnNothing,
        };
        // Blocks until the request is done, returns the response body
        std::optional<std::string> sendGETRequest(const std::string& endpoint, NotFoundPolicy notFoundPolicy);

        const std::unique_ptr<core::http::IClient> _client;
        const std::string _internalApiKey;
        const FeatureEncoder _featureEncoder;
    };
} // namespace trs::backend
