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

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "core/http/ClientRequestParameters.hpp"

namespace trs::core::http
{
    struct ClientSettings
    {
        std::string baseUrl;
        std::chrono::seconds timeout{ 5 };
        std::size_t maxRetryCount{ 2 };                   // transport errors only
        std::chrono::seconds retryWaitDuration{ 1 };
    };

    // Requests are queued and sent one at a time, callbacks are called from the io context
    class IClient
    {
    public:
        virtual ~IClient() = default;

        virtual void sendGETRequest(ClientRequestParameters&& request) = 0;
    };

    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, const ClientSettings& settings);
} // namespace trs::core::http
