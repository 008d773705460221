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
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <Wt/Http/Message.h>

namespace trs::core::http
{
    struct ClientRequestParameters
    {
        std::string relativeUrl;                            // relative to baseUrl used by the client
        std::vector<Wt::Http::Message::Header> headers;
        std::size_t responseBufferSize{ 10 * 1024 * 1024 }; // bodies exceeding this size are reported as failures

        // called with the fully buffered response, for 2xx statuses only
        using OnSuccessFunc = std::function<void(const Wt::Http::Message& msg)>;
        OnSuccessFunc onSuccessFunc;

        // httpStatus is not set in case of transport failure (bad url, timeout, connection refused after all retries, ...)
        using OnFailureFunc = std::function<void(std::optional<int> httpStatus)>;
        OnFailureFunc onFailureFunc;

        using OnAbortFunc = std::function<void()>;
        OnAbortFunc onAbortFunc;
    };
} // namespace trs::core::http
