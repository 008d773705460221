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

#include "core/http/IClient.hpp"

#include "SendQueue.hpp"

namespace trs::core::http
{
    class Client final : public IClient
    {
    public:
        Client(boost::asio::io_context& ioContext, const ClientSettings& settings)
            : _sendQueue{ ioContext, settings }
        {
        }

    private:
        void sendGETRequest(ClientRequestParameters&& request) override;

        SendQueue _sendQueue;
    };
} // namespace trs::core::http
