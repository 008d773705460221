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

#include "Client.hpp"

namespace trs::core::http
{
    std::unique_ptr<IClient> createClient(boost::asio::io_context& ioContext, const ClientSettings& settings)
    {
        return std::make_unique<Client>(ioContext, settings);
    }

    void Client::sendGETRequest(ClientRequestParameters&& parameters)
    {
        _sendQueue.sendRequest(std::make_unique<ClientRequest>(std::move(parameters)));
    }
} // namespace trs::core::http
