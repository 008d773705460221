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

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/steady_timer.hpp>

#include <Wt/Http/Client.h>

#include "core/http/IClient.hpp"

#include "ClientRequest.hpp"

namespace trs::core::http
{
    class SendQueue
    {
    public:
        SendQueue(boost::asio::io_context& ioContext, const ClientSettings& settings);
        ~SendQueue();

        SendQueue(const SendQueue&) = delete;
        SendQueue& operator=(const SendQueue&) = delete;

        void sendRequest(std::unique_ptr<ClientRequest> request);

    private:
        void abortAllRequests();
        void sendNextQueuedRequest();
        bool sendRequest(const ClientRequest& request);
        void onClientDone(Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg);
        void onClientAborted(std::unique_ptr<ClientRequest> request);
        void onClientDoneError(std::unique_ptr<ClientRequest> request, Wt::AsioWrapper::error_code ec);
        void onClientDoneSuccess(std::unique_ptr<ClientRequest> request, const Wt::Http::Message& msg);
        void throttle(std::chrono::seconds duration);

        enum class State
        {
            Idle,
            Throttled,
            Sending,
        };
        void setState(State state);

        const std::size_t _maxRetryCount;
        const std::chrono::seconds _retryWaitDuration;

        boost::asio::io_context& _ioContext;
        boost::asio::io_context::strand _strand{ _ioContext };
        boost::asio::steady_timer _throttleTimer{ _ioContext };
        std::string _baseUrl;

        std::atomic<bool> _abortAllRequests{};
        std::atomic<State> _state{ State::Idle };
        Wt::Http::Client _client;
        std::deque<std::unique_ptr<ClientRequest>> _sendQueue;
        std::unique_ptr<ClientRequest> _currentRequest;
    };
} // namespace trs::core::http
