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

#include "SendQueue.hpp"

#include <cassert>
#include <latch>
#include <thread>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

#define LOG(sev, message) TRS_LOG(HTTP, sev, "[Http SendQueue] - " << message)

namespace trs::core::http
{
    namespace
    {
        bool isSuccessStatus(int status)
        {
            return status >= 200 && status < 300;
        }
    } // namespace

    SendQueue::SendQueue(boost::asio::io_context& ioContext, const ClientSettings& settings)
        : _maxRetryCount{ settings.maxRetryCount }
        , _retryWaitDuration{ settings.retryWaitDuration }
        , _ioContext{ ioContext }
        , _baseUrl{ settings.baseUrl }
        , _client{ _ioContext }
    {
        _client.setFollowRedirect(true);
        _client.setTimeout(settings.timeout);

        _client.done().connect([this](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
            boost::asio::post(boost::asio::bind_executor(_strand, [this, ec, msg] {
                onClientDone(ec, msg);
            }));
        });
    }

    SendQueue::~SendQueue()
    {
        abortAllRequests();
    }

    void SendQueue::abortAllRequests()
    {
        LOG(DEBUG, "Aborting all requests...");

        _abortAllRequests = true;

        std::latch abortLatch{ 1 };

        boost::asio::post(boost::asio::bind_executor(_strand, [this, &abortLatch] {
            while (!_sendQueue.empty())
            {
                std::unique_ptr<ClientRequest> request{ std::move(_sendQueue.front()) };
                _sendQueue.pop_front();
                if (request->getParameters().onAbortFunc)
                    request->getParameters().onAbortFunc();
            }

            if (_state == State::Throttled)
                _throttleTimer.cancel();
            else if (_state == State::Sending)
                _client.abort();

            abortLatch.count_down();
        }));

        abortLatch.wait();

        while (_state != State::Idle)
            std::this_thread::yield();

        _abortAllRequests = false;

        LOG(DEBUG, "All requests aborted!");
    }

    void SendQueue::sendRequest(std::unique_ptr<ClientRequest> request)
    {
        boost::asio::post(_strand, [this, request = std::move(request)]() mutable {
            if (_abortAllRequests)
            {
                LOG(DEBUG, "Not posting request because abortAllRequests() in progress");
                if (request->getParameters().onAbortFunc)
                    request->getParameters().onAbortFunc();

                return;
            }

            _sendQueue.emplace_back(std::move(request));

            if (_state == State::Idle)
                sendNextQueuedRequest();
        });
    }

    void SendQueue::sendNextQueuedRequest()
    {
        assert(_strand.running_in_this_thread());
        assert(!_currentRequest);

        while (!_sendQueue.empty())
        {
            std::unique_ptr<ClientRequest> request{ std::move(_sendQueue.front()) };
            _sendQueue.pop_front();

            if (!sendRequest(*request))
            {
                if (request->getParameters().onFailureFunc)
                    request->getParameters().onFailureFunc(std::nullopt);
                continue;
            }

            setState(State::Sending);
            _currentRequest = std::move(request);
            return;
        }

        setState(State::Idle);
    }

    bool SendQueue::sendRequest(const ClientRequest& request)
    {
        assert(_strand.running_in_this_thread());

        const std::string url{ _baseUrl + request.getParameters().relativeUrl };
        LOG(DEBUG, "Sending GET request to url '" << url << "'");

        _client.setMaximumResponseSize(request.getParameters().responseBufferSize);

        const bool res{ _client.get(url, request.getParameters().headers) };
        if (!res)
            LOG(ERROR, "Send failed, bad url or unsupported scheme?");

        return res;
    }

    void SendQueue::onClientDone(Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg)
    {
        assert(_currentRequest);

        LOG(DEBUG, "Client done. ec = " << ec.category().name() << " - " << ec.message() << " (" << ec.value() << "), status = " << msg.status());

        if (_abortAllRequests || ec == boost::asio::error::operation_aborted)
            onClientAborted(std::move(_currentRequest));
        else if (ec && (ec != boost::asio::ssl::error::stream_truncated))
            onClientDoneError(std::move(_currentRequest), ec);
        else
            onClientDoneSuccess(std::move(_currentRequest), msg);
    }

    void SendQueue::onClientAborted(std::unique_ptr<ClientRequest> request)
    {
        assert(_strand.running_in_this_thread());

        if (request->getParameters().onAbortFunc)
            request->getParameters().onAbortFunc();

        sendNextQueuedRequest();
    }

    void SendQueue::onClientDoneError(std::unique_ptr<ClientRequest> request, Wt::AsioWrapper::error_code ec)
    {
        assert(_strand.running_in_this_thread());

        if (request->retryCount++ < _maxRetryCount)
        {
            LOG(WARNING, "Retry " << request->retryCount << "/" << _maxRetryCount << ", client error: '" << ec.message() << "'");

            // may be a network error, try again later
            _sendQueue.emplace_front(std::move(request));
            throttle(_retryWaitDuration);
        }
        else
        {
            LOG(ERROR, "Too many retries, giving up request: '" << ec.message() << "'");
            if (request->getParameters().onFailureFunc)
                request->getParameters().onFailureFunc(std::nullopt);

            sendNextQueuedRequest();
        }
    }

    void SendQueue::onClientDoneSuccess(std::unique_ptr<ClientRequest> request, const Wt::Http::Message& msg)
    {
        assert(_strand.running_in_this_thread());

        const ClientRequestParameters& requestParameters{ request->getParameters() };
        if (isSuccessStatus(msg.status()))
        {
            if (requestParameters.onSuccessFunc)
                requestParameters.onSuccessFunc(msg);
        }
        else
        {
            LOG(ERROR, "Send error, status = " << msg.status() << ", body = '" << msg.body() << "'");
            if (requestParameters.onFailureFunc)
                requestParameters.onFailureFunc(msg.status());
        }

        sendNextQueuedRequest();
    }

    void SendQueue::throttle(std::chrono::seconds duration)
    {
        LOG(DEBUG, "Throttling for " << duration.count() << " seconds");

        _throttleTimer.expires_after(duration);
        _throttleTimer.async_wait(boost::asio::bind_executor(_strand, [this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                LOG(DEBUG, "Throttle aborted");
            else if (ec)
                throw TrsException{ "Throttle timer failure: " + std::string{ ec.message() } };

            setState(State::Idle);
            if (!ec)
                sendNextQueuedRequest();
        }));

        setState(State::Throttled);
    }

    void SendQueue::setState(State state)
    {
        if (_state != state)
        {
            LOG(DEBUG, "Changing state to " << (state == State::Idle ? "Idle" : state == State::Sending ? "Sending"
                                                                                                          : "Throttled"));
            _state = state;
        }
    }
} // namespace trs::core::http
