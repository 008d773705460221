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

#include "core/IOContextRunner.hpp"

#include "core/ILogger.hpp"

#define LOG(sev, message) TRS_LOG(UTILS, sev, "[IOContext " << _name << "] " << message)

namespace trs::core
{
    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _ioContext{ ioContext }
        , _name{ name }
        , _work{ boost::asio::make_work_guard(ioContext) }
    {
        LOG(INFO, "Starting with " << threadCount << " thread(s)");

        _threads.reserve(threadCount);
        for (std::size_t i{}; i < threadCount; ++i)
            _threads.emplace_back([this, i] { run(i); });
    }

    IOContextRunner::~IOContextRunner()
    {
        stop();

        for (std::thread& thread : _threads)
            thread.join();

        LOG(INFO, "Stopped!");
    }

    void IOContextRunner::run(std::size_t threadIndex)
    {
        while (true)
        {
            try
            {
                _ioContext.run();
                break;
            }
            catch (const std::exception& e)
            {
                LOG(ERROR, "Thread " << threadIndex << ": exception caught in handler: " << e.what());
            }
        }

        LOG(DEBUG, "Thread " << threadIndex << " exited");
    }

    void IOContextRunner::stop()
    {
        LOG(DEBUG, "Stopping...");
        _work.reset();
        _ioContext.stop();
    }
} // namespace trs::core
