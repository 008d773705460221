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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <array>
#include <cassert>
#include <iostream>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace trs::core::logging
{
    namespace
    {
        // ordered from most to least severe
        constexpr std::array<Severity, 5> allSeverities{ Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG };

        bool isErrorSeverity(Severity severity)
        {
            return severity == Severity::FATAL || severity == Severity::ERROR || severity == Severity::WARNING;
        }
    } // namespace

    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::API:
            return "API";
        case Module::BACKEND:
            return "BACKEND";
        case Module::CONFIG:
            return "CONFIG";
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::RECOMMENDATION:
            return "RECOMMENDATION";
        case Module::UTILS:
            return "UTILS";
        case Module::WT:
            return "WT";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> severityFromString(std::string_view str)
    {
        for (const Severity severity : allSeverities)
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw SystemException{ ec, "Cannot open log file '" + logFilePath.string() + "' for writing" };
            }
        }

        for (const Severity severity : allSeverities)
        {
            Sink& sink{ _sinks[static_cast<std::size_t>(severity)] };
            if (_logFileStream)
                sink = Sink{ _logFileStream.get(), &_fileMutex };
            else if (isErrorSeverity(severity))
                sink = Sink{ &std::cerr, &_stderrMutex };
            else
                sink = Sink{ &std::cout, &_stdoutMutex };
        }
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // severities are declared from most to least severe
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void Logger::processLog(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const Sink& sink{ _sinks[static_cast<std::size_t>(severity)] };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ *sink.mutex };
        *sink.stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace trs::core::logging
