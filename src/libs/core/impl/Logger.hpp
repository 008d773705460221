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

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

#include "core/ILogger.hpp"

namespace trs::core::logging
{
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

        // one mutex per underlying stream, shared by all the severities writing to it
        struct Sink
        {
            std::ostream* stream{};
            std::mutex* mutex{};
        };

        const Severity _minSeverity;
        std::unique_ptr<std::ofstream> _logFileStream;
        std::mutex _stdoutMutex;
        std::mutex _stderrMutex;
        std::mutex _fileMutex;
        std::array<Sink, 5> _sinks;
    };
} // namespace trs::core::logging
