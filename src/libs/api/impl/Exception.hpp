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

#include <string>

#include "core/Exception.hpp"

namespace trs::api
{
    class Exception : public core::TrsException
    {
    public:
        using core::TrsException::TrsException;
    };

    class BadParameterException : public Exception
    {
    public:
        BadParameterException(const std::string& parameter, const std::string& reason)
            : Exception{ "Parameter '" + parameter + "': " + reason } {}
    };

    class NotFoundException : public Exception
    {
    public:
        NotFoundException()
            : Exception{ "Not Found" } {}
    };
} // namespace trs::api
