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

#include <stdexcept>
#include <string>
#include <system_error>

namespace trs::core
{
    class TrsException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class SystemException : public TrsException
    {
    public:
        SystemException(std::error_code ec, const std::string& errorMsg)
            : TrsException{ errorMsg + ": " + ec.message() }
            , _ec{ ec }
        {
        }

        std::error_code getErrorCode() const { return _ec; }

    private:
        std::error_code _ec;
    };
} // namespace trs::core
