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
#include <exception>
#include <string>

namespace trs::api
{
    struct ErrorResponse
    {
        int status;
        std::string detail;
    };

    // Logs the error raised while handling a request and maps it to the answer to send
    // Exceptions that are not expected get a 500 with a generic detail
    ErrorResponse handleRequestException(std::exception_ptr exception, std::size_t requestId);
} // namespace trs::api
