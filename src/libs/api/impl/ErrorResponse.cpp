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

#include "ErrorResponse.hpp"

#include "backend/Exception.hpp"
#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"

#include "Exception.hpp"

#define LOG(sev, message) TRS_LOG(API, sev, "[Resource] " << message)

namespace trs::api
{
    namespace
    {
        constexpr std::string_view internalServerError{ "Internal Server Error" };
    } // namespace

    ErrorResponse handleRequestException(std::exception_ptr exception, std::size_t requestId)
    {
        try
        {
            std::rethrow_exception(exception);
        }
        catch (const NotFoundException& e)
        {
            LOG(DEBUG, "Request " << requestId << ": unhandled path");
            return ErrorResponse{ .status = 404, .detail = e.what() };
        }
        catch (const BadParameterException& e)
        {
            LOG(INFO, "Request " << requestId << ": bad parameter: " << e.what());
            return ErrorResponse{ .status = 400, .detail = e.what() };
        }
        catch (const recommendation::InsufficientCatalogException& e)
        {
            LOG(WARNING, "Request " << requestId << ": insufficient catalog: " << e.what());
            return ErrorResponse{ .status = 404, .detail = e.what() };
        }
        catch (const backend::UpstreamAuthException& e)
        {
            LOG(ERROR, "Request " << requestId << ": upstream authentication failed: " << e.what());
            return ErrorResponse{ .status = 502, .detail = e.what() };
        }
        catch (const backend::UpstreamUnavailableException& e)
        {
            LOG(ERROR, "Request " << requestId << ": upstream unavailable: " << e.what());
            return ErrorResponse{ .status = 503, .detail = e.what() };
        }
        catch (const recommendation::InvalidFeatureDimensionException& e)
        {
            LOG(ERROR, "Request " << requestId << ": invalid catalog data: " << e.what());
            return ErrorResponse{ .status = 500, .detail = e.what() };
        }
        catch (const core::TrsException& e)
        {
            LOG(ERROR, "Request " << requestId << ": internal error: " << e.what());
            return ErrorResponse{ .status = 500, .detail = std::string{ internalServerError } };
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Request " << requestId << ": unexpected error: " << e.what());
            return ErrorResponse{ .status = 500, .detail = std::string{ internalServerError } };
        }
    }
} // namespace trs::api
