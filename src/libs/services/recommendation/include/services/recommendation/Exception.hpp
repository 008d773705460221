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
#include <string>

#include "backend/Types.hpp"
#include "core/Exception.hpp"

namespace trs::recommendation
{
    class Exception : public core::TrsException
    {
    public:
        using core::TrsException::TrsException;
    };

    // Nothing to recommend from
    class InsufficientCatalogException : public Exception
    {
    public:
        using Exception::Exception;
    };

    // An item feature vector does not match the learner profile dimension
    class InvalidFeatureDimensionException : public Exception
    {
    public:
        InvalidFeatureDimensionException(const backend::ItemId& itemId, std::size_t expectedDimension, std::size_t actualDimension)
            : Exception{ "Invalid feature dimension for item '" + itemId.value() + "': expected " + std::to_string(expectedDimension) + ", got " + std::to_string(actualDimension) }
            , _itemId{ itemId }
            , _expectedDimension{ expectedDimension }
            , _actualDimension{ actualDimension }
        {
        }

        const backend::ItemId& getItemId() const { return _itemId; }
        std::size_t getExpectedDimension() const { return _expectedDimension; }
        std::size_t getActualDimension() const { return _actualDimension; }

    private:
        backend::ItemId _itemId;
        std::size_t _expectedDimension;
        std::size_t _actualDimension;
    };

    class InvalidSettingsException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace trs::recommendation
