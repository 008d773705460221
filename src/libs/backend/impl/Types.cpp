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

#include "backend/Types.hpp"

#include <initializer_list>
#include <ostream>

#include "core/String.hpp"

namespace trs::backend
{
    std::string_view toString(ItemType type)
    {
        switch (type)
        {
        case ItemType::Test:
            return "test";
        case ItemType::Lecture:
            return "lecture";
        }

        return "";
    }

    std::optional<ItemType> itemTypeFromString(std::string_view str)
    {
        for (const ItemType type : { ItemType::Test, ItemType::Lecture })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(type)))
                return type;
        }

        return std::nullopt;
    }

    std::ostream& operator<<(std::ostream& os, const ItemKey& key)
    {
        return os << toString(key.type) << " '" << key.id << "'";
    }
} // namespace trs::backend
