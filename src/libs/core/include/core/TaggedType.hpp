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

#include <compare>
#include <functional>
#include <ostream>
#include <utility>

namespace trs::core
{
    template<typename Tag, typename T>
    class TaggedType
    {
    public:
        using underlying_type = T;

        explicit constexpr TaggedType() = default;
        explicit constexpr TaggedType(T value)
            : _value{ std::move(value) } {}

        constexpr const T& value() const { return _value; }

        auto operator<=>(const TaggedType&) const = default;

    private:
        T _value{};
    };

    template<typename Tag, typename T>
    std::ostream& operator<<(std::ostream& os, const TaggedType<Tag, T>& value)
    {
        return os << value.value();
    }
} // namespace trs::core

template<typename Tag, typename T>
struct std::hash<trs::core::TaggedType<Tag, T>>
{
    std::size_t operator()(const trs::core::TaggedType<Tag, T>& value) const
    {
        return std::hash<T>{}(value.value());
    }
};
