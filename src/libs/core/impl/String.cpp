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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <Wt/WDateTime.h>
#include <Wt/WString.h>

namespace trs::core::stringUtils
{
    namespace
    {
        constexpr std::pair<char, std::string_view> jsonEscapeChars[]{
            { '\\', "\\\\" },
            { '"', "\\\"" },
            { '\b', "\\b" },
            { '\f', "\\f" },
            { '\n', "\\n" },
            { '\r', "\\r" },
            { '\t', "\\t" },
        };

        std::string_view findEscapeSequence(char c)
        {
            auto it{ std::find_if(std::cbegin(jsonEscapeChars), std::cend(jsonEscapeChars), [c](const auto& entry) { return entry.first == c; }) };
            if (it == std::cend(jsonEscapeChars))
                return {};

            return it->second;
        }
    } // namespace

    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        if (str == "1" || stringCaseInsensitiveEqual(str, "true"))
            return true;
        else if (str == "0" || stringCaseInsensitiveEqual(str, "false"))
            return false;

        return std::nullopt;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t separatorPos{ str.find(separator, currentPos) };
            if (separatorPos == std::string_view::npos)
                break;

            res.push_back(str.substr(currentPos, separatorPos - currentPos));
            currentPos = separatorPos + 1;
        }

        res.push_back(str.substr(currentPos));
        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin == std::string_view::npos)
            return {};

        const auto strEnd{ str.find_last_not_of(whitespaces) };
        return str.substr(strBegin, strEnd - strBegin + 1);
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        return std::equal(std::cbegin(strA), std::cend(strA), std::cbegin(strB), std::cend(strB),
            [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    }

    void writeJsonEscapedString(std::ostream& os, std::string_view str)
    {
        for (const char c : str)
        {
            const std::string_view sequence{ findEscapeSequence(c) };
            if (sequence.empty())
                os << c;
            else
                os << sequence;
        }
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromISO8601String(std::string_view dateTime)
    {
        // assume UTC
        if (!dateTime.empty() && dateTime.back() == 'Z')
            dateTime.remove_suffix(1);

        const Wt::WString str{ std::string{ dateTime } };
        const bool hasMilliseconds{ dateTime.find('.') != std::string_view::npos };

        return Wt::WDateTime::fromString(str, hasMilliseconds ? "yyyy-MM-ddThh:mm:ss.zzz" : "yyyy-MM-ddThh:mm:ss");
    }
} // namespace trs::core::stringUtils
