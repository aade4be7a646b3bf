/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace shelf::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r");

    [[nodiscard]] std::string stringToLower(std::string_view str);
    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);

    [[nodiscard]] bool stringStartsWith(std::string_view str, std::string_view prefix);
    [[nodiscard]] bool stringEndsWith(std::string_view str, std::string_view ending);

    // the whole string must be consumed
    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        T res;
        std::istringstream iss{ std::string{ str } };
        iss >> res;
        if (iss.fail() || iss.peek() != std::istringstream::traits_type::eof())
            return std::nullopt;

        return res;
    }

    // UTC, millisecond precision
    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
    [[nodiscard]] Wt::WDateTime fromISO8601String(std::string_view dateTime);
} // namespace shelf::core::stringUtils
