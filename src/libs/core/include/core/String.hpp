/*
 * Copyright (C) 2025 The mcol authors
 *
 * This file is part of mcol.
 *
 * mcol is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * mcol is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with mcol.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace mcol::core::stringUtils
{
    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r\n");

    [[nodiscard]] std::string stringToLower(std::string_view str);
    void stringToLower(std::string& str);

    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);

    // nullopt if str does not start with a T
    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        T res;
        std::istringstream iss{ std::string{ str } };
        iss >> res;
        if (iss.fail())
            return std::nullopt;

        return res;
    }

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
} // namespace mcol::core::stringUtils
