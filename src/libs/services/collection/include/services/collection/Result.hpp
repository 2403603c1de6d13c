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

#include <utility>
#include <variant>

#include "services/collection/Error.hpp"

namespace mcol::collection
{
    // Outcome of a collection operation: a value or an error, never both
    template<typename T>
    class Result
    {
    public:
        Result(const T& value)
            : _content{ std::in_place_index<0>, value } {}
        Result(T&& value)
            : _content{ std::in_place_index<0>, std::move(value) } {}
        Result(const Error& error)
            : _content{ std::in_place_index<1>, error } {}
        Result(Error&& error)
            : _content{ std::in_place_index<1>, std::move(error) } {}

        bool isOk() const { return _content.index() == 0; }
        explicit operator bool() const { return isOk(); }

        // Throws std::bad_variant_access if the result holds an error
        const T& value() const& { return std::get<0>(_content); }
        T& value() & { return std::get<0>(_content); }
        T&& value() && { return std::get<0>(std::move(_content)); }

        // Throws std::bad_variant_access if the result holds a value
        const Error& error() const { return std::get<1>(_content); }

    private:
        std::variant<T, Error> _content;
    };
} // namespace mcol::collection
