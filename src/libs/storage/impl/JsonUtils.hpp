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

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

namespace mcol::storage::json
{
    // Lenient getters: absent or null values give the default, numbers are accepted as strings
    // Other type mismatches throw ValidationException
    std::string getString(const Wt::Json::Object& object, const std::string& key, std::string_view def = "");
    long long getInteger(const Wt::Json::Object& object, const std::string& key, long long def = 0);
    bool getBool(const Wt::Json::Object& object, const std::string& key, bool def = false);
    std::vector<std::string> getStrings(const Wt::Json::Object& object, const std::string& key);
    const Wt::Json::Array& getArray(const Wt::Json::Object& object, const std::string& key);
    const Wt::Json::Object* getObject(const Wt::Json::Object& object, const std::string& key);

    Wt::Json::Value toValue(std::string_view str);
    Wt::Json::Value toValue(std::size_t value);
    Wt::Json::Value toValue(const std::vector<std::string>& strings);
} // namespace mcol::storage::json
