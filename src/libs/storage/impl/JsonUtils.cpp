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

#include "JsonUtils.hpp"

#include <cmath>

#include "storage/Exception.hpp"

namespace mcol::storage::json
{
    namespace
    {
        [[noreturn]] void throwTypeMismatch(const std::string& key, std::string_view expected)
        {
            throw ValidationException{ "Field '" + key + "' must be " + std::string{ expected } };
        }

        const Wt::Json::Array emptyArray;
    } // namespace

    std::string getString(const Wt::Json::Object& object, const std::string& key, std::string_view def)
    {
        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            return std::string{ def };
        case Wt::Json::Type::String:
            return static_cast<std::string>(value);
        case Wt::Json::Type::Number:
            return std::to_string(std::llround(static_cast<double>(value)));
        default:
            throwTypeMismatch(key, "a string");
        }
    }

    long long getInteger(const Wt::Json::Object& object, const std::string& key, long long def)
    {
        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            return def;
        case Wt::Json::Type::Number:
            return std::llround(static_cast<double>(value));
        case Wt::Json::Type::String:
            try
            {
                return std::stoll(static_cast<std::string>(value));
            }
            catch (const std::logic_error&)
            {
                throwTypeMismatch(key, "an integer");
            }
        default:
            throwTypeMismatch(key, "an integer");
        }
    }

    bool getBool(const Wt::Json::Object& object, const std::string& key, bool def)
    {
        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            return def;
        case Wt::Json::Type::Bool:
            return static_cast<bool>(value);
        default:
            throwTypeMismatch(key, "a boolean");
        }
    }

    std::vector<std::string> getStrings(const Wt::Json::Object& object, const std::string& key)
    {
        std::vector<std::string> res;

        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            break;
        case Wt::Json::Type::String:
            // single value instead of a list
            res.push_back(static_cast<std::string>(value));
            break;
        case Wt::Json::Type::Array:
            for (const Wt::Json::Value& entry : static_cast<const Wt::Json::Array&>(value))
            {
                if (entry.type() != Wt::Json::Type::String)
                    throwTypeMismatch(key, "a list of strings");
                res.push_back(static_cast<std::string>(entry));
            }
            break;
        default:
            throwTypeMismatch(key, "a list of strings");
        }

        return res;
    }

    const Wt::Json::Array& getArray(const Wt::Json::Object& object, const std::string& key)
    {
        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            return emptyArray;
        case Wt::Json::Type::Array:
            return value;
        default:
            throwTypeMismatch(key, "a list");
        }
    }

    const Wt::Json::Object* getObject(const Wt::Json::Object& object, const std::string& key)
    {
        const Wt::Json::Value& value{ object.get(key) };
        switch (value.type())
        {
        case Wt::Json::Type::Null:
            return nullptr;
        case Wt::Json::Type::Object:
            return &static_cast<const Wt::Json::Object&>(value);
        default:
            throwTypeMismatch(key, "an object");
        }
    }

    Wt::Json::Value toValue(std::string_view str)
    {
        return Wt::Json::Value{ std::string{ str } };
    }

    Wt::Json::Value toValue(std::size_t value)
    {
        return Wt::Json::Value{ static_cast<long long>(value) };
    }

    Wt::Json::Value toValue(const std::vector<std::string>& strings)
    {
        Wt::Json::Array array;
        for (const std::string& str : strings)
            array.push_back(toValue(str));

        return Wt::Json::Value{ std::move(array) };
    }
} // namespace mcol::storage::json
