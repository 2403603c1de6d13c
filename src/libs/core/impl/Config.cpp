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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace mcol::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
        : _path{ p }
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw McolException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw McolException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }

        MCOL_LOG(CONFIG, INFO, "Using config file '" << p.string() << "'");
    }

    template<typename T>
    std::optional<T> Config::lookup(std::string_view setting) const
    {
        const std::string path{ setting };
        if (!_config.exists(path))
            return std::nullopt;

        try
        {
            return static_cast<T>(_config.lookup(path));
        }
        catch (const libconfig::SettingTypeException&)
        {
            MCOL_LOG(CONFIG, WARNING, "Setting '" << setting << "' in '" << _path.string() << "' has an unexpected type, using default value");
            return std::nullopt;
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const std::optional<const char*> value{ lookup<const char*>(setting) };
        return value ? std::string_view{ *value } : def;
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const std::optional<const char*> value{ lookup<const char*>(setting) };
        return value ? std::filesystem::path{ *value } : def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const std::optional<long long> value{ lookup<long long>(setting) };
        if (!value)
            return def;

        if (*value < 0)
        {
            MCOL_LOG(CONFIG, WARNING, "Setting '" << setting << "' must not be negative, using default value " << def);
            return def;
        }

        return static_cast<unsigned long>(*value);
    }

    long Config::getLong(std::string_view setting, long def)
    {
        return lookup<long long>(setting).value_or(def);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookup<bool>(setting).value_or(def);
    }
} // namespace mcol::core
