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
#include <string>

#include <libconfig.h++>

#include "core/IConfig.hpp"

namespace mcol::core
{
    class Config final : public IConfig
    {
    public:
        Config(const std::filesystem::path& p);
        ~Config() override = default;
        Config(const Config&) = delete;
        Config& operator=(const Config&) = delete;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override;
        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override;
        unsigned long getULong(std::string_view setting, unsigned long def) override;
        long getLong(std::string_view setting, long def) override;
        bool getBool(std::string_view setting, bool def) override;

        // nullopt if the setting is missing or cannot be converted to T
        template<typename T>
        std::optional<T> lookup(std::string_view setting) const;

        const std::filesystem::path _path;
        libconfig::Config _config;
    };
} // namespace mcol::core
