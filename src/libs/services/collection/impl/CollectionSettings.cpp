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

#include "services/collection/CollectionSettings.hpp"

#include <string>

#include "core/IConfig.hpp"

namespace mcol::collection
{
    CollectionSettings CollectionSettings::fromConfig(core::IConfig& config)
    {
        CollectionSettings settings;

        settings.musicRootPath = config.getPath("music-root-path", settings.musicRootPath);
        if (settings.musicRootPath.empty())
            throw ConfigException{ "music-root-path must not be empty" };

        const unsigned long cacheDurationDays{ config.getULong("cache-duration-days", settings.cacheDuration.count()) };
        if (cacheDurationDays == 0)
            throw ConfigException{ "cache-duration-days must be greater than 0" };
        settings.cacheDuration = std::chrono::days{ cacheDurationDays };

        const unsigned long lockTimeoutMs{ config.getULong("lock-timeout-ms", settings.lockTimeout.count()) };
        if (lockTimeoutMs == 0)
            throw ConfigException{ "lock-timeout-ms must be greater than 0" };
        settings.lockTimeout = std::chrono::milliseconds{ lockTimeoutMs };

        settings.lockWaitTimeout = std::chrono::seconds{ config.getULong("lock-wait-seconds", settings.lockWaitTimeout.count()) };
        settings.maxRetries = config.getULong("max-retries", settings.maxRetries);
        settings.maxBackups = config.getULong("max-backups", settings.maxBackups);

        const std::string logLevel{ config.getString("log-level", core::logging::getSeverityName(settings.logLevel)) };
        const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(logLevel) };
        if (!severity)
            throw ConfigException{ "Invalid log-level '" + logLevel + "'" };
        settings.logLevel = *severity;

        MCOL_LOG(CONFIG, DEBUG, "Music root = '" << settings.musicRootPath.string() << "', cache duration = " << settings.cacheDuration.count() << " days, lock timeout = " << settings.lockTimeout.count() << " ms");

        return settings;
    }
} // namespace mcol::collection
