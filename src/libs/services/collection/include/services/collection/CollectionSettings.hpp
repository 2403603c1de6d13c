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

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace mcol::core
{
    class IConfig;
}

namespace mcol::collection
{
    class ConfigException : public core::McolException
    {
    public:
        using McolException::McolException;
    };

    struct CollectionSettings
    {
        std::filesystem::path musicRootPath{ "/music" };
        std::chrono::days cacheDuration{ 30 };
        std::chrono::milliseconds lockTimeout{ 10'000 };
        std::chrono::seconds lockWaitTimeout{ 30 };
        std::size_t maxRetries{ 3 };
        core::logging::Severity logLevel{ core::logging::defaultMinSeverity };
        std::size_t maxBackups{ 5 }; // dated backups kept per document

        // Missing settings keep their default values
        // Throws ConfigException on invalid values
        static CollectionSettings fromConfig(core::IConfig& config);
    };
} // namespace mcol::collection
