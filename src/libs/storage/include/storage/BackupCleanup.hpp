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
#include <filesystem>
#include <string>
#include <vector>

namespace mcol::storage
{
    struct BackupCleanupReport
    {
        std::vector<std::filesystem::path> removedFiles;
        std::size_t keptFiles{};
        std::vector<std::string> errors;
    };

    // Keep the maxBackups most recent dated backups of each document of the music root
    BackupCleanupReport cleanupDatedBackups(const std::filesystem::path& musicRoot, std::size_t maxBackups);
} // namespace mcol::storage
