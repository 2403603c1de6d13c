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

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcol::storage::layout
{
    inline constexpr std::string_view indexFileName{ ".collection_index.json" };
    inline constexpr std::string_view bandDocumentFileName{ ".band_metadata.json" };
    inline constexpr std::string_view migrationBackupPrefix{ ".migration_backup_" };

    std::filesystem::path getIndexPath(const std::filesystem::path& musicRoot);
    std::filesystem::path getBandFolder(const std::filesystem::path& musicRoot, std::string_view bandName);
    std::filesystem::path getBandDocumentPath(const std::filesystem::path& musicRoot, std::string_view bandName);

    // Folder names that are never considered as bands or albums (compared in lower case)
    bool isIgnoredFolderName(std::string_view folderName);

    // First level directories of the music root, hidden and ignored folders excluded, sorted by name
    // Throws std::filesystem::filesystem_error if the root cannot be listed
    std::vector<std::string> listBandFolders(const std::filesystem::path& musicRoot);
} // namespace mcol::storage::layout
