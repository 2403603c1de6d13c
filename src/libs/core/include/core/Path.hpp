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
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include <Wt/WDateTime.h>

namespace mcol::core::pathUtils
{
    // Get the last write time since Epoch
    Wt::WDateTime getLastWriteTime(const std::filesystem::path& file);

    // returns false if aborted by user
    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb);

    // Check if file's extension is one of provided extensions (lower case, with the dot)
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions);

    // Remove characters that cannot be part of a file name
    std::string sanitizeFileStem(std::string_view fileStem);

    // Copy the content of source into destination (created if needed)
    // Entries of source for which filter returns false are skipped, along with their children
    // Throws std::filesystem::filesystem_error
    void copyDirectoryContent(const std::filesystem::path& source, const std::filesystem::path& destination, std::function<bool(const std::filesystem::path&)> filter = {});
} // namespace mcol::core::pathUtils
