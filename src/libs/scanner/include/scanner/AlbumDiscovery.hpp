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
#include <optional>
#include <string>
#include <vector>

#include "scanner/AlbumFolderParser.hpp"
#include "storage/BandDocument.hpp"

namespace mcol::scanner
{
    struct DiscoveredAlbum
    {
        std::string folderName;
        std::filesystem::path folderPath; // relative to the band folder
        std::optional<storage::AlbumType> typeFolderType; // set if nested in a type folder
        ParsedAlbumFolder parsed;
        storage::AlbumType type{ storage::AlbumType::Album };
        std::size_t trackCount{};

        bool isInTypeFolder() const { return typeFolderType.has_value(); }
        storage::AlbumRecord toAlbumRecord() const;
    };

    struct AlbumDiscovery
    {
        std::vector<DiscoveredAlbum> albums; // sorted by folder path
        std::vector<std::string> typeFoldersFound;
        std::vector<std::string> errors; // folders that could not be explored
    };

    bool isMusicFile(const std::filesystem::path& file);

    // Music files in the folder and its subfolders
    std::size_t countMusicFiles(const std::filesystem::path& folder, std::vector<std::string>& errors);

    // Album folders of a band, either direct children or nested in a type folder
    // Folders without any music file are skipped
    // Throws std::filesystem::filesystem_error if the band folder cannot be listed
    AlbumDiscovery discoverAlbums(const std::filesystem::path& bandFolder);
} // namespace mcol::scanner
