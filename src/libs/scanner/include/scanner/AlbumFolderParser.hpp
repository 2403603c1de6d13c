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
#include <string_view>

#include "storage/BandDocument.hpp"

namespace mcol::scanner
{
    enum class FolderNamePattern
    {
        DefaultWithEdition, // "YYYY - Name (Edition)"
        DefaultNoEdition,   // "YYYY - Name"
        LegacyWithEdition,  // "Name (Edition)"
        LegacyNoEdition,    // "Name"
    };
    std::string_view folderNamePatternToString(FolderNamePattern pattern);

    struct ParsedAlbumFolder
    {
        std::string albumName;
        std::string year;    // empty if none
        std::string edition; // empty if none
        FolderNamePattern pattern{ FolderNamePattern::LegacyNoEdition };

        bool hasYear() const { return !year.empty(); }
        bool operator==(const ParsedAlbumFolder&) const = default;
    };

    // Rules are tried in order, first match wins
    ParsedAlbumFolder parseAlbumFolderName(std::string_view folderName);

    // Four digits, 1950..2030
    bool isValidYear(std::string_view year);
    // Contains an edition keyword ("Deluxe", "Remastered", "Live", ...)
    bool isEditionMarker(std::string_view str);

    // Exact type name or keyword rules (whole words, case insensitive)
    std::optional<storage::AlbumType> inferAlbumTypeFromName(std::string_view folderName);

    // Type folders are named after a type or its plural ("Live", "EPs", "Singles", ...)
    std::optional<storage::AlbumType> getTypeFolderType(std::string_view folderName);
    std::string_view getTypeFolderName(storage::AlbumType type);

    // Type folder membership takes precedence over the folder name
    storage::AlbumType detectAlbumType(std::string_view albumFolderName, std::optional<storage::AlbumType> typeFolderType = std::nullopt);

    // Inverse of parseAlbumFolderName, characters not allowed in file names are removed
    std::string formatAlbumFolderName(std::string_view albumName, std::string_view year, std::string_view edition);
} // namespace mcol::scanner
