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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "storage/BandDocument.hpp"

namespace mcol::scanner
{
    struct AlbumDiscovery;

    enum class StructureType
    {
        Default,  // "YYYY - Name (Edition)" folders
        Enhanced, // "Type/YYYY - Name (Edition)" folders
        Mixed,    // both of the above
        Legacy,   // "Name" folders, no year
        Unknown,
    };
    std::string_view structureTypeToString(StructureType type);
    std::optional<StructureType> structureTypeFromString(std::string_view str);

    enum class StructureConsistency
    {
        Consistent,       // at least 90% of the albums share the same naming pattern
        MostlyConsistent, // at least 70%
        Inconsistent,
        Unknown,
    };
    std::string_view structureConsistencyToString(StructureConsistency consistency);

    struct FolderStructure
    {
        StructureType type{ StructureType::Unknown };
        StructureConsistency consistency{ StructureConsistency::Unknown };
        unsigned consistencyScore{}; // 0..100
        std::size_t albumsAnalyzed{};
        std::size_t albumsWithYear{};
        std::size_t albumsInTypeFolders{};
        std::vector<std::string> typeFoldersFound;
    };

    FolderStructure detectFolderStructure(const AlbumDiscovery& discovery);

    // Unknown if the band folder cannot be explored
    FolderStructure detectFolderStructure(const std::filesystem::path& bandFolder);

    storage::FolderStructureInfo toFolderStructureInfo(const FolderStructure& structure);
} // namespace mcol::scanner
