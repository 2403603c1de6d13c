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

#include "scanner/StructureDetector.hpp"

#include <algorithm>
#include <map>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "scanner/AlbumDiscovery.hpp"

namespace mcol::scanner
{
    namespace
    {
        StructureConsistency getConsistency(unsigned consistencyScore)
        {
            if (consistencyScore >= 90)
                return StructureConsistency::Consistent;
            if (consistencyScore >= 70)
                return StructureConsistency::MostlyConsistent;

            return StructureConsistency::Inconsistent;
        }
    } // namespace

    std::string_view structureTypeToString(StructureType type)
    {
        switch (type)
        {
        case StructureType::Default:
            return "default";
        case StructureType::Enhanced:
            return "enhanced";
        case StructureType::Mixed:
            return "mixed";
        case StructureType::Legacy:
            return "legacy";
        case StructureType::Unknown:
            return "unknown";
        }
        return "";
    }

    std::optional<StructureType> structureTypeFromString(std::string_view str)
    {
        for (StructureType type : { StructureType::Default, StructureType::Enhanced, StructureType::Mixed, StructureType::Legacy, StructureType::Unknown })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, structureTypeToString(type)))
                return type;
        }

        return std::nullopt;
    }

    std::string_view structureConsistencyToString(StructureConsistency consistency)
    {
        switch (consistency)
        {
        case StructureConsistency::Consistent:
            return "consistent";
        case StructureConsistency::MostlyConsistent:
            return "mostly_consistent";
        case StructureConsistency::Inconsistent:
            return "inconsistent";
        case StructureConsistency::Unknown:
            return "unknown";
        }
        return "";
    }

    FolderStructure detectFolderStructure(const AlbumDiscovery& discovery)
    {
        FolderStructure structure;
        structure.typeFoldersFound = discovery.typeFoldersFound;
        structure.albumsAnalyzed = discovery.albums.size();

        if (discovery.albums.empty())
            return structure;

        std::map<FolderNamePattern, std::size_t> patternCounts;
        std::size_t directAlbums{};
        for (const DiscoveredAlbum& album : discovery.albums)
        {
            patternCounts[album.parsed.pattern]++;
            if (album.parsed.hasYear())
                structure.albumsWithYear++;
            if (album.isInTypeFolder())
                structure.albumsInTypeFolders++;
            else
                directAlbums++;
        }

        if (structure.albumsInTypeFolders > 0)
            structure.type = directAlbums == 0 ? StructureType::Enhanced : StructureType::Mixed;
        else if (structure.albumsWithYear > 0)
            structure.type = StructureType::Default;
        else
            structure.type = StructureType::Legacy;

        const auto mostCommon{ std::max_element(std::cbegin(patternCounts), std::cend(patternCounts), [](const auto& a, const auto& b) { return a.second < b.second; }) };
        structure.consistencyScore = static_cast<unsigned>(mostCommon->second * 100 / discovery.albums.size());
        structure.consistency = getConsistency(structure.consistencyScore);

        return structure;
    }

    FolderStructure detectFolderStructure(const std::filesystem::path& bandFolder)
    {
        try
        {
            return detectFolderStructure(discoverAlbums(bandFolder));
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            MCOL_LOG(SCANNER, ERROR, "Cannot detect folder structure of '" << bandFolder.string() << "': " << e.what());
            return FolderStructure{};
        }
    }

    storage::FolderStructureInfo toFolderStructureInfo(const FolderStructure& structure)
    {
        storage::FolderStructureInfo info;

        info.structureType = structureTypeToString(structure.type);
        info.consistency = structureConsistencyToString(structure.consistency);
        info.albumsAnalyzed = structure.albumsAnalyzed;
        info.typeFoldersFound = structure.typeFoldersFound;
        info.lastDetected = core::stringUtils::toISO8601String(Wt::WDateTime::currentDateTime());

        return info;
    }
} // namespace mcol::scanner
