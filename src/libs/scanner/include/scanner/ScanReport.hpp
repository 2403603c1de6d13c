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
#include <string>
#include <vector>

#include "scanner/StructureDetector.hpp"

namespace mcol::scanner
{
    struct BandScanSummary
    {
        std::string name;
        std::size_t localAlbums{};
        std::size_t missingAlbums{};
        std::size_t totalAlbums{};
        std::size_t totalTracks{};
        StructureType structureType{ StructureType::Unknown };
        bool hasMetadata{};
    };

    struct ScanReport
    {
        std::size_t bandsDiscovered{};
        std::size_t bandsAdded{};
        std::size_t bandsRemoved{};
        std::size_t bandsUpdated{};
        std::size_t albumsDiscovered{}; // local albums
        std::size_t totalTracks{};
        std::size_t missingAlbums{}; // over the whole collection
        std::vector<std::string> scanErrors;
        std::vector<std::string> changesDetected;
        std::vector<BandScanSummary> bands;
        std::string scanTimestamp;
        bool changesMade{};
    };
} // namespace mcol::scanner
