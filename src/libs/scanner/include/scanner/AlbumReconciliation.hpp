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
#include <span>

#include "storage/BandDocument.hpp"

namespace mcol::scanner
{
    struct DiscoveredAlbum;

    struct ReconciliationStats
    {
        std::size_t added{};        // never seen before
        std::size_t refreshed{};    // already local
        std::size_t recovered{};    // back from the missing list
        std::size_t markedMissing{}; // local albums no longer on disk

        bool hasChanges() const { return added + recovered + markedMissing > 0; }
    };

    // Make the document reflect the albums found on disk
    // Albums are matched by identity key first, then by name only
    // Matched albums keep their year, genres and duration, track count and folder path are refreshed
    ReconciliationStats reconcileAlbums(storage::BandDocument& document, std::span<const DiscoveredAlbum> discoveredAlbums);
} // namespace mcol::scanner
