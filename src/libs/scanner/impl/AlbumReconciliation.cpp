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

#include "scanner/AlbumReconciliation.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "core/ILogger.hpp"
#include "scanner/AlbumDiscovery.hpp"

namespace mcol::scanner
{
    namespace
    {
        struct KnownAlbum
        {
            storage::AlbumRecord record;
            bool wasMissing{};
            bool matched{};
        };

        KnownAlbum* findKnownAlbumByKey(std::vector<KnownAlbum>& knownAlbums, const storage::AlbumRecord& album)
        {
            const storage::AlbumKey key{ album.getKey() };
            auto it{ std::find_if(std::begin(knownAlbums), std::end(knownAlbums), [&](const KnownAlbum& known) { return !known.matched && known.record.getKey() == key; }) };
            return it != std::end(knownAlbums) ? &(*it) : nullptr;
        }

        // folder renamed or metadata edited by hand: same name, no conflicting year
        KnownAlbum* findKnownAlbumByName(std::vector<KnownAlbum>& knownAlbums, const storage::AlbumRecord& album)
        {
            const storage::AlbumKey key{ album.getKey() };
            auto it{ std::find_if(std::begin(knownAlbums), std::end(knownAlbums), [&](const KnownAlbum& known) {
                if (known.matched)
                    return false;

                const storage::AlbumKey knownKey{ known.record.getKey() };
                if (knownKey.name != key.name)
                    return false;
                return knownKey.year.empty() || key.year.empty() || knownKey.year == key.year;
            }) };
            return it != std::end(knownAlbums) ? &(*it) : nullptr;
        }

        void refreshAlbum(storage::AlbumRecord& album, const DiscoveredAlbum& discoveredAlbum, const storage::AlbumRecord& discoveredRecord)
        {
            album.trackCount = discoveredRecord.trackCount;
            album.folderPath = discoveredRecord.folderPath;
            if (album.year.empty())
                album.year = discoveredRecord.year;
            if (album.edition.empty())
                album.edition = discoveredRecord.edition;
            if (discoveredAlbum.isInTypeFolder())
                album.type = discoveredRecord.type;
        }
    } // namespace

    ReconciliationStats reconcileAlbums(storage::BandDocument& document, std::span<const DiscoveredAlbum> discoveredAlbums)
    {
        ReconciliationStats stats;

        std::vector<KnownAlbum> knownAlbums;
        for (storage::AlbumRecord& album : document.albums)
            knownAlbums.push_back(KnownAlbum{ .record = std::move(album), .wasMissing = false, .matched = false });
        for (storage::AlbumRecord& album : document.albumsMissing)
            knownAlbums.push_back(KnownAlbum{ .record = std::move(album), .wasMissing = true, .matched = false });

        std::vector<storage::AlbumRecord> discoveredRecords;
        discoveredRecords.reserve(discoveredAlbums.size());
        for (const DiscoveredAlbum& discoveredAlbum : discoveredAlbums)
            discoveredRecords.push_back(discoveredAlbum.toAlbumRecord());

        // exact keys first, so that a name-only match never takes a record owned by another folder
        std::vector<KnownAlbum*> matches(discoveredRecords.size(), nullptr);
        for (std::size_t i{}; i < discoveredRecords.size(); ++i)
        {
            if (KnownAlbum * knownAlbum{ findKnownAlbumByKey(knownAlbums, discoveredRecords[i]) })
            {
                knownAlbum->matched = true;
                matches[i] = knownAlbum;
            }
        }
        for (std::size_t i{}; i < discoveredRecords.size(); ++i)
        {
            if (matches[i])
                continue;

            if (KnownAlbum * knownAlbum{ findKnownAlbumByName(knownAlbums, discoveredRecords[i]) })
            {
                knownAlbum->matched = true;
                matches[i] = knownAlbum;
            }
        }

        std::vector<storage::AlbumRecord> localAlbums;
        for (std::size_t i{}; i < discoveredRecords.size(); ++i)
        {
            const DiscoveredAlbum& discoveredAlbum{ discoveredAlbums[i] };
            const storage::AlbumRecord& discoveredRecord{ discoveredRecords[i] };

            if (KnownAlbum * knownAlbum{ matches[i] })
            {
                refreshAlbum(knownAlbum->record, discoveredAlbum, discoveredRecord);
                localAlbums.push_back(knownAlbum->record);

                if (knownAlbum->wasMissing)
                {
                    MCOL_LOG(SCANNER, DEBUG, "Band '" << document.bandName << "': album '" << discoveredRecord.albumName << "' found on disk");
                    stats.recovered++;
                }
                else
                    stats.refreshed++;
            }
            else
            {
                MCOL_LOG(SCANNER, DEBUG, "Band '" << document.bandName << "': new album '" << discoveredRecord.albumName << "'");
                localAlbums.push_back(discoveredRecord);
                stats.added++;
            }
        }

        std::vector<storage::AlbumRecord> missingAlbums;
        for (KnownAlbum& knownAlbum : knownAlbums)
        {
            if (knownAlbum.matched)
                continue;

            if (!knownAlbum.wasMissing)
            {
                MCOL_LOG(SCANNER, DEBUG, "Band '" << document.bandName << "': album '" << knownAlbum.record.albumName << "' no longer on disk");
                knownAlbum.record.trackCount = 0;
                knownAlbum.record.folderPath.clear();
                stats.markedMissing++;
            }
            missingAlbums.push_back(std::move(knownAlbum.record));
        }

        document.albums = std::move(localAlbums);
        document.albumsMissing = std::move(missingAlbums);
        storage::normalizeAlbums(document);

        return stats;
    }
} // namespace mcol::scanner
