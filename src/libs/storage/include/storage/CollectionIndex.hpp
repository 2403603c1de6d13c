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
#include <string_view>
#include <vector>

#include <Wt/Json/Object.h>

namespace mcol::storage
{
    struct BandDocument;

    class CollectionIndexEntry
    {
    public:
        // albumsCount is corrected to localAlbumsCount + missingAlbumsCount if they disagree
        CollectionIndexEntry(std::string_view name, std::size_t albumsCount, std::size_t localAlbumsCount, std::size_t missingAlbumsCount);

        const std::string& getName() const { return _name; }
        std::size_t getAlbumsCount() const { return _albumsCount; }
        std::size_t getLocalAlbumsCount() const { return _localAlbumsCount; }
        std::size_t getMissingAlbumsCount() const { return _missingAlbumsCount; }
        const std::string& getFolderPath() const { return _folderPath; }
        bool hasMetadata() const { return _hasMetadata; }
        bool hasAnalysis() const { return _hasAnalysis; }
        const std::string& getLastUpdated() const { return _lastUpdated; }

        void setAlbumCounts(std::size_t localAlbumsCount, std::size_t missingAlbumsCount);
        void setFolderPath(std::string_view folderPath) { _folderPath = folderPath; }
        void setHasMetadata(bool hasMetadata) { _hasMetadata = hasMetadata; }
        void setHasAnalysis(bool hasAnalysis) { _hasAnalysis = hasAnalysis; }
        void setLastUpdated(std::string_view lastUpdated) { _lastUpdated = lastUpdated; }

        bool operator==(const CollectionIndexEntry&) const = default;

    private:
        std::string _name;
        std::size_t _albumsCount{};
        std::size_t _localAlbumsCount{};
        std::size_t _missingAlbumsCount{};
        std::string _folderPath;
        bool _hasMetadata{};
        bool _hasAnalysis{};
        std::string _lastUpdated;
    };

    // Entry describing the document of the band stored in bandFolder (relative to the music root)
    CollectionIndexEntry createIndexEntry(const BandDocument& document, std::string_view bandFolder);

    struct CollectionStats
    {
        std::size_t totalBands{};
        std::size_t totalAlbums{};
        std::size_t totalLocalAlbums{};
        std::size_t totalMissingAlbums{};
        std::size_t bandsWithMetadata{};
        std::size_t bandsWithAnalysis{};
        double completionPercentage{}; // local albums over known albums
        double averageAlbumsPerBand{};
    };

    class CollectionIndex
    {
    public:
        static constexpr std::string_view currentMetadataVersion{ "2.0" };

        const std::vector<CollectionIndexEntry>& getEntries() const { return _entries; }
        const CollectionIndexEntry* find(std::string_view bandName) const;

        // Replace the entry with the same name, or add it
        void upsert(const CollectionIndexEntry& entry);
        bool remove(std::string_view bandName);

        // Always computed from the entries
        CollectionStats getStats() const;

        const std::string& getLastScan() const { return _lastScan; }
        void setLastScan(std::string_view lastScan) { _lastScan = lastScan; }
        const std::string& getMetadataVersion() const { return _metadataVersion; }
        void setMetadataVersion(std::string_view version) { _metadataVersion = version; }

    private:
        std::vector<CollectionIndexEntry> _entries;
        std::string _lastScan;
        std::string _metadataVersion{ currentMetadataVersion };
    };

    // Stored stats are ignored, throws ValidationException
    CollectionIndex parseCollectionIndex(const Wt::Json::Object& object);
    Wt::Json::Object toJson(const CollectionIndex& index);
} // namespace mcol::storage
