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

#include "storage/CollectionIndex.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/ILogger.hpp"
#include "storage/BandDocument.hpp"
#include "storage/Exception.hpp"

#include "JsonUtils.hpp"

namespace mcol::storage
{
    namespace
    {
        std::size_t getCount(const Wt::Json::Object& object, const std::string& key, std::size_t def = 0)
        {
            return static_cast<std::size_t>(std::max(0LL, json::getInteger(object, key, static_cast<long long>(def))));
        }

        CollectionIndexEntry parseIndexEntry(const Wt::Json::Object& object)
        {
            const std::string name{ json::getString(object, "name") };
            if (name.empty())
                throw ValidationException{ "Index entry without 'name'" };

            const std::size_t albumsCount{ getCount(object, "albums_count") };
            const std::size_t missingAlbumsCount{ getCount(object, "missing_albums_count") };
            // older indexes only store the total
            const std::size_t localAlbumsCount{ object.contains("local_albums_count")
                                                    ? getCount(object, "local_albums_count")
                                                    : (albumsCount > missingAlbumsCount ? albumsCount - missingAlbumsCount : 0) };

            CollectionIndexEntry entry{ name, albumsCount, localAlbumsCount, missingAlbumsCount };
            entry.setFolderPath(json::getString(object, "folder_path", name));
            entry.setHasMetadata(json::getBool(object, "has_metadata", false));
            entry.setHasAnalysis(json::getBool(object, "has_analysis", false));
            entry.setLastUpdated(json::getString(object, "last_updated"));

            return entry;
        }

        Wt::Json::Object entryToJson(const CollectionIndexEntry& entry)
        {
            Wt::Json::Object object;

            object["name"] = json::toValue(entry.getName());
            object["albums_count"] = json::toValue(entry.getAlbumsCount());
            object["local_albums_count"] = json::toValue(entry.getLocalAlbumsCount());
            object["missing_albums_count"] = json::toValue(entry.getMissingAlbumsCount());
            object["folder_path"] = json::toValue(entry.getFolderPath());
            object["has_metadata"] = Wt::Json::Value{ entry.hasMetadata() };
            object["has_analysis"] = Wt::Json::Value{ entry.hasAnalysis() };
            object["last_updated"] = json::toValue(entry.getLastUpdated());

            return object;
        }

        Wt::Json::Object statsToJson(const CollectionStats& stats)
        {
            Wt::Json::Object object;

            object["total_bands"] = json::toValue(stats.totalBands);
            object["total_albums"] = json::toValue(stats.totalAlbums);
            object["total_local_albums"] = json::toValue(stats.totalLocalAlbums);
            object["total_missing_albums"] = json::toValue(stats.totalMissingAlbums);
            object["bands_with_metadata"] = json::toValue(stats.bandsWithMetadata);
            object["bands_with_analysis"] = json::toValue(stats.bandsWithAnalysis);
            object["completion_percentage"] = Wt::Json::Value{ stats.completionPercentage };
            object["avg_albums_per_band"] = Wt::Json::Value{ stats.averageAlbumsPerBand };

            return object;
        }
    } // namespace

    CollectionIndexEntry::CollectionIndexEntry(std::string_view name, std::size_t albumsCount, std::size_t localAlbumsCount, std::size_t missingAlbumsCount)
        : _name{ name }
        , _albumsCount{ localAlbumsCount + missingAlbumsCount }
        , _localAlbumsCount{ localAlbumsCount }
        , _missingAlbumsCount{ missingAlbumsCount }
    {
        if (albumsCount != _albumsCount)
            MCOL_LOG(STORAGE, DEBUG, "Band '" << _name << "': corrected albums count from " << albumsCount << " to " << _albumsCount);
    }

    void CollectionIndexEntry::setAlbumCounts(std::size_t localAlbumsCount, std::size_t missingAlbumsCount)
    {
        _localAlbumsCount = localAlbumsCount;
        _missingAlbumsCount = missingAlbumsCount;
        _albumsCount = localAlbumsCount + missingAlbumsCount;
    }

    CollectionIndexEntry createIndexEntry(const BandDocument& document, std::string_view bandFolder)
    {
        CollectionIndexEntry entry{ bandFolder, document.getAlbumsCount(), document.albums.size(), document.albumsMissing.size() };
        entry.setFolderPath(bandFolder);
        entry.setHasMetadata(true);
        entry.setHasAnalysis(document.analysis.has_value());
        entry.setLastUpdated(document.lastUpdated);

        return entry;
    }

    const CollectionIndexEntry* CollectionIndex::find(std::string_view bandName) const
    {
        auto it{ std::find_if(std::cbegin(_entries), std::cend(_entries), [&](const CollectionIndexEntry& entry) { return entry.getName() == bandName; }) };
        return it != std::cend(_entries) ? &(*it) : nullptr;
    }

    void CollectionIndex::upsert(const CollectionIndexEntry& entry)
    {
        auto it{ std::find_if(std::begin(_entries), std::end(_entries), [&](const CollectionIndexEntry& existing) { return existing.getName() == entry.getName(); }) };
        if (it != std::end(_entries))
            *it = entry;
        else
            _entries.push_back(entry);
    }

    bool CollectionIndex::remove(std::string_view bandName)
    {
        return std::erase_if(_entries, [&](const CollectionIndexEntry& entry) { return entry.getName() == bandName; }) > 0;
    }

    CollectionStats CollectionIndex::getStats() const
    {
        CollectionStats stats;

        stats.totalBands = _entries.size();
        for (const CollectionIndexEntry& entry : _entries)
        {
            stats.totalAlbums += entry.getAlbumsCount();
            stats.totalLocalAlbums += entry.getLocalAlbumsCount();
            stats.totalMissingAlbums += entry.getMissingAlbumsCount();
            if (entry.hasMetadata())
                stats.bandsWithMetadata++;
            if (entry.hasAnalysis())
                stats.bandsWithAnalysis++;
        }

        if (stats.totalAlbums > 0)
            stats.completionPercentage = static_cast<double>(stats.totalLocalAlbums) * 100.0 / static_cast<double>(stats.totalAlbums);
        if (stats.totalBands > 0)
            stats.averageAlbumsPerBand = static_cast<double>(stats.totalAlbums) / static_cast<double>(stats.totalBands);

        return stats;
    }

    CollectionIndex parseCollectionIndex(const Wt::Json::Object& object)
    {
        try
        {
            CollectionIndex index;

            for (const Wt::Json::Value& value : json::getArray(object, "bands"))
            {
                if (value.type() != Wt::Json::Type::Object)
                    throw ValidationException{ "Index entries must be objects" };

                index.upsert(parseIndexEntry(value));
            }

            index.setLastScan(json::getString(object, "last_scan"));
            index.setMetadataVersion(json::getString(object, "metadata_version", "1.0"));

            return index;
        }
        catch (const Wt::WException& e)
        {
            throw ValidationException{ std::string{ "Invalid collection index: " } + e.what() };
        }
    }

    Wt::Json::Object toJson(const CollectionIndex& index)
    {
        Wt::Json::Object object;

        object["stats"] = Wt::Json::Value{ statsToJson(index.getStats()) };

        Wt::Json::Array bands;
        for (const CollectionIndexEntry& entry : index.getEntries())
            bands.push_back(Wt::Json::Value{ entryToJson(entry) });
        object["bands"] = Wt::Json::Value{ std::move(bands) };

        object["last_scan"] = json::toValue(index.getLastScan());
        object["metadata_version"] = json::toValue(index.getMetadataVersion());

        return object;
    }
} // namespace mcol::storage
