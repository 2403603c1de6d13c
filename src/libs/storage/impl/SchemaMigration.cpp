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

#include "storage/SchemaMigration.hpp"

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>
#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "storage/CollectionIndex.hpp"
#include "storage/Exception.hpp"

#include "JsonUtils.hpp"

namespace mcol::storage
{
    namespace
    {
        std::size_t getVersionRank(std::string_view version)
        {
            const auto it{ std::find(std::cbegin(schemaVersions), std::cend(schemaVersions), version) };
            if (it == std::cend(schemaVersions))
                throw ValidationException{ "Unknown schema version '" + std::string{ version } + "'" };

            return static_cast<std::size_t>(std::distance(std::cbegin(schemaVersions), it));
        }

        Wt::Json::Array* getAlbumArray(Wt::Json::Object& document, const std::string& key)
        {
            auto it{ document.find(key) };
            if (it == document.end() || it->second.type() != Wt::Json::Type::Array)
                return nullptr;

            return &static_cast<Wt::Json::Array&>(it->second);
        }

        template<typename Func>
        void forEachAlbum(Wt::Json::Object& document, Func func)
        {
            for (const char* key : { "albums", "albums_missing" })
            {
                if (Wt::Json::Array * albums{ getAlbumArray(document, key) })
                {
                    for (Wt::Json::Value& album : *albums)
                    {
                        if (album.type() == Wt::Json::Type::Object)
                            func(static_cast<Wt::Json::Object&>(album), std::string_view{ key } == "albums_missing");
                    }
                }
            }
        }

        std::size_t countAlbums(Wt::Json::Object& document)
        {
            std::size_t count{};
            forEachAlbum(document, [&](Wt::Json::Object&, bool) { ++count; });
            return count;
        }

        bool renameField(Wt::Json::Object& object, const std::string& from, const std::string& to)
        {
            auto it{ object.find(from) };
            if (it == object.end())
                return false;

            if (!object.contains(to))
                object[to] = it->second;
            object.erase(from);
            return true;
        }

        bool setIfAbsent(Wt::Json::Object& object, const std::string& key, Wt::Json::Value value)
        {
            if (object.contains(key))
                return false;

            object[key] = std::move(value);
            return true;
        }

        bool setAlbumsCount(Wt::Json::Object& document)
        {
            const std::size_t albumsCount{ countAlbums(document) };
            if (document.type("albums_count") == Wt::Json::Type::Number && json::getInteger(document, "albums_count") == static_cast<long long>(albumsCount))
                return false;

            document["albums_count"] = json::toValue(albumsCount);
            return true;
        }

        // 0.9 -> 1.0: track_count replaces tracks_count, last_updated and albums_count are set
        bool upgradeTo_1_0(Wt::Json::Object& document)
        {
            bool changed{};

            forEachAlbum(document, [&](Wt::Json::Object& album, bool) {
                changed |= renameField(album, "tracks_count", "track_count");
                changed |= setIfAbsent(album, "track_count", Wt::Json::Value{ 0 });
            });

            changed |= setIfAbsent(document, "last_updated", json::toValue(core::stringUtils::toISO8601String(Wt::WDateTime::currentDateTime())));
            changed |= setAlbumsCount(document);

            return changed;
        }

        // 1.0 -> 2.0: absent albums live in albums_missing, per album type/edition/genres/folder_path
        bool upgradeTo_2_0(Wt::Json::Object& document)
        {
            bool changed{};

            changed |= renameField(document, "genre", "genres");
            changed |= renameField(document, "analyze", "analysis");
            if (document.type("albums_missing") != Wt::Json::Type::Array)
            {
                document["albums_missing"] = Wt::Json::Value{ Wt::Json::Type::Array };
                changed = true;
            }

            if (Wt::Json::Array * albums{ getAlbumArray(document, "albums") })
            {
                Wt::Json::Array& albumsMissing{ *getAlbumArray(document, "albums_missing") };

                for (auto it{ albums->begin() }; it != albums->end();)
                {
                    if (it->type() == Wt::Json::Type::Object && json::getBool(*it, "missing", false))
                    {
                        albumsMissing.push_back(std::move(*it));
                        it = albums->erase(it);
                        changed = true;
                    }
                    else
                        ++it;
                }
            }

            forEachAlbum(document, [&](Wt::Json::Object& album, bool isMissing) {
                if (album.contains("missing"))
                {
                    album.erase("missing");
                    changed = true;
                }

                changed |= renameField(album, "genre", "genres");
                changed |= setIfAbsent(album, "genres", Wt::Json::Value{ Wt::Json::Type::Array });
                changed |= setIfAbsent(album, "type", json::toValue("Album"));
                changed |= setIfAbsent(album, "edition", json::toValue(""));
                changed |= setIfAbsent(album, "folder_path", json::toValue(isMissing ? "" : json::getString(album, "album_name")));
            });

            changed |= setAlbumsCount(document);

            return changed;
        }
    } // namespace

    std::string getSchemaVersion(const Wt::Json::Object& document, std::string_view versionField)
    {
        return json::getString(document, std::string{ versionField }, schemaVersions[0]);
    }

    void checkSchemaVersion(std::string_view version)
    {
        getVersionRank(version);
    }

    bool migrateBandDocumentSchema(Wt::Json::Object& document, std::string_view targetVersion)
    {
        const std::size_t targetRank{ getVersionRank(targetVersion) };
        const std::string currentVersion{ getSchemaVersion(document) };

        bool changed{};
        if (targetRank >= getVersionRank("1.0"))
            changed |= upgradeTo_1_0(document);
        if (targetRank >= getVersionRank("2.0"))
            changed |= upgradeTo_2_0(document);

        // never downgrade
        if (getVersionRank(currentVersion) < targetRank)
        {
            document["schema_version"] = json::toValue(targetVersion);
            changed = true;
        }

        if (changed)
            MCOL_LOG(CACHE, DEBUG, "Band document migrated from schema " << currentVersion << " to " << targetVersion);

        return changed;
    }

    bool migrateCollectionIndexSchema(Wt::Json::Object& index, std::string_view targetVersion)
    {
        const std::size_t targetRank{ getVersionRank(targetVersion) };
        const std::string currentVersion{ getSchemaVersion(index, "metadata_version") };

        bool changed{ getVersionRank(currentVersion) < targetRank };
        for (const Wt::Json::Value& band : json::getArray(index, "bands"))
        {
            if (band.type() == Wt::Json::Type::Object && !static_cast<const Wt::Json::Object&>(band).contains("local_albums_count"))
                changed = true;
        }

        if (!changed)
            return false;

        // parsing backfills entries, stats are recomputed on serialization
        CollectionIndex parsed{ parseCollectionIndex(index) };
        if (getVersionRank(currentVersion) < targetRank)
            parsed.setMetadataVersion(targetVersion);
        else
            parsed.setMetadataVersion(currentVersion);

        index = toJson(parsed);

        MCOL_LOG(CACHE, DEBUG, "Collection index migrated from version " << currentVersion << " to " << parsed.getMetadataVersion());
        return true;
    }
} // namespace mcol::storage
