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

#include "storage/BandDocument.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <vector>

#include <Wt/Json/Array.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/String.hpp"
#include "storage/Exception.hpp"

#include "JsonUtils.hpp"

namespace mcol::storage
{
    namespace
    {
        constexpr std::array<std::string_view, 16> knownBandFields{
            "band_name", "formed", "genres", "genre", "origin", "members", "description",
            "albums", "albums_missing", "albums_count", "analysis", "analyze",
            "folder_structure", "last_updated", "last_metadata_saved", "schema_version"
        };

        int parseRate(const Wt::Json::Object& object)
        {
            const long long rate{ json::getInteger(object, "rate", 0) };
            if (rate < 0 || rate > 10)
                throw ValidationException{ "Rate must be between 0 and 10, got " + std::to_string(rate) };

            return static_cast<int>(rate);
        }

        std::vector<std::string> parseGenres(const Wt::Json::Object& object)
        {
            if (object.contains("genres"))
                return json::getStrings(object, "genres");

            return json::getStrings(object, "genre");
        }

        AlbumRecord parseAlbumRecord(const Wt::Json::Object& object)
        {
            AlbumRecord album;

            album.albumName = core::stringUtils::stringTrim(json::getString(object, "album_name"));
            if (album.albumName.empty())
                throw ValidationException{ "Album without 'album_name'" };

            album.year = json::getString(object, "year");
            album.type = albumTypeFromString(json::getString(object, "type")).value_or(AlbumType::Album);
            album.edition = json::getString(object, "edition");

            const long long trackCount{ json::getInteger(object, "track_count", json::getInteger(object, "tracks_count", 0)) };
            if (trackCount < 0)
                throw ValidationException{ "Album '" + album.albumName + "': track_count must not be negative" };
            album.trackCount = static_cast<std::size_t>(trackCount);

            album.duration = json::getString(object, "duration");
            album.genres = parseGenres(object);
            album.folderPath = json::getString(object, "folder_path");

            return album;
        }

        Wt::Json::Object albumToJson(const AlbumRecord& album)
        {
            Wt::Json::Object object;

            object["album_name"] = json::toValue(album.albumName);
            object["year"] = json::toValue(album.year);
            object["type"] = json::toValue(albumTypeToString(album.type));
            object["edition"] = json::toValue(album.edition);
            object["track_count"] = json::toValue(album.trackCount);
            object["duration"] = json::toValue(album.duration);
            object["genres"] = json::toValue(album.genres);
            object["folder_path"] = json::toValue(album.folderPath);

            return object;
        }

        Wt::Json::Value albumsToJson(const std::vector<AlbumRecord>& albums)
        {
            Wt::Json::Array array;
            for (const AlbumRecord& album : albums)
                array.push_back(Wt::Json::Value{ albumToJson(album) });

            return Wt::Json::Value{ std::move(array) };
        }

        FolderStructureInfo parseFolderStructure(const Wt::Json::Object& object)
        {
            FolderStructureInfo info;

            info.structureType = json::getString(object, "structure_type", "unknown");
            info.consistency = json::getString(object, "consistency", "unknown");
            info.albumsAnalyzed = static_cast<std::size_t>(std::max(0LL, json::getInteger(object, "albums_analyzed")));
            info.typeFoldersFound = json::getStrings(object, "type_folders_found");
            info.lastDetected = json::getString(object, "last_detected");

            return info;
        }

        Wt::Json::Object folderStructureToJson(const FolderStructureInfo& info)
        {
            Wt::Json::Object object;

            object["structure_type"] = json::toValue(info.structureType);
            object["consistency"] = json::toValue(info.consistency);
            object["albums_analyzed"] = json::toValue(info.albumsAnalyzed);
            object["type_folders_found"] = json::toValue(info.typeFoldersFound);
            object["last_detected"] = json::toValue(info.lastDetected);

            return object;
        }
    } // namespace

    std::string_view albumTypeToString(AlbumType type)
    {
        switch (type)
        {
        case AlbumType::Album:
            return "Album";
        case AlbumType::Compilation:
            return "Compilation";
        case AlbumType::EP:
            return "EP";
        case AlbumType::Live:
            return "Live";
        case AlbumType::Single:
            return "Single";
        case AlbumType::Demo:
            return "Demo";
        case AlbumType::Instrumental:
            return "Instrumental";
        case AlbumType::Split:
            return "Split";
        }
        return "";
    }

    std::optional<AlbumType> albumTypeFromString(std::string_view str)
    {
        str = core::stringUtils::stringTrim(str);
        for (AlbumType type : allAlbumTypes)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, albumTypeToString(type)))
                return type;
        }

        return std::nullopt;
    }

    AlbumKey AlbumRecord::getKey() const
    {
        return AlbumKey{
            .name = core::stringUtils::stringToLower(core::stringUtils::stringTrim(albumName)),
            .year = std::string{ core::stringUtils::stringTrim(year) },
            .type = core::stringUtils::stringToLower(albumTypeToString(type)),
            .edition = core::stringUtils::stringToLower(core::stringUtils::stringTrim(edition)),
        };
    }

    std::size_t normalizeAlbums(BandDocument& document)
    {
        std::set<AlbumKey> keys;
        auto isDuplicate{ [&](const AlbumRecord& album) { return !keys.insert(album.getKey()).second; } };

        // local albums come first: a key present in both lists stays local
        const auto localRemoved{ std::erase_if(document.albums, isDuplicate) };
        const auto missingRemoved{ std::erase_if(document.albumsMissing, isDuplicate) };

        return localRemoved + missingRemoved;
    }

    BandAnalysis parseBandAnalysis(const Wt::Json::Object& object)
    {
        try
        {
            BandAnalysis analysis;

            analysis.review = json::getString(object, "review");
            analysis.rate = parseRate(object);

            for (const Wt::Json::Value& value : json::getArray(object, "albums"))
            {
                if (value.type() != Wt::Json::Type::Object)
                    throw ValidationException{ "Album analysis entries must be objects" };

                const Wt::Json::Object& albumObject = value;
                AlbumAnalysis albumAnalysis;
                albumAnalysis.albumName = json::getString(albumObject, "album_name");
                albumAnalysis.review = json::getString(albumObject, "review");
                albumAnalysis.rate = parseRate(albumObject);
                analysis.albums.push_back(std::move(albumAnalysis));
            }

            analysis.similarBands = json::getStrings(object, "similar_bands");
            analysis.similarBandsMissing = json::getStrings(object, "similar_bands_missing");

            return analysis;
        }
        catch (const Wt::WException& e)
        {
            throw ValidationException{ std::string{ "Invalid analysis: " } + e.what() };
        }
    }

    Wt::Json::Object toJson(const BandAnalysis& analysis)
    {
        Wt::Json::Object object;

        object["review"] = json::toValue(analysis.review);
        object["rate"] = Wt::Json::Value{ analysis.rate };

        Wt::Json::Array albums;
        for (const AlbumAnalysis& albumAnalysis : analysis.albums)
        {
            Wt::Json::Object albumObject;
            albumObject["album_name"] = json::toValue(albumAnalysis.albumName);
            albumObject["review"] = json::toValue(albumAnalysis.review);
            albumObject["rate"] = Wt::Json::Value{ albumAnalysis.rate };
            albums.push_back(Wt::Json::Value{ std::move(albumObject) });
        }
        object["albums"] = Wt::Json::Value{ std::move(albums) };
        object["similar_bands"] = json::toValue(analysis.similarBands);
        object["similar_bands_missing"] = json::toValue(analysis.similarBandsMissing);

        return object;
    }

    BandDocument parseBandDocument(const Wt::Json::Object& object)
    {
        try
        {
            BandDocument document;

            document.bandName = core::stringUtils::stringTrim(json::getString(object, "band_name"));
            if (document.bandName.empty())
                throw ValidationException{ "Missing 'band_name'" };

            document.formed = json::getString(object, "formed");
            document.genres = parseGenres(object);
            document.origin = json::getString(object, "origin");
            document.members = json::getStrings(object, "members");
            document.description = json::getString(object, "description");

            for (const Wt::Json::Value& value : json::getArray(object, "albums"))
            {
                if (value.type() != Wt::Json::Type::Object)
                    throw ValidationException{ "Album entries must be objects" };

                const Wt::Json::Object& albumObject = value;
                // older documents flag absent albums in place
                if (json::getBool(albumObject, "missing", false))
                    document.albumsMissing.push_back(parseAlbumRecord(albumObject));
                else
                    document.albums.push_back(parseAlbumRecord(albumObject));
            }

            for (const Wt::Json::Value& value : json::getArray(object, "albums_missing"))
            {
                if (value.type() != Wt::Json::Type::Object)
                    throw ValidationException{ "Album entries must be objects" };

                document.albumsMissing.push_back(parseAlbumRecord(value));
            }

            if (const Wt::Json::Object* analysis{ json::getObject(object, object.contains("analysis") ? "analysis" : "analyze") })
                document.analysis = parseBandAnalysis(*analysis);

            if (const Wt::Json::Object* folderStructure{ json::getObject(object, "folder_structure") })
                document.folderStructure = parseFolderStructure(*folderStructure);

            document.lastUpdated = json::getString(object, "last_updated");
            document.lastMetadataSaved = json::getString(object, "last_metadata_saved");
            document.schemaVersion = json::getString(object, "schema_version", BandDocument::currentSchemaVersion);

            for (const auto& [key, value] : object)
            {
                if (std::find(std::cbegin(knownBandFields), std::cend(knownBandFields), key) == std::cend(knownBandFields))
                    document.extraFields[key] = value;
            }

            return document;
        }
        catch (const Wt::WException& e)
        {
            throw ValidationException{ std::string{ "Invalid band document: " } + e.what() };
        }
    }

    Wt::Json::Object toJson(const BandDocument& document)
    {
        Wt::Json::Object object = document.extraFields;

        object["band_name"] = json::toValue(document.bandName);
        object["formed"] = json::toValue(document.formed);
        object["genres"] = json::toValue(document.genres);
        object["origin"] = json::toValue(document.origin);
        object["members"] = json::toValue(document.members);
        object["description"] = json::toValue(document.description);
        object["albums"] = albumsToJson(document.albums);
        object["albums_missing"] = albumsToJson(document.albumsMissing);
        object["albums_count"] = json::toValue(document.getAlbumsCount());
        if (document.analysis)
            object["analysis"] = Wt::Json::Value{ toJson(*document.analysis) };
        if (document.folderStructure)
            object["folder_structure"] = Wt::Json::Value{ folderStructureToJson(*document.folderStructure) };
        object["last_updated"] = json::toValue(document.lastUpdated);
        if (!document.lastMetadataSaved.empty())
            object["last_metadata_saved"] = json::toValue(document.lastMetadataSaved);
        object["schema_version"] = json::toValue(document.schemaVersion);

        return object;
    }
} // namespace mcol::storage
