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

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Json/Object.h>

namespace mcol::storage
{
    enum class AlbumType
    {
        Album,
        Compilation,
        EP,
        Live,
        Single,
        Demo,
        Instrumental,
        Split,
    };

    inline constexpr AlbumType allAlbumTypes[]{
        AlbumType::Album,
        AlbumType::Compilation,
        AlbumType::EP,
        AlbumType::Live,
        AlbumType::Single,
        AlbumType::Demo,
        AlbumType::Instrumental,
        AlbumType::Split,
    };

    std::string_view albumTypeToString(AlbumType type);
    // case insensitive
    std::optional<AlbumType> albumTypeFromString(std::string_view str);

    // Identity of an album, all parts normalized to lower case
    struct AlbumKey
    {
        std::string name;
        std::string year;
        std::string type;
        std::string edition;

        auto operator<=>(const AlbumKey&) const = default;
    };

    struct AlbumRecord
    {
        std::string albumName;
        std::string year;
        AlbumType type{ AlbumType::Album };
        std::string edition;
        std::size_t trackCount{};
        std::string duration;
        std::vector<std::string> genres;
        std::string folderPath; // relative to the band folder

        AlbumKey getKey() const;

        bool operator==(const AlbumRecord&) const = default;
    };

    struct AlbumAnalysis
    {
        std::string albumName;
        std::string review;
        int rate{}; // 0..10

        bool operator==(const AlbumAnalysis&) const = default;
    };

    struct BandAnalysis
    {
        std::string review;
        int rate{}; // 0..10
        std::vector<AlbumAnalysis> albums;
        std::vector<std::string> similarBands;        // present in the collection
        std::vector<std::string> similarBandsMissing; // not in the collection

        bool operator==(const BandAnalysis&) const = default;
    };

    struct FolderStructureInfo
    {
        std::string structureType;
        std::string consistency;
        std::size_t albumsAnalyzed{};
        std::vector<std::string> typeFoldersFound;
        std::string lastDetected;

        bool operator==(const FolderStructureInfo&) const = default;
    };

    struct BandDocument
    {
        static constexpr std::string_view currentSchemaVersion{ "2.0" };

        std::string bandName;
        std::string formed;
        std::vector<std::string> genres;
        std::string origin;
        std::vector<std::string> members;
        std::string description;
        std::vector<AlbumRecord> albums;        // present on disk
        std::vector<AlbumRecord> albumsMissing; // known but absent from disk
        std::optional<BandAnalysis> analysis;
        std::optional<FolderStructureInfo> folderStructure;
        std::string lastUpdated;
        std::string lastMetadataSaved;
        std::string schemaVersion{ currentSchemaVersion };

        // Keys of the stored document this model does not know about, written back as is
        Wt::Json::Object extraFields;

        std::size_t getAlbumsCount() const { return albums.size() + albumsMissing.size(); }

        bool operator==(const BandDocument&) const = default;
    };

    // Enforce the identity rules on a document:
    // albums listed locally are removed from the missing list, duplicates are dropped
    // returns the number of removed records
    std::size_t normalizeAlbums(BandDocument& document);

    // Throws ValidationException
    BandDocument parseBandDocument(const Wt::Json::Object& object);
    Wt::Json::Object toJson(const BandDocument& document);

    BandAnalysis parseBandAnalysis(const Wt::Json::Object& object);
    Wt::Json::Object toJson(const BandAnalysis& analysis);
} // namespace mcol::storage
