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

#include <gtest/gtest.h>

#include "scanner/AlbumDiscovery.hpp"
#include "scanner/AlbumReconciliation.hpp"

namespace mcol::scanner::tests
{
    namespace
    {
        DiscoveredAlbum createDiscoveredAlbum(std::string_view folderName, std::size_t trackCount, std::optional<storage::AlbumType> typeFolderType = std::nullopt)
        {
            DiscoveredAlbum album;
            album.folderName = folderName;
            album.folderPath = typeFolderType ? std::filesystem::path{ getTypeFolderName(*typeFolderType) } / folderName : std::filesystem::path{ folderName };
            album.typeFolderType = typeFolderType;
            album.parsed = parseAlbumFolderName(folderName);
            album.type = detectAlbumType(folderName, typeFolderType);
            album.trackCount = trackCount;
            return album;
        }

        storage::AlbumRecord createAlbum(std::string_view name, std::string_view year)
        {
            storage::AlbumRecord album;
            album.albumName = name;
            album.year = year;
            return album;
        }
    } // namespace

    TEST(AlbumReconciliation, newDocument)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1966 - Revolver", 14), createDiscoveredAlbum("1969 - Abbey Road", 17) };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.added, 2);
        EXPECT_TRUE(stats.hasChanges());
        ASSERT_EQ(document.albums.size(), 2);
        EXPECT_EQ(document.albums[0].albumName, "Revolver");
        EXPECT_EQ(document.albums[0].trackCount, 14);
        EXPECT_EQ(document.albums[1].folderPath, "1969 - Abbey Road");
        EXPECT_TRUE(document.albumsMissing.empty());
    }

    TEST(AlbumReconciliation, preservesKnownFields)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        document.albums.push_back(createAlbum("Abbey Road", "1969"));
        document.albums.back().genres = { "Rock" };
        document.albums.back().duration = "47:03";
        document.albums.back().trackCount = 10;
        document.albums.back().folderPath = "Abbey Road";

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1969 - Abbey Road", 17) };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.refreshed, 1);
        EXPECT_FALSE(stats.hasChanges());
        ASSERT_EQ(document.albums.size(), 1);
        EXPECT_EQ(document.albums[0].genres, (std::vector<std::string>{ "Rock" }));
        EXPECT_EQ(document.albums[0].duration, "47:03");
        EXPECT_EQ(document.albums[0].trackCount, 17);
        EXPECT_EQ(document.albums[0].folderPath, "1969 - Abbey Road");
    }

    TEST(AlbumReconciliation, nameOnlyMatch)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        document.albums.push_back(createAlbum("Abbey Road", ""));
        document.albums.back().genres = { "Rock" };

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1969 - abbey road", 17) };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.refreshed, 1);
        EXPECT_EQ(stats.added, 0);
        ASSERT_EQ(document.albums.size(), 1);
        EXPECT_EQ(document.albums[0].albumName, "Abbey Road");
        EXPECT_EQ(document.albums[0].year, "1969");
        EXPECT_EQ(document.albums[0].genres, (std::vector<std::string>{ "Rock" }));
        EXPECT_TRUE(document.albumsMissing.empty());
    }

    TEST(AlbumReconciliation, nameOnlyMatchConflictingYear)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        document.albums.push_back(createAlbum("Abbey Road", "1970"));

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1969 - Abbey Road", 17) };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.added, 1);
        EXPECT_EQ(stats.markedMissing, 1);
        ASSERT_EQ(document.albums.size(), 1);
        EXPECT_EQ(document.albums[0].year, "1969");
        ASSERT_EQ(document.albumsMissing.size(), 1);
        EXPECT_EQ(document.albumsMissing[0].year, "1970");
    }

    TEST(AlbumReconciliation, sameNameDifferentYears)
    {
        storage::BandDocument document;
        document.bandName = "Weezer";
        document.albums.push_back(createAlbum("Weezer", "2001"));
        document.albums.back().genres = { "Power Pop" };
        document.albums.push_back(createAlbum("Weezer", "2008"));
        document.albums.back().genres = { "Alternative" };

        const std::vector<DiscoveredAlbum> discovered{
            createDiscoveredAlbum("1994 - Weezer", 10),
            createDiscoveredAlbum("2001 - Weezer", 10),
            createDiscoveredAlbum("2008 - Weezer", 10),
        };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.added, 1);
        EXPECT_EQ(stats.refreshed, 2);
        EXPECT_EQ(stats.markedMissing, 0);
        ASSERT_EQ(document.albums.size(), 3);
        EXPECT_TRUE(document.albumsMissing.empty());

        struct Expected
        {
            std::string_view year;
            std::string_view folderPath;
            std::vector<std::string> genres;
        };
        const Expected expected[]{
            { "1994", "1994 - Weezer", {} },
            { "2001", "2001 - Weezer", { "Power Pop" } },
            { "2008", "2008 - Weezer", { "Alternative" } },
        };
        for (std::size_t i{}; i < std::size(expected); ++i)
        {
            EXPECT_EQ(document.albums[i].year, expected[i].year) << "index = " << i;
            EXPECT_EQ(document.albums[i].folderPath, expected[i].folderPath) << "index = " << i;
            EXPECT_EQ(document.albums[i].genres, expected[i].genres) << "index = " << i;
        }
    }

    TEST(AlbumReconciliation, missingAlbums)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        document.albums.push_back(createAlbum("Revolver", "1966"));
        document.albums.back().trackCount = 14;
        document.albums.back().folderPath = "1966 - Revolver";
        document.albums.push_back(createAlbum("Abbey Road", "1969"));
        document.albumsMissing.push_back(createAlbum("Help!", "1965"));
        document.albumsMissing.push_back(createAlbum("Let It Be", "1970"));

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1969 - Abbey Road", 17), createDiscoveredAlbum("1970 - Let It Be", 12) };
        const ReconciliationStats stats{ reconcileAlbums(document, discovered) };

        EXPECT_EQ(stats.refreshed, 1);
        EXPECT_EQ(stats.recovered, 1);
        EXPECT_EQ(stats.markedMissing, 1);
        EXPECT_EQ(stats.added, 0);

        ASSERT_EQ(document.albums.size(), 2);
        EXPECT_EQ(document.albums[0].albumName, "Abbey Road");
        EXPECT_EQ(document.albums[1].albumName, "Let It Be");
        EXPECT_EQ(document.albums[1].trackCount, 12);

        ASSERT_EQ(document.albumsMissing.size(), 2);
        EXPECT_EQ(document.albumsMissing[0].albumName, "Revolver");
        EXPECT_EQ(document.albumsMissing[0].trackCount, 0);
        EXPECT_TRUE(document.albumsMissing[0].folderPath.empty());
        EXPECT_EQ(document.albumsMissing[1].albumName, "Help!");
        EXPECT_EQ(document.getAlbumsCount(), 4);
    }

    TEST(AlbumReconciliation, typeFolderOverridesStoredType)
    {
        storage::BandDocument document;
        document.bandName = "Metallica";
        document.albums.push_back(createAlbum("S&M", "1999"));

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1999 - S&M", 21, storage::AlbumType::Live) };
        reconcileAlbums(document, discovered);

        ASSERT_EQ(document.albums.size(), 1);
        EXPECT_EQ(document.albums[0].type, storage::AlbumType::Live);
        EXPECT_EQ(document.albums[0].folderPath, "Live/1999 - S&M");
    }

    TEST(AlbumReconciliation, identityInvariant)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        document.albums.push_back(createAlbum("Revolver", "1966"));
        document.albumsMissing.push_back(createAlbum("Revolver", "1966"));

        const std::vector<DiscoveredAlbum> discovered{ createDiscoveredAlbum("1966 - Revolver", 14), createDiscoveredAlbum("1966 - Revolver (Remastered)", 14) };
        reconcileAlbums(document, discovered);

        for (const storage::AlbumRecord& album : document.albums)
        {
            for (const storage::AlbumRecord& missingAlbum : document.albumsMissing)
                EXPECT_NE(album.getKey(), missingAlbum.getKey());
        }
        EXPECT_EQ(document.albums.size(), 2);
    }
} // namespace mcol::scanner::tests
