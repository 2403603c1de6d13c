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
#include "scanner/StructureDetector.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::scanner::tests
{
    using mcol::tests::createAlbumFolder;
    using mcol::tests::ScopedTmpDirectory;

    TEST(AlbumDiscovery, isMusicFile)
    {
        struct TestCase
        {
            std::filesystem::path file;
            bool expected;
        };

        TestCase tests[]{
            { "track.mp3", true },
            { "track.FLAC", true },
            { "track.m4a", true },
            { "track.wma", true },
            { "track.m4p", true },
            { "cover.jpg", false },
            { "playlist.m3u", false },
            { "mp3", false },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(isMusicFile(test.file), test.expected) << "File = " << test.file;
    }

    TEST(AlbumDiscovery, defaultLayout)
    {
        const ScopedTmpDirectory tmpDir;
        const std::filesystem::path bandFolder{ tmpDir.getPath() / "Beatles" };
        createAlbumFolder(bandFolder / "1966 - Revolver", 3);
        createAlbumFolder(bandFolder / "1969 - Abbey Road (Remastered)", 2);
        createAlbumFolder(bandFolder / "1970 - Let It Be" / "CD1", 2);
        createAlbumFolder(bandFolder / "1970 - Let It Be" / "CD2", 1);
        createAlbumFolder(bandFolder / "Empty", 0);
        createAlbumFolder(bandFolder / ".hidden", 2);
        createAlbumFolder(bandFolder / "Scans", 2);
        mcol::tests::writeFile(bandFolder / "1966 - Revolver" / "cover.jpg", "");

        const AlbumDiscovery discovery{ discoverAlbums(bandFolder) };
        EXPECT_TRUE(discovery.errors.empty());
        EXPECT_TRUE(discovery.typeFoldersFound.empty());
        ASSERT_EQ(discovery.albums.size(), 3);

        EXPECT_EQ(discovery.albums[0].folderName, "1966 - Revolver");
        EXPECT_EQ(discovery.albums[0].trackCount, 3);
        EXPECT_EQ(discovery.albums[0].parsed.albumName, "Revolver");
        EXPECT_FALSE(discovery.albums[0].isInTypeFolder());

        EXPECT_EQ(discovery.albums[1].parsed.edition, "Remastered");
        EXPECT_EQ(discovery.albums[2].trackCount, 3);

        const storage::AlbumRecord record{ discovery.albums[1].toAlbumRecord() };
        EXPECT_EQ(record.albumName, "Abbey Road");
        EXPECT_EQ(record.year, "1969");
        EXPECT_EQ(record.edition, "Remastered");
        EXPECT_EQ(record.type, storage::AlbumType::Album);
        EXPECT_EQ(record.trackCount, 2);
        EXPECT_EQ(record.folderPath, "1969 - Abbey Road (Remastered)");

        const FolderStructure structure{ detectFolderStructure(discovery) };
        EXPECT_EQ(structure.type, StructureType::Default);
        EXPECT_EQ(structure.albumsAnalyzed, 3);
        EXPECT_EQ(structure.albumsWithYear, 3);
        // 2 "default_no_edition" over 3
        EXPECT_EQ(structure.consistencyScore, 66);
        EXPECT_EQ(structure.consistency, StructureConsistency::Inconsistent);
    }

    TEST(AlbumDiscovery, enhancedLayout)
    {
        const ScopedTmpDirectory tmpDir;
        const std::filesystem::path bandFolder{ tmpDir.getPath() / "Metallica" };
        createAlbumFolder(bandFolder / "Album" / "1986 - Master of Puppets", 8);
        createAlbumFolder(bandFolder / "Album" / "1991 - Metallica", 12);
        createAlbumFolder(bandFolder / "Live" / "1999 - S&M", 21);
        createAlbumFolder(bandFolder / "Demos" / "1982 - No Life Till Leather", 7);

        const AlbumDiscovery discovery{ discoverAlbums(bandFolder) };
        ASSERT_EQ(discovery.albums.size(), 4);
        EXPECT_EQ(discovery.typeFoldersFound, (std::vector<std::string>{ "Album", "Demos", "Live" }));

        EXPECT_EQ(discovery.albums[0].folderPath, std::filesystem::path{ "Album" } / "1986 - Master of Puppets");
        EXPECT_EQ(discovery.albums[0].type, storage::AlbumType::Album);
        EXPECT_EQ(discovery.albums[2].type, storage::AlbumType::Demo);
        EXPECT_EQ(discovery.albums[3].type, storage::AlbumType::Live);
        EXPECT_EQ(discovery.albums[3].toAlbumRecord().folderPath, "Live/1999 - S&M");

        const FolderStructure structure{ detectFolderStructure(discovery) };
        EXPECT_EQ(structure.type, StructureType::Enhanced);
        EXPECT_EQ(structure.albumsInTypeFolders, 4);
        EXPECT_EQ(structure.consistency, StructureConsistency::Consistent);
    }

    TEST(AlbumDiscovery, typeFolderPrecedence)
    {
        const ScopedTmpDirectory tmpDir;
        const std::filesystem::path bandFolder{ tmpDir.getPath() / "Nirvana" };
        createAlbumFolder(bandFolder / "Demos" / "1994 - MTV Unplugged in New York", 14);

        const AlbumDiscovery discovery{ discoverAlbums(bandFolder) };
        ASSERT_EQ(discovery.albums.size(), 1);
        EXPECT_EQ(discovery.albums[0].type, storage::AlbumType::Demo);
    }

    TEST(AlbumDiscovery, mixedAndLegacyLayouts)
    {
        const ScopedTmpDirectory tmpDir;

        const std::filesystem::path mixedBand{ tmpDir.getPath() / "Mixed" };
        createAlbumFolder(mixedBand / "1990 - First", 1);
        createAlbumFolder(mixedBand / "Live" / "1992 - Alive", 1);
        EXPECT_EQ(detectFolderStructure(mixedBand).type, StructureType::Mixed);

        const std::filesystem::path legacyBand{ tmpDir.getPath() / "Legacy" };
        createAlbumFolder(legacyBand / "First", 1);
        createAlbumFolder(legacyBand / "Second", 1);
        const FolderStructure legacyStructure{ detectFolderStructure(legacyBand) };
        EXPECT_EQ(legacyStructure.type, StructureType::Legacy);
        EXPECT_EQ(legacyStructure.consistency, StructureConsistency::Consistent);

        // type named folder holding tracks only
        const std::filesystem::path liveBand{ tmpDir.getPath() / "LiveBand" };
        createAlbumFolder(liveBand / "Live", 3);
        const AlbumDiscovery discovery{ discoverAlbums(liveBand) };
        ASSERT_EQ(discovery.albums.size(), 1);
        EXPECT_FALSE(discovery.albums[0].isInTypeFolder());
        EXPECT_EQ(discovery.albums[0].type, storage::AlbumType::Live);

        const FolderStructure emptyStructure{ detectFolderStructure(tmpDir.getPath() / "NotThere") };
        EXPECT_EQ(emptyStructure.type, StructureType::Unknown);
        EXPECT_EQ(emptyStructure.consistency, StructureConsistency::Unknown);
    }

    TEST(StructureDetector, strings)
    {
        for (StructureType type : { StructureType::Default, StructureType::Enhanced, StructureType::Mixed, StructureType::Legacy, StructureType::Unknown })
            EXPECT_EQ(structureTypeFromString(structureTypeToString(type)), type);

        EXPECT_EQ(structureTypeFromString("Enhanced"), StructureType::Enhanced);
        EXPECT_EQ(structureTypeFromString("flat"), std::nullopt);

        const storage::FolderStructureInfo info{ toFolderStructureInfo(FolderStructure{ .type = StructureType::Mixed, .consistency = StructureConsistency::MostlyConsistent }) };
        EXPECT_EQ(info.structureType, "mixed");
        EXPECT_EQ(info.consistency, "mostly_consistent");
        EXPECT_FALSE(info.lastDetected.empty());
    }
} // namespace mcol::scanner::tests
