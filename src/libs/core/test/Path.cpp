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

#include "core/Exception.hpp"
#include "core/Path.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::core::pathUtils::tests
{
    TEST(Path, hasFileAnyExtension)
    {
        const std::filesystem::path extensions[]{ ".mp3", ".flac" };

        struct TestCase
        {
            std::filesystem::path file;
            bool expectedResult;
        };

        TestCase tests[]{
            { "track.mp3", true },
            { "track.MP3", true },
            { "/music/Band/Album/01 - Intro.FLAC", true },
            { "cover.jpg", false },
            { "mp3", false },
            { "", false },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(hasFileAnyExtension(test.file, extensions), test.expectedResult) << "file = " << test.file;
    }

    TEST(Path, sanitizeFileStem)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { "1973 - The Dark Side of the Moon", "1973 - The Dark Side of the Moon" },
            { "AC/DC", "ACDC" },
            { "What?", "What" },
            { "Live: \"Pompeii\"", "Live Pompeii" },
            { "Café <Live>", "Café Live" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(sanitizeFileStem(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(Path, exploreFilesRecursive)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        mcol::tests::createAlbumFolder(tmpDir.getPath() / "Album" / "CD1", 2);
        mcol::tests::createAlbumFolder(tmpDir.getPath() / "Album" / "CD2", 3);

        std::size_t fileCount{};
        const bool completed{ exploreFilesRecursive(tmpDir.getPath(), [&](std::error_code ec, const std::filesystem::path&) {
            EXPECT_FALSE(ec);
            ++fileCount;
            return true;
        }) };

        EXPECT_TRUE(completed);
        EXPECT_EQ(fileCount, 5);

        fileCount = 0;
        EXPECT_FALSE(exploreFilesRecursive(tmpDir.getPath(), [&](std::error_code, const std::filesystem::path&) {
            ++fileCount;
            return false;
        }));
        EXPECT_EQ(fileCount, 1);
    }

    TEST(Path, copyDirectoryContent)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        const std::filesystem::path source{ tmpDir.getPath() / "source" };
        mcol::tests::createAlbumFolder(source / "Album", 2);
        mcol::tests::writeFile(source / "notes.txt", "notes");
        mcol::tests::createAlbumFolder(source / "skipped", 1);

        const std::filesystem::path destination{ tmpDir.getPath() / "destination" };
        copyDirectoryContent(source, destination, [](const std::filesystem::path& p) { return p.filename() != "skipped"; });

        EXPECT_TRUE(std::filesystem::exists(destination / "Album" / "track1.mp3"));
        EXPECT_TRUE(std::filesystem::exists(destination / "Album" / "track2.mp3"));
        EXPECT_EQ(mcol::tests::readFile(destination / "notes.txt"), "notes");
        EXPECT_FALSE(std::filesystem::exists(destination / "skipped"));
        EXPECT_TRUE(std::filesystem::exists(source / "skipped"));
    }

    TEST(Path, getLastWriteTime)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        mcol::tests::writeFile(tmpDir.getPath() / "file", "");

        EXPECT_TRUE(getLastWriteTime(tmpDir.getPath() / "file").isValid());
        EXPECT_THROW(getLastWriteTime(tmpDir.getPath() / "missing"), McolException);
    }
} // namespace mcol::core::pathUtils::tests
