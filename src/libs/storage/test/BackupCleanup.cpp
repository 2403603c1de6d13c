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

#include "storage/BackupCleanup.hpp"
#include "storage/CollectionLayout.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::storage::tests
{
    TEST(BackupCleanup, keepsMostRecent)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        const std::filesystem::path bandFolder{ tmpDir.getPath() / "Beatles" };
        const std::string documentName{ layout::bandDocumentFileName };

        mcol::tests::writeFile(bandFolder / documentName, "{}");
        mcol::tests::writeFile(bandFolder / (documentName + ".backup"), "{}");
        for (std::string_view timestamp : { "20240101_100000", "20240102_100000", "20240103_100000", "20240104_100000" })
            mcol::tests::writeFile(bandFolder / (documentName + ".backup_" + std::string{ timestamp }), "{}");

        const std::string indexName{ layout::indexFileName };
        mcol::tests::writeFile(tmpDir.getPath() / (indexName + ".backup_20240101_100000"), "{}");

        const BackupCleanupReport report{ cleanupDatedBackups(tmpDir.getPath(), 2) };
        EXPECT_TRUE(report.errors.empty());
        EXPECT_EQ(report.keptFiles, 3);
        ASSERT_EQ(report.removedFiles.size(), 2);

        EXPECT_TRUE(std::filesystem::exists(bandFolder / documentName));
        EXPECT_TRUE(std::filesystem::exists(bandFolder / (documentName + ".backup")));
        EXPECT_TRUE(std::filesystem::exists(bandFolder / (documentName + ".backup_20240104_100000")));
        EXPECT_TRUE(std::filesystem::exists(bandFolder / (documentName + ".backup_20240103_100000")));
        EXPECT_FALSE(std::filesystem::exists(bandFolder / (documentName + ".backup_20240102_100000")));
        EXPECT_FALSE(std::filesystem::exists(bandFolder / (documentName + ".backup_20240101_100000")));
        EXPECT_TRUE(std::filesystem::exists(tmpDir.getPath() / (indexName + ".backup_20240101_100000")));
    }

    TEST(BackupCleanup, nothingToClean)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        std::filesystem::create_directories(tmpDir.getPath() / "Beatles");

        const BackupCleanupReport report{ cleanupDatedBackups(tmpDir.getPath(), 5) };
        EXPECT_TRUE(report.removedFiles.empty());
        EXPECT_EQ(report.keptFiles, 0);
        EXPECT_TRUE(report.errors.empty());
    }
} // namespace mcol::storage::tests
