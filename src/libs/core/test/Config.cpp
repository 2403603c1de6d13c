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
#include "core/IConfig.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::core::tests
{
    TEST(Config, values)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        const std::filesystem::path configFile{ tmpDir.getPath() / "mcol.conf" };
        mcol::tests::writeFile(configFile, R"(
music-root-path = "/srv/music";
cache-duration-days = 7;
lock-timeout-ms = -5;
backup = false;
log-level = "debug";
)");

        std::unique_ptr<IConfig> config{ createConfig(configFile) };

        EXPECT_EQ(config->getPath("music-root-path", "/music"), "/srv/music");
        EXPECT_EQ(config->getULong("cache-duration-days", 30), 7);
        EXPECT_EQ(config->getLong("lock-timeout-ms", 10000), -5);
        EXPECT_EQ(config->getULong("lock-timeout-ms", 10000), 10000); // negative
        EXPECT_FALSE(config->getBool("backup", true));
        EXPECT_EQ(config->getString("log-level", "info"), "debug");
    }

    TEST(Config, defaults)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        const std::filesystem::path configFile{ tmpDir.getPath() / "mcol.conf" };
        mcol::tests::writeFile(configFile, "max-backups = \"five\";\n");

        std::unique_ptr<IConfig> config{ createConfig(configFile) };

        EXPECT_EQ(config->getPath("music-root-path", "/music"), "/music");
        EXPECT_EQ(config->getULong("cache-duration-days", 30), 30);
        EXPECT_EQ(config->getULong("max-backups", 5), 5); // wrong type
        EXPECT_TRUE(config->getBool("backup", true));
    }

    TEST(Config, errors)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        EXPECT_THROW(createConfig(tmpDir.getPath() / "missing.conf"), McolException);

        const std::filesystem::path configFile{ tmpDir.getPath() / "broken.conf" };
        mcol::tests::writeFile(configFile, "music-root-path = ;");
        EXPECT_THROW(createConfig(configFile), McolException);
    }
} // namespace mcol::core::tests
