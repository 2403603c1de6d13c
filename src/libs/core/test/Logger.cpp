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

#include <sstream>

#include <gtest/gtest.h>

#include "core/ILogger.hpp"
#include "core/Exception.hpp"
#include "core/StreamLogger.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::core::logging::tests
{
    TEST(Logger, severities)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("WARNING"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("verbose"), std::nullopt);
        EXPECT_STREQ(getModuleName(Module::MIGRATION), "MIGRATION");
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        Service<ILogger> logger{ std::make_unique<StreamLogger>(oss, Severity::INFO) };

        MCOL_LOG(STORAGE, INFO, "Saved '" << "band.json" << "'");
        MCOL_LOG(STORAGE, DEBUG, "not displayed");

        const std::string output{ oss.str() };
        EXPECT_NE(output.find("[info] [STORAGE] Saved 'band.json'"), std::string::npos);
        EXPECT_EQ(output.find("not displayed"), std::string::npos);
    }

    TEST(Logger, logFile)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        const std::filesystem::path logFile{ tmpDir.getPath() / "mcol.log" };

        {
            Service<ILogger> logger{ createLogger(Severity::WARNING, logFile) };

            MCOL_LOG(SCANNER, WARNING, "Cannot read folder '" << "Beatles" << "'");
            MCOL_LOG(MIGRATION, ERROR, "Rollback failed");
            MCOL_LOG(SCANNER, INFO, "not displayed");
        }

        const std::string content{ mcol::tests::readFile(logFile) };
        EXPECT_NE(content.find("[warning] [SCANNER] Cannot read folder 'Beatles'"), std::string::npos);
        EXPECT_NE(content.find("[error] [MIGRATION] Rollback failed"), std::string::npos);
        EXPECT_EQ(content.find("not displayed"), std::string::npos);
    }

    TEST(Logger, logFileError)
    {
        const mcol::tests::ScopedTmpDirectory tmpDir;
        EXPECT_THROW(createLogger(Severity::INFO, tmpDir.getPath() / "missing" / "mcol.log"), McolException);
    }
} // namespace mcol::core::logging::tests
