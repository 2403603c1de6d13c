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

#include <filesystem>
#include <stdexcept>

#include "migration/ErrorAnalyzer.hpp"

namespace mcol::migration::tests
{
    TEST(ErrorAnalyzer, classifyErrorCode)
    {
        struct TestCase
        {
            std::errc error;
            MigrationErrorKind expectedKind;
            Severity expectedSeverity;
            bool expectedRetryable;
            bool expectedManualIntervention;
        };

        constexpr TestCase tests[]{
            { std::errc::permission_denied, MigrationErrorKind::PermissionDenied, Severity::High, true, true },
            { std::errc::operation_not_permitted, MigrationErrorKind::PermissionDenied, Severity::High, true, true },
            { std::errc::read_only_file_system, MigrationErrorKind::PermissionDenied, Severity::High, true, true },
            { std::errc::no_space_on_device, MigrationErrorKind::DiskSpaceInsufficient, Severity::Critical, false, true },
            { std::errc::device_or_resource_busy, MigrationErrorKind::FileLocked, Severity::High, true, false },
            { std::errc::text_file_busy, MigrationErrorKind::FileLocked, Severity::High, true, false },
            { std::errc::no_such_file_or_directory, MigrationErrorKind::SourceNotFound, Severity::Medium, false, false },
            { std::errc::file_exists, MigrationErrorKind::TargetExists, Severity::Medium, true, false },
            { std::errc::directory_not_empty, MigrationErrorKind::TargetExists, Severity::Medium, true, false },
            { std::errc::io_error, MigrationErrorKind::Unknown, Severity::Medium, true, true },
            { std::errc::cross_device_link, MigrationErrorKind::Unknown, Severity::Medium, true, true },
        };

        const ErrorContext context{ "Revolver", "/music/Beatles/1966 - Revolver", "/music/Beatles/Album/1966 - Revolver" };
        for (const TestCase& test : tests)
        {
            const std::error_code ec{ std::make_error_code(test.error) };
            EXPECT_EQ(classifyErrorCode(ec), test.expectedKind) << "Error = " << ec.message();

            const ErrorDetails details{ analyzeError(ec, "failure", context) };
            EXPECT_EQ(details.kind, test.expectedKind) << "Error = " << ec.message();
            EXPECT_EQ(details.severity, test.expectedSeverity) << "Error = " << ec.message();
            EXPECT_EQ(details.retryable, test.expectedRetryable) << "Error = " << ec.message();
            EXPECT_EQ(details.manualInterventionRequired, test.expectedManualIntervention) << "Error = " << ec.message();
            EXPECT_FALSE(details.solutionSteps.empty()) << "Error = " << ec.message();
            EXPECT_EQ(details.message, "failure");
            EXPECT_EQ(details.context.albumName, "Revolver");
        }
    }

    TEST(ErrorAnalyzer, noErrorCode)
    {
        EXPECT_EQ(classifyErrorCode(std::error_code{}), MigrationErrorKind::Unknown);
    }

    TEST(ErrorAnalyzer, analyzeException)
    {
        const ErrorContext context{ "Revolver", "/music/Beatles/1966 - Revolver", "/music/Beatles/Album/1966 - Revolver" };

        {
            const std::filesystem::filesystem_error error{ "Cannot move", context.sourcePath, context.targetPath, std::make_error_code(std::errc::permission_denied) };
            const ErrorDetails details{ analyzeError(error, context) };
            EXPECT_EQ(details.kind, MigrationErrorKind::PermissionDenied);
            EXPECT_EQ(details.message, error.what());
            ASSERT_FALSE(details.solutionSteps.empty());
            EXPECT_NE(details.solutionSteps.front().find("/music/Beatles/1966 - Revolver"), std::string::npos);
        }

        {
            const std::system_error error{ std::make_error_code(std::errc::no_space_on_device), "write" };
            EXPECT_EQ(analyzeError(error, context).kind, MigrationErrorKind::DiskSpaceInsufficient);
        }

        {
            const std::runtime_error error{ "something odd" };
            const ErrorDetails details{ analyzeError(error, context) };
            EXPECT_EQ(details.kind, MigrationErrorKind::Unknown);
            EXPECT_EQ(details.message, "something odd");
            EXPECT_TRUE(details.retryable);
        }
    }

    TEST(ErrorAnalyzer, strings)
    {
        EXPECT_EQ(migrationErrorKindToString(MigrationErrorKind::DiskSpaceInsufficient), "disk_space_insufficient");
        EXPECT_EQ(migrationErrorKindToString(MigrationErrorKind::TargetExists), "target_exists");
        EXPECT_EQ(severityToString(Severity::Critical), "critical");
    }
} // namespace mcol::migration::tests
