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

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mcol::migration
{
    enum class MigrationErrorKind
    {
        PermissionDenied,
        DiskSpaceInsufficient,
        FileLocked,
        SourceNotFound,
        TargetExists,
        Unknown,
    };
    std::string_view migrationErrorKindToString(MigrationErrorKind kind);

    enum class Severity
    {
        Low,
        Medium,
        High,
        Critical,
    };
    std::string_view severityToString(Severity severity);

    // Operation that raised the error
    struct ErrorContext
    {
        std::string albumName;
        std::filesystem::path sourcePath;
        std::filesystem::path targetPath;
    };

    struct ErrorDetails
    {
        MigrationErrorKind kind{ MigrationErrorKind::Unknown };
        Severity severity{ Severity::Medium };
        std::string message;
        ErrorContext context;
        bool retryable{};
        bool manualInterventionRequired{};
        std::vector<std::string> solutionSteps;
    };

    MigrationErrorKind classifyErrorCode(std::error_code ec);

    // Pure mapping, errors that do not carry a system error code are Unknown
    ErrorDetails analyzeError(const std::exception& error, const ErrorContext& context);
    ErrorDetails analyzeError(std::error_code ec, std::string_view message, const ErrorContext& context);
} // namespace mcol::migration
