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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "migration/ErrorAnalyzer.hpp"

namespace mcol::migration
{
    struct MigrationResult;
}

namespace mcol::collection
{
    enum class ErrorKind
    {
        Validation,
        Storage,
        Scanning,
        Migration,
        Configuration,
    };
    std::string_view errorKindToString(ErrorKind kind);

    enum class MigrationFailureKind
    {
        PermissionDenied,
        DiskSpaceInsufficient,
        FileLocked,
        SourceNotFound,
        TargetExists,
        PartialFailure,
        Rollback,
        Unknown,
    };
    std::string_view migrationFailureKindToString(MigrationFailureKind kind);
    MigrationFailureKind toMigrationFailureKind(migration::MigrationErrorKind kind);

    using Severity = migration::Severity;

    struct Error
    {
        ErrorKind kind{ ErrorKind::Storage };
        std::optional<MigrationFailureKind> migrationFailureKind; // only for Migration errors
        Severity severity{ Severity::Medium };
        std::string message;
        std::vector<std::string> remediationSteps;
    };

    // Failure carried by a completed migration, nullopt if every album was migrated
    std::optional<Error> getMigrationError(const migration::MigrationResult& result);
} // namespace mcol::collection
