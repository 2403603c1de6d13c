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

#include "services/collection/Error.hpp"

#include "migration/IMigrationEngine.hpp"

namespace mcol::collection
{
    std::string_view errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Storage:
            return "storage";
        case ErrorKind::Scanning:
            return "scanning";
        case ErrorKind::Migration:
            return "migration";
        case ErrorKind::Configuration:
            return "configuration";
        }

        return "unknown";
    }

    std::string_view migrationFailureKindToString(MigrationFailureKind kind)
    {
        switch (kind)
        {
        case MigrationFailureKind::PermissionDenied:
            return "permission_denied";
        case MigrationFailureKind::DiskSpaceInsufficient:
            return "disk_space_insufficient";
        case MigrationFailureKind::FileLocked:
            return "file_locked";
        case MigrationFailureKind::SourceNotFound:
            return "source_not_found";
        case MigrationFailureKind::TargetExists:
            return "target_exists";
        case MigrationFailureKind::PartialFailure:
            return "partial_failure";
        case MigrationFailureKind::Rollback:
            return "rollback";
        case MigrationFailureKind::Unknown:
            break;
        }

        return "unknown";
    }

    MigrationFailureKind toMigrationFailureKind(migration::MigrationErrorKind kind)
    {
        switch (kind)
        {
        case migration::MigrationErrorKind::PermissionDenied:
            return MigrationFailureKind::PermissionDenied;
        case migration::MigrationErrorKind::DiskSpaceInsufficient:
            return MigrationFailureKind::DiskSpaceInsufficient;
        case migration::MigrationErrorKind::FileLocked:
            return MigrationFailureKind::FileLocked;
        case migration::MigrationErrorKind::SourceNotFound:
            return MigrationFailureKind::SourceNotFound;
        case migration::MigrationErrorKind::TargetExists:
            return MigrationFailureKind::TargetExists;
        case migration::MigrationErrorKind::Unknown:
            break;
        }

        return MigrationFailureKind::Unknown;
    }

    std::optional<Error> getMigrationError(const migration::MigrationResult& result)
    {
        const std::string bandLabel{ "Band '" + result.bandName + "': " };
        const std::string firstMessage{ result.errorMessages.empty() ? std::string{ "no error reported" } : result.errorMessages.front() };

        switch (result.status)
        {
        case migration::MigrationStatus::Success:
            return std::nullopt;

        case migration::MigrationStatus::PartialSuccess:
            return Error{
                .kind = ErrorKind::Migration,
                .migrationFailureKind = MigrationFailureKind::PartialFailure,
                .severity = Severity::Medium,
                .message = bandLabel + std::to_string(result.albumsMigrated) + " album(s) migrated, " + std::to_string(result.albumsFailed) + " failed: " + firstMessage,
                .remediationSteps = {
                    "Review the error reported for each failed album",
                    "Run the migration again once the errors are fixed, migrated albums are left untouched",
                },
            };

        case migration::MigrationStatus::RolledBack:
        {
            Error error{
                .kind = ErrorKind::Migration,
                .migrationFailureKind = MigrationFailureKind::Unknown,
                .severity = Severity::High,
                .message = bandLabel + "migration rolled back: " + firstMessage,
                .remediationSteps = {},
            };
            if (result.abortError)
            {
                error.migrationFailureKind = toMigrationFailureKind(result.abortError->kind);
                error.severity = result.abortError->severity;
                error.remediationSteps = result.abortError->solutionSteps;
            }
            error.remediationSteps.push_back("Run the migration again, the band folder is in its original state");
            return error;
        }

        case migration::MigrationStatus::Failed:
            break;
        }

        // Nothing was attempted: the request does not fit the band folder
        if (result.operations.empty() || result.albumsFailed == 0)
        {
            return Error{
                .kind = ErrorKind::Validation,
                .migrationFailureKind = std::nullopt,
                .severity = Severity::Medium,
                .message = bandLabel + firstMessage,
                .remediationSteps = {
                    "Check the folder structure of the band",
                    "Choose the migration type matching the current structure, or force the migration",
                },
            };
        }

        Error error{
            .kind = ErrorKind::Migration,
            .migrationFailureKind = MigrationFailureKind::Unknown,
            .severity = Severity::High,
            .message = bandLabel + "no album migrated: " + firstMessage,
            .remediationSteps = { "Review the error reported for each failed album" },
        };
        if (!result.recoveryLog.empty())
            error.migrationFailureKind = toMigrationFailureKind(result.recoveryLog.back().kind);

        return error;
    }
} // namespace mcol::collection
