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

#include "migration/ErrorAnalyzer.hpp"

namespace mcol::migration
{
    namespace
    {
        void fillPermissionDenied(ErrorDetails& details)
        {
            details.severity = Severity::High;
            details.retryable = true;
            details.manualInterventionRequired = true;
            details.solutionSteps = {
                "Check permissions of '" + details.context.sourcePath.string() + "' and of '" + details.context.targetPath.parent_path().string() + "'",
                "Grant read and write access to the band folder",
                "Make sure no file of the album is read-only",
                "Retry the migration",
            };
        }

        void fillDiskSpaceInsufficient(ErrorDetails& details)
        {
            details.severity = Severity::Critical;
            details.retryable = false;
            details.manualInterventionRequired = true;
            details.solutionSteps = {
                "Free up disk space on the drive holding '" + details.context.targetPath.parent_path().string() + "'",
                "Delete unnecessary files or move them to another drive",
                "Retry the migration once enough space is available",
            };
        }

        void fillFileLocked(ErrorDetails& details)
        {
            details.severity = Severity::High;
            details.retryable = true;
            details.manualInterventionRequired = false;
            details.solutionSteps = {
                "Close the applications using the files of '" + details.context.sourcePath.string() + "'",
                "Wait for pending file operations to complete",
                "Retry the migration",
            };
        }

        void fillSourceNotFound(ErrorDetails& details)
        {
            details.severity = Severity::Medium;
            details.retryable = false;
            details.manualInterventionRequired = false;
            details.solutionSteps = {
                "Check that the album folder '" + details.context.sourcePath.string() + "' still exists",
                "Scan the collection again to refresh the album list",
                "Restore the album from a backup if needed",
            };
        }

        void fillTargetExists(ErrorDetails& details)
        {
            details.severity = Severity::Medium;
            details.retryable = true;
            details.manualInterventionRequired = false;
            details.solutionSteps = {
                "Target folder '" + details.context.targetPath.string() + "' already exists",
                "Remove or rename the existing folder",
                "Use the force option to merge the album into it",
                "Retry the migration",
            };
        }

        void fillUnknown(ErrorDetails& details)
        {
            details.severity = Severity::Medium;
            details.retryable = true;
            details.manualInterventionRequired = true;
            details.solutionSteps = {
                "Unexpected error: " + details.message,
                "Check the logs for more details",
                "Verify the integrity of the file system",
                "Retry the migration",
            };
        }
    } // namespace

    std::string_view migrationErrorKindToString(MigrationErrorKind kind)
    {
        switch (kind)
        {
        case MigrationErrorKind::PermissionDenied:
            return "permission_denied";
        case MigrationErrorKind::DiskSpaceInsufficient:
            return "disk_space_insufficient";
        case MigrationErrorKind::FileLocked:
            return "file_locked";
        case MigrationErrorKind::SourceNotFound:
            return "source_not_found";
        case MigrationErrorKind::TargetExists:
            return "target_exists";
        case MigrationErrorKind::Unknown:
            return "unknown";
        }

        return "unknown";
    }

    std::string_view severityToString(Severity severity)
    {
        switch (severity)
        {
        case Severity::Low:
            return "low";
        case Severity::Medium:
            return "medium";
        case Severity::High:
            return "high";
        case Severity::Critical:
            return "critical";
        }

        return "medium";
    }

    MigrationErrorKind classifyErrorCode(std::error_code ec)
    {
        if (!ec)
            return MigrationErrorKind::Unknown;

        const std::error_condition condition{ ec.default_error_condition() };
        if (condition == std::errc::permission_denied
            || condition == std::errc::operation_not_permitted
            || condition == std::errc::read_only_file_system)
            return MigrationErrorKind::PermissionDenied;
        if (condition == std::errc::no_space_on_device)
            return MigrationErrorKind::DiskSpaceInsufficient;
        if (condition == std::errc::device_or_resource_busy
            || condition == std::errc::text_file_busy)
            return MigrationErrorKind::FileLocked;
        if (condition == std::errc::no_such_file_or_directory)
            return MigrationErrorKind::SourceNotFound;
        if (condition == std::errc::file_exists
            || condition == std::errc::directory_not_empty)
            return MigrationErrorKind::TargetExists;

        return MigrationErrorKind::Unknown;
    }

    ErrorDetails analyzeError(const std::exception& error, const ErrorContext& context)
    {
        // std::filesystem::filesystem_error is a std::system_error
        if (const auto* systemError{ dynamic_cast<const std::system_error*>(&error) })
            return analyzeError(systemError->code(), systemError->what(), context);

        return analyzeError(std::error_code{}, error.what(), context);
    }

    ErrorDetails analyzeError(std::error_code ec, std::string_view message, const ErrorContext& context)
    {
        ErrorDetails details;
        details.kind = classifyErrorCode(ec);
        details.message = message;
        details.context = context;

        switch (details.kind)
        {
        case MigrationErrorKind::PermissionDenied:
            fillPermissionDenied(details);
            break;
        case MigrationErrorKind::DiskSpaceInsufficient:
            fillDiskSpaceInsufficient(details);
            break;
        case MigrationErrorKind::FileLocked:
            fillFileLocked(details);
            break;
        case MigrationErrorKind::SourceNotFound:
            fillSourceNotFound(details);
            break;
        case MigrationErrorKind::TargetExists:
            fillTargetExists(details);
            break;
        case MigrationErrorKind::Unknown:
            fillUnknown(details);
            break;
        }

        return details;
    }
} // namespace mcol::migration
