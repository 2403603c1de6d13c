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
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "migration/Exception.hpp"
#include "scanner/Exception.hpp"
#include "services/collection/Error.hpp"
#include "services/collection/Result.hpp"
#include "storage/Exception.hpp"

namespace mcol::collection::details
{
    inline Error createError(ErrorKind kind, Severity severity, std::string_view message, std::vector<std::string> remediationSteps)
    {
        return Error{
            .kind = kind,
            .migrationFailureKind = std::nullopt,
            .severity = severity,
            .message = std::string{ message },
            .remediationSteps = std::move(remediationSteps),
        };
    }

    // Runs func and turns the collection exceptions into errors
    template<typename T, typename Func>
    Result<T> invoke(std::string_view operationName, Func&& func)
    {
        std::optional<Error> error;

        try
        {
            return Result<T>{ func() };
        }
        catch (const storage::ValidationException& e)
        {
            error = createError(ErrorKind::Validation, Severity::Medium, e.what(), { "Fix the invalid values and submit them again" });
        }
        catch (const storage::LockTimeoutException& e)
        {
            error = createError(ErrorKind::Storage, Severity::High, e.what(), { "Wait for the other operation on this file to complete, then retry", "Remove the lock file '" + e.getPath().string() + "' if no other process uses the collection" });
        }
        catch (const storage::DocumentCorruptException& e)
        {
            error = createError(ErrorKind::Storage, Severity::High, e.what(), { "Restore the document from its .backup file", "Or scan the collection to rebuild it from the band folders" });
        }
        catch (const storage::DocumentNotFoundException& e)
        {
            error = createError(ErrorKind::Storage, Severity::Medium, e.what(), { "Scan the collection or save the band metadata first" });
        }
        catch (const storage::Exception& e)
        {
            error = createError(ErrorKind::Storage, Severity::High, e.what(), { "Check the permissions and free space of the music root" });
        }
        catch (const scanner::ScanException& e)
        {
            error = createError(ErrorKind::Scanning, Severity::High, e.what(), { "Check that the music root exists and can be read" });
        }
        catch (const migration::RollbackException& e)
        {
            error = createError(ErrorKind::Migration, Severity::Critical, e.what(), { "Do not run another migration on this band", "Restore the band folder manually from its .migration_backup_ folder" });
            error->migrationFailureKind = MigrationFailureKind::Rollback;
        }
        catch (const migration::MigrationException& e)
        {
            error = createError(ErrorKind::Migration, Severity::Medium, e.what(), { "Check the band name and its folder" });
            error->migrationFailureKind = MigrationFailureKind::Unknown;
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            error = createError(ErrorKind::Storage, Severity::High, e.what(), { "Check the permissions of '" + e.path1().string() + "'" });
        }
        catch (const core::McolException& e)
        {
            error = createError(ErrorKind::Storage, Severity::High, e.what(), { "Check the permissions and free space of the music root", "Retry the operation" });
        }
        catch (const std::exception& e)
        {
            error = createError(ErrorKind::Storage, Severity::Critical, std::string{ "Unexpected error: " } + e.what(), { "Retry the operation", "Report the problem with the log output if it persists" });
        }

        MCOL_LOG(COLLECTION, ERROR, operationName << " failed: [" << errorKindToString(error->kind) << "] " << error->message);
        return Result<T>{ std::move(*error) };
    }
} // namespace mcol::collection::details
