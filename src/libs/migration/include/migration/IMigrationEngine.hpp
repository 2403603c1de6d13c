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

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "migration/ErrorAnalyzer.hpp"
#include "migration/IFolderMover.hpp"
#include "migration/MigrationBackup.hpp"
#include "migration/RecoveryManager.hpp"
#include "scanner/StructureDetector.hpp"
#include "storage/BandDocument.hpp"

namespace mcol::storage
{
    class CollectionRepository;
}

namespace mcol::migration
{
    enum class MigrationType
    {
        DefaultToEnhanced,  // "YYYY - Name" -> "Type/YYYY - Name"
        LegacyToDefault,    // "Name" -> "YYYY - Name"
        MixedToEnhanced,    // every album nested in its type folder
        EnhancedToDefault,  // "Type/YYYY - Name" -> "YYYY - Name"
    };
    std::string_view migrationTypeToString(MigrationType type);
    std::optional<MigrationType> migrationTypeFromString(std::string_view str);

    // Structure a band folder must have for the migration to apply
    scanner::StructureType getExpectedStructureType(MigrationType type);

    enum class MigrationStatus
    {
        Success,
        PartialSuccess,
        Failed,
        RolledBack,
    };
    std::string_view migrationStatusToString(MigrationStatus status);

    struct MigrationOperation
    {
        std::string albumName;
        std::filesystem::path sourcePath; // relative to the band folder
        std::filesystem::path targetPath; // relative to the band folder
        storage::AlbumType albumType{ storage::AlbumType::Album };
        std::string operationType;        // "move" or "rename"
        bool completed{};
        std::optional<std::string> errorMessage;

        bool operator==(const MigrationOperation&) const = default;
    };

    struct MigrationRequest
    {
        MigrationType type{ MigrationType::DefaultToEnhanced };
        bool dryRun{};
        std::map<std::string, storage::AlbumType> albumTypeOverrides; // by folder or album name
        bool backupOriginal{ true };
        bool force{};                        // skip structure validation, continue past failed albums
        std::vector<std::string> excludeAlbums; // folder or album names
    };

    struct MigrationResult
    {
        MigrationStatus status{ MigrationStatus::Failed };
        std::string bandName;
        MigrationType migrationType{ MigrationType::DefaultToEnhanced };
        std::vector<MigrationOperation> operations;
        std::size_t albumsMigrated{};
        std::size_t albumsFailed{};
        double migrationTimeSeconds{};
        std::optional<BackupInfo> backupInfo;
        std::vector<std::string> errorMessages;
        bool dryRun{};
        bool rollbackAvailable{};
        std::vector<RecoveryLogEntry> recoveryLog;
        std::optional<ErrorDetails> abortError; // set when the migration was rolled back
    };

    // Called after each executed operation, percentage is in 0..100
    using ProgressCallback = std::function<void(std::string_view message, double percentage)>;

    class IMigrationEngine
    {
    public:
        virtual ~IMigrationEngine() = default;

        // Operations are planned in folder name order
        // Throws MigrationException if the band folder does not exist, RollbackException if a failed migration cannot be undone
        virtual MigrationResult migrate(std::string_view bandName, const MigrationRequest& request, ProgressCallback progressCallback = {}) = 0;
    };

    // Default folder mover and lock probe are used if none is given
    std::unique_ptr<IMigrationEngine> createMigrationEngine(const storage::CollectionRepository& repository, const RecoverySettings& recoverySettings, std::unique_ptr<IFolderMover> folderMover = {}, std::unique_ptr<ILockProbe> lockProbe = {});
} // namespace mcol::migration
