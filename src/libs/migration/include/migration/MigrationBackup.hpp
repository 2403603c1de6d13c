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

#include <filesystem>
#include <optional>
#include <string>

#include "scanner/StructureDetector.hpp"

namespace mcol::migration
{
    // Snapshot of a band folder taken before a migration
    struct BackupInfo
    {
        std::string timestamp;
        std::filesystem::path backupFolderPath; // "<Band>/.migration_backup_<yyyyMMdd_hhmmss>"
        scanner::StructureType originalStructureType{ scanner::StructureType::Unknown };
        std::optional<std::filesystem::path> metadataBackupPath;
    };

    bool isMigrationBackupFolder(const std::filesystem::path& path);

    // Copies the whole band folder, other migration backups and lock files excluded
    // Throws MigrationException
    BackupInfo createMigrationBackup(const std::filesystem::path& bandFolder, scanner::StructureType structureType);

    // Replace the content of the band folder by the snapshot, the snapshot is kept
    // Throws RollbackException
    void restoreMigrationBackup(const std::filesystem::path& bandFolder, const BackupInfo& backup);
} // namespace mcol::migration
