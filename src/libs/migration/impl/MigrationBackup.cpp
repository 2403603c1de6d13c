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

#include "migration/MigrationBackup.hpp"

#include <vector>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "migration/Exception.hpp"
#include "storage/CollectionLayout.hpp"

namespace mcol::migration
{
    namespace
    {
        bool isLockFile(const std::filesystem::path& path)
        {
            return path.extension() == ".lock";
        }

        bool isBackedUp(const std::filesystem::path& path)
        {
            return !isMigrationBackupFolder(path) && !isLockFile(path);
        }

        std::filesystem::path getBackupFolderPath(const std::filesystem::path& bandFolder, const Wt::WDateTime& now)
        {
            const std::string baseName{ std::string{ storage::layout::migrationBackupPrefix } + now.toString("yyyyMMdd_hhmmss").toUTF8() };

            std::filesystem::path backupFolder{ bandFolder / baseName };
            for (std::size_t i{ 2 }; std::filesystem::exists(backupFolder); ++i)
                backupFolder = bandFolder / (baseName + "_" + std::to_string(i));

            return backupFolder;
        }
    } // namespace

    bool isMigrationBackupFolder(const std::filesystem::path& path)
    {
        return path.filename().string().starts_with(storage::layout::migrationBackupPrefix);
    }

    BackupInfo createMigrationBackup(const std::filesystem::path& bandFolder, scanner::StructureType structureType)
    {
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        BackupInfo backup;
        backup.timestamp = core::stringUtils::toISO8601String(now);
        backup.backupFolderPath = getBackupFolderPath(bandFolder, now);
        backup.originalStructureType = structureType;

        try
        {
            core::pathUtils::copyDirectoryContent(bandFolder, backup.backupFolderPath, [&](const std::filesystem::path& path) { return isBackedUp(path); });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            std::error_code ec;
            std::filesystem::remove_all(backup.backupFolderPath, ec);
            throw MigrationException{ "Cannot create migration backup of '" + bandFolder.string() + "': " + e.what() };
        }

        const std::filesystem::path metadataBackupPath{ backup.backupFolderPath / storage::layout::bandDocumentFileName };
        if (std::filesystem::exists(metadataBackupPath))
            backup.metadataBackupPath = metadataBackupPath;

        MCOL_LOG(MIGRATION, INFO, "Created migration backup '" << backup.backupFolderPath.string() << "'");
        return backup;
    }

    void restoreMigrationBackup(const std::filesystem::path& bandFolder, const BackupInfo& backup)
    {
        MCOL_LOG(MIGRATION, INFO, "Restoring '" << bandFolder.string() << "' from '" << backup.backupFolderPath.string() << "'");

        if (!std::filesystem::is_directory(backup.backupFolderPath))
            throw RollbackException{ "Migration backup '" + backup.backupFolderPath.string() + "' not found" };

        try
        {
            std::vector<std::filesystem::path> entries;
            for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ bandFolder })
            {
                if (isBackedUp(entry.path()))
                    entries.push_back(entry.path());
            }
            for (const std::filesystem::path& entry : entries)
                std::filesystem::remove_all(entry);

            core::pathUtils::copyDirectoryContent(backup.backupFolderPath, bandFolder);
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw RollbackException{ "Cannot restore '" + bandFolder.string() + "' from '" + backup.backupFolderPath.string() + "': " + e.what() };
        }
    }
} // namespace mcol::migration
