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

#include "storage/BackupCleanup.hpp"

#include <algorithm>
#include <functional>
#include <map>

#include "core/ILogger.hpp"
#include "storage/CollectionLayout.hpp"

namespace mcol::storage
{
    namespace
    {
        constexpr std::string_view datedBackupMarker{ ".backup_" };

        void cleanupFolder(const std::filesystem::path& folder, std::size_t maxBackups, BackupCleanupReport& report)
        {
            // document file name -> its dated backups
            std::map<std::string, std::vector<std::filesystem::path>> backupsByDocument;

            std::error_code ec;
            for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ folder, ec })
            {
                if (!entry.is_regular_file(ec))
                    continue;

                const std::string fileName{ entry.path().filename().string() };
                const std::string::size_type markerPos{ fileName.rfind(datedBackupMarker) };
                if (markerPos == std::string::npos || markerPos == 0)
                    continue;

                backupsByDocument[fileName.substr(0, markerPos)].push_back(entry.path());
            }
            if (ec)
            {
                report.errors.push_back("Cannot list '" + folder.string() + "': " + ec.message());
                return;
            }

            for (auto& [document, backups] : backupsByDocument)
            {
                // timestamps sort lexicographically, newest first
                std::sort(std::begin(backups), std::end(backups), std::greater<>{});

                for (std::size_t i{}; i < backups.size(); ++i)
                {
                    if (i < maxBackups)
                    {
                        report.keptFiles++;
                        continue;
                    }

                    if (std::filesystem::remove(backups[i], ec))
                    {
                        MCOL_LOG(STORAGE, DEBUG, "Removed old backup '" << backups[i].string() << "'");
                        report.removedFiles.push_back(backups[i]);
                    }
                    else if (ec)
                        report.errors.push_back("Cannot remove '" + backups[i].string() + "': " + ec.message());
                }
            }
        }
    } // namespace

    BackupCleanupReport cleanupDatedBackups(const std::filesystem::path& musicRoot, std::size_t maxBackups)
    {
        BackupCleanupReport report;

        cleanupFolder(musicRoot, maxBackups, report);
        for (const std::string& bandFolder : layout::listBandFolders(musicRoot))
            cleanupFolder(layout::getBandFolder(musicRoot, bandFolder), maxBackups, report);

        MCOL_LOG(STORAGE, INFO, "Backup cleanup: removed " << report.removedFiles.size() << " file(s), kept " << report.keptFiles);
        return report;
    }
} // namespace mcol::storage
