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

#include "migration/IFolderMover.hpp"

#include <system_error>

#include "core/ILogger.hpp"

namespace mcol::migration
{
    namespace
    {
        class FolderMover : public IFolderMover
        {
        private:
            void move(const std::filesystem::path& source, const std::filesystem::path& target) override
            {
                if (!std::filesystem::exists(source))
                    throw std::filesystem::filesystem_error{ "Cannot move album folder", source, target, std::make_error_code(std::errc::no_such_file_or_directory) };

                // rename() silently replaces an empty target directory
                if (std::filesystem::exists(target))
                    throw std::filesystem::filesystem_error{ "Cannot move album folder", source, target, std::make_error_code(std::errc::file_exists) };

                std::filesystem::create_directories(target.parent_path());
                std::filesystem::rename(source, target);

                MCOL_LOG(MIGRATION, DEBUG, "Moved '" << source.string() << "' to '" << target.string() << "'");
            }

            void merge(const std::filesystem::path& source, const std::filesystem::path& target) override
            {
                if (!std::filesystem::is_directory(source))
                    throw std::filesystem::filesystem_error{ "Cannot merge album folder", source, target, std::make_error_code(std::errc::no_such_file_or_directory) };
                if (!std::filesystem::is_directory(target))
                    throw std::filesystem::filesystem_error{ "Cannot merge album folder", source, target, std::make_error_code(std::errc::not_a_directory) };

                for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ source })
                {
                    const std::filesystem::path entryTarget{ target / entry.path().filename() };
                    if (std::filesystem::exists(entryTarget))
                        throw std::filesystem::filesystem_error{ "Cannot merge album folder", entry.path(), entryTarget, std::make_error_code(std::errc::file_exists) };

                    std::filesystem::rename(entry.path(), entryTarget);
                }
                std::filesystem::remove(source);

                MCOL_LOG(MIGRATION, DEBUG, "Merged '" << source.string() << "' into '" << target.string() << "'");
            }
        };
    } // namespace

    std::unique_ptr<IFolderMover> createFolderMover()
    {
        return std::make_unique<FolderMover>();
    }
} // namespace mcol::migration
