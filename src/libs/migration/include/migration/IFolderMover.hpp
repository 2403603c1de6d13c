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
#include <memory>

namespace mcol::migration
{
    class IFolderMover
    {
    public:
        virtual ~IFolderMover() = default;

        // Parent folders of target are created as needed
        // Throws std::filesystem::filesystem_error, with file_exists if target already exists
        virtual void move(const std::filesystem::path& source, const std::filesystem::path& target) = 0;

        // Move the entries of source into the existing target folder, then remove source
        // Throws std::filesystem::filesystem_error, with file_exists if an entry already exists in target
        virtual void merge(const std::filesystem::path& source, const std::filesystem::path& target) = 0;
    };

    std::unique_ptr<IFolderMover> createFolderMover();
} // namespace mcol::migration
