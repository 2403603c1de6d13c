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

#include <memory>

#include "scanner/ScanReport.hpp"

namespace mcol::storage
{
    class CollectionRepository;
}

namespace mcol::scanner
{
    class IScanner
    {
    public:
        virtual ~IScanner() = default;

        // Reconcile band documents and the collection index with the band folders
        // Throws ScanException if the music root cannot be explored
        virtual ScanReport scan() = 0;
    };

    std::unique_ptr<IScanner> createScanner(const storage::CollectionRepository& repository);
} // namespace mcol::scanner
