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

#include <string>

#include "scanner/IScanner.hpp"
#include "storage/BandDocument.hpp"
#include "storage/CollectionIndex.hpp"

namespace mcol::scanner
{
    class Scanner : public IScanner
    {
    public:
        Scanner(const storage::CollectionRepository& repository);
        ~Scanner() override = default;
        Scanner(const Scanner&) = delete;
        Scanner& operator=(const Scanner&) = delete;

        ScanReport scan() override;

    private:
        storage::CollectionIndex loadPreviousIndex() const;
        storage::CollectionIndexEntry scanBand(const std::string& bandFolder, const storage::CollectionIndex& previousIndex, ScanReport& report);
        storage::BandDocument loadOrCreateBandDocument(const std::string& bandFolder, ScanReport& report);

        const storage::CollectionRepository& _repository;
    };
} // namespace mcol::scanner
