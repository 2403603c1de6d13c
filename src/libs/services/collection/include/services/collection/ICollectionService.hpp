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
#include <optional>
#include <string_view>

#include "migration/IMigrationEngine.hpp"
#include "scanner/ScanReport.hpp"
#include "services/collection/CollectionSettings.hpp"
#include "services/collection/Result.hpp"
#include "storage/BackupCleanup.hpp"
#include "storage/BandDocument.hpp"
#include "storage/CacheValidator.hpp"
#include "storage/CollectionIndex.hpp"

namespace mcol::collection
{
    // Entry point of the collection: no exception escapes, failures are returned as errors
    class ICollectionService
    {
    public:
        virtual ~ICollectionService() = default;

        virtual const CollectionSettings& getSettings() const = 0;

        virtual Result<scanner::ScanReport> scan() = 0;

        // Saves the band document and refreshes its index entry
        virtual Result<storage::BandDocument> saveDocument(std::string_view bandName, const storage::BandDocument& document) = 0;

        // Similar bands are sorted between present and missing using the index
        // The band must already have a document
        virtual Result<storage::BandDocument> saveAnalysis(std::string_view bandName, const storage::BandAnalysis& analysis) = 0;

        virtual Result<std::optional<storage::BandDocument>> loadDocument(std::string_view bandName) = 0;
        virtual Result<storage::BandCacheReport> getCacheReport(std::string_view bandName) = 0;

        virtual Result<std::optional<storage::CollectionIndex>> loadIndex() = 0;
        // Replaces the stored index
        virtual Result<storage::CollectionIndex> updateIndex(const storage::CollectionIndex& index) = 0;

        // Rolled back and partial migrations are returned as values, see getMigrationError
        virtual Result<migration::MigrationResult> migrate(std::string_view bandName, const migration::MigrationRequest& request, migration::ProgressCallback progressCallback = {}) = 0;

        virtual Result<storage::CollectionValidation> validateCollection() = 0;
        virtual Result<storage::CollectionSchemaMigration> migrateSchemas(std::string_view targetVersion) = 0;

        // Keeps the settings' maxBackups most recent dated backups of each document
        virtual Result<storage::BackupCleanupReport> cleanupBackups() = 0;
    };

    std::unique_ptr<ICollectionService> createCollectionService(const CollectionSettings& settings);
} // namespace mcol::collection
