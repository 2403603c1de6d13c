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

#include "migration/IMigrationEngine.hpp"
#include "services/collection/ICollectionService.hpp"
#include "storage/AtomicFileStore.hpp"
#include "storage/CacheValidator.hpp"
#include "storage/CollectionRepository.hpp"

namespace mcol::collection
{
    class CollectionService : public ICollectionService
    {
    public:
        CollectionService(const CollectionSettings& settings);
        ~CollectionService() override = default;
        CollectionService(const CollectionService&) = delete;
        CollectionService& operator=(const CollectionService&) = delete;

    private:
        const CollectionSettings& getSettings() const override { return _settings; }

        Result<scanner::ScanReport> scan() override;
        Result<storage::BandDocument> saveDocument(std::string_view bandName, const storage::BandDocument& document) override;
        Result<storage::BandDocument> saveAnalysis(std::string_view bandName, const storage::BandAnalysis& analysis) override;
        Result<std::optional<storage::BandDocument>> loadDocument(std::string_view bandName) override;
        Result<storage::BandCacheReport> getCacheReport(std::string_view bandName) override;
        Result<std::optional<storage::CollectionIndex>> loadIndex() override;
        Result<storage::CollectionIndex> updateIndex(const storage::CollectionIndex& index) override;
        Result<migration::MigrationResult> migrate(std::string_view bandName, const migration::MigrationRequest& request, migration::ProgressCallback progressCallback) override;
        Result<storage::CollectionValidation> validateCollection() override;
        Result<storage::CollectionSchemaMigration> migrateSchemas(std::string_view targetVersion) override;
        Result<storage::BackupCleanupReport> cleanupBackups() override;

        void refreshIndexEntry(std::string_view bandName, const storage::BandDocument& document);

        const CollectionSettings _settings;
        const storage::AtomicFileStore _store;
        const storage::CacheValidator _cacheValidator;
        const storage::CollectionRepository _repository;
        const std::unique_ptr<migration::IMigrationEngine> _migrationEngine;
    };
} // namespace mcol::collection
