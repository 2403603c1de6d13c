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
#include <optional>
#include <vector>

#include "migration/IMigrationEngine.hpp"

namespace mcol::scanner
{
    struct AlbumDiscovery;
}

namespace mcol::migration
{
    class MigrationEngine : public IMigrationEngine
    {
    public:
        MigrationEngine(const storage::CollectionRepository& repository, const RecoverySettings& recoverySettings, std::unique_ptr<IFolderMover> folderMover, std::unique_ptr<ILockProbe> lockProbe);
        ~MigrationEngine() override = default;
        MigrationEngine(const MigrationEngine&) = delete;
        MigrationEngine& operator=(const MigrationEngine&) = delete;

        MigrationResult migrate(std::string_view bandName, const MigrationRequest& request, ProgressCallback progressCallback) override;

    private:
        std::optional<storage::BandDocument> loadBandDocument(std::string_view bandName) const;
        std::vector<MigrationOperation> planOperations(const scanner::AlbumDiscovery& discovery, const std::optional<storage::BandDocument>& document, const MigrationRequest& request) const;

        // Returns the error that aborted the migration, if any
        std::optional<ErrorDetails> executeOperations(const std::filesystem::path& bandFolder, const MigrationRequest& request, MigrationResult& result, RecoveryManager& recoveryManager, const ProgressCallback& progressCallback);
        void rollback(const std::filesystem::path& bandFolder, MigrationResult& result);
        void undoOperations(const std::filesystem::path& bandFolder, const std::vector<MigrationOperation>& operations);
        void updateMetadata(std::string_view bandName, const std::filesystem::path& bandFolder, const std::vector<MigrationOperation>& operations);

        const storage::CollectionRepository& _repository;
        const RecoverySettings _recoverySettings;
        std::unique_ptr<IFolderMover> _folderMover;
        std::unique_ptr<ILockProbe> _lockProbe;
    };
} // namespace mcol::migration
