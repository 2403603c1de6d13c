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

#include "MigrationEngine.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include <Wt/WDate.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "migration/Exception.hpp"
#include "scanner/AlbumDiscovery.hpp"
#include "scanner/AlbumFolderParser.hpp"
#include "scanner/AlbumReconciliation.hpp"
#include "storage/CollectionIndex.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/CollectionRepository.hpp"
#include "storage/Exception.hpp"

namespace mcol::migration
{
    namespace
    {
        bool matchesAlbum(std::string_view name, const scanner::DiscoveredAlbum& album)
        {
            const std::string lowerName{ core::stringUtils::stringToLower(name) };
            return lowerName == core::stringUtils::stringToLower(album.folderName)
                || lowerName == core::stringUtils::stringToLower(album.parsed.albumName);
        }

        bool isExcluded(const MigrationRequest& request, const scanner::DiscoveredAlbum& album)
        {
            return std::any_of(std::cbegin(request.excludeAlbums), std::cend(request.excludeAlbums), [&](const std::string& name) { return matchesAlbum(name, album); });
        }

        std::optional<storage::AlbumType> getTypeOverride(const MigrationRequest& request, const scanner::DiscoveredAlbum& album)
        {
            for (const auto& [name, type] : request.albumTypeOverrides)
            {
                if (matchesAlbum(name, album))
                    return type;
            }

            return std::nullopt;
        }

        const storage::AlbumRecord* findStoredAlbum(const std::optional<storage::BandDocument>& document, const scanner::DiscoveredAlbum& album)
        {
            if (!document)
                return nullptr;

            const std::string folderPath{ album.folderPath.generic_string() };
            for (const storage::AlbumRecord& record : document->albums)
            {
                if (record.folderPath == folderPath)
                    return &record;
            }

            const std::string albumName{ core::stringUtils::stringToLower(album.parsed.albumName) };
            for (const storage::AlbumRecord& record : document->albums)
            {
                if (core::stringUtils::stringToLower(record.albumName) == albumName)
                    return &record;
            }

            return nullptr;
        }

        storage::AlbumType getAlbumType(const MigrationRequest& request, const scanner::DiscoveredAlbum& album, const storage::AlbumRecord* storedAlbum)
        {
            if (const std::optional<storage::AlbumType> type{ getTypeOverride(request, album) })
                return *type;
            if (album.typeFolderType)
                return *album.typeFolderType;
            if (storedAlbum)
                return storedAlbum->type;

            return album.type;
        }

        std::string getTargetYear(MigrationType type, const scanner::DiscoveredAlbum& album, const storage::AlbumRecord* storedAlbum)
        {
            if (album.parsed.hasYear() || type != MigrationType::LegacyToDefault)
                return album.parsed.year;

            if (storedAlbum && scanner::isValidYear(storedAlbum->year))
                return storedAlbum->year;

            return std::to_string(Wt::WDate::currentDate().year());
        }

        std::filesystem::path getTargetPath(MigrationType type, const scanner::DiscoveredAlbum& album, storage::AlbumType albumType, std::string_view year)
        {
            const std::string folderName{ scanner::formatAlbumFolderName(album.parsed.albumName, year, album.parsed.edition) };

            switch (type)
            {
            case MigrationType::DefaultToEnhanced:
            case MigrationType::MixedToEnhanced:
                return std::filesystem::path{ scanner::getTypeFolderName(albumType) } / folderName;
            case MigrationType::LegacyToDefault:
                return album.folderPath.parent_path() / folderName;
            case MigrationType::EnhancedToDefault:
                return std::filesystem::path{ folderName };
            }

            return album.folderPath;
        }

        void removeEmptyTypeFolders(const std::filesystem::path& bandFolder)
        {
            std::vector<std::filesystem::path> emptyFolders;
            for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ bandFolder })
            {
                std::error_code ec;
                if (entry.is_directory(ec) && scanner::getTypeFolderType(entry.path().filename().string()) && std::filesystem::is_empty(entry.path(), ec))
                    emptyFolders.push_back(entry.path());
            }

            for (const std::filesystem::path& folder : emptyFolders)
            {
                std::error_code ec;
                std::filesystem::remove(folder, ec);
                if (ec)
                    MCOL_LOG(MIGRATION, WARNING, "Cannot remove empty type folder '" << folder.string() << "': " << ec.message());
                else
                    MCOL_LOG(MIGRATION, DEBUG, "Removed empty type folder '" << folder.string() << "'");
            }
        }

        void setElapsedTime(MigrationResult& result, std::chrono::steady_clock::time_point start)
        {
            result.migrationTimeSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        }
    } // namespace

    std::string_view migrationTypeToString(MigrationType type)
    {
        switch (type)
        {
        case MigrationType::DefaultToEnhanced:
            return "default_to_enhanced";
        case MigrationType::LegacyToDefault:
            return "legacy_to_default";
        case MigrationType::MixedToEnhanced:
            return "mixed_to_enhanced";
        case MigrationType::EnhancedToDefault:
            return "enhanced_to_default";
        }

        return "";
    }

    std::optional<MigrationType> migrationTypeFromString(std::string_view str)
    {
        for (MigrationType type : { MigrationType::DefaultToEnhanced, MigrationType::LegacyToDefault, MigrationType::MixedToEnhanced, MigrationType::EnhancedToDefault })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, migrationTypeToString(type)))
                return type;
        }

        return std::nullopt;
    }

    scanner::StructureType getExpectedStructureType(MigrationType type)
    {
        switch (type)
        {
        case MigrationType::DefaultToEnhanced:
            return scanner::StructureType::Default;
        case MigrationType::LegacyToDefault:
            return scanner::StructureType::Legacy;
        case MigrationType::MixedToEnhanced:
            return scanner::StructureType::Mixed;
        case MigrationType::EnhancedToDefault:
            return scanner::StructureType::Enhanced;
        }

        return scanner::StructureType::Unknown;
    }

    std::string_view migrationStatusToString(MigrationStatus status)
    {
        switch (status)
        {
        case MigrationStatus::Success:
            return "success";
        case MigrationStatus::PartialSuccess:
            return "partial_success";
        case MigrationStatus::Failed:
            return "failed";
        case MigrationStatus::RolledBack:
            return "rolled_back";
        }

        return "";
    }

    std::unique_ptr<IMigrationEngine> createMigrationEngine(const storage::CollectionRepository& repository, const RecoverySettings& recoverySettings, std::unique_ptr<IFolderMover> folderMover, std::unique_ptr<ILockProbe> lockProbe)
    {
        if (!folderMover)
            folderMover = createFolderMover();
        if (!lockProbe)
            lockProbe = createFileLockProbe();

        return std::make_unique<MigrationEngine>(repository, recoverySettings, std::move(folderMover), std::move(lockProbe));
    }

    MigrationEngine::MigrationEngine(const storage::CollectionRepository& repository, const RecoverySettings& recoverySettings, std::unique_ptr<IFolderMover> folderMover, std::unique_ptr<ILockProbe> lockProbe)
        : _repository{ repository }
        , _recoverySettings{ recoverySettings }
        , _folderMover{ std::move(folderMover) }
        , _lockProbe{ std::move(lockProbe) }
    {
    }

    MigrationResult MigrationEngine::migrate(std::string_view bandName, const MigrationRequest& request, ProgressCallback progressCallback)
    {
        const auto start{ std::chrono::steady_clock::now() };

        MigrationResult result;
        result.bandName = bandName;
        result.migrationType = request.type;
        result.dryRun = request.dryRun;

        const std::filesystem::path bandFolder{ storage::layout::getBandFolder(_repository.getMusicRoot(), bandName) };
        if (!std::filesystem::is_directory(bandFolder))
            throw MigrationException{ "Band folder '" + bandFolder.string() + "' not found" };

        MCOL_LOG(MIGRATION, INFO, "Band '" << bandName << "': starting " << migrationTypeToString(request.type) << " migration" << (request.dryRun ? " (dry run)" : ""));

        scanner::AlbumDiscovery discovery;
        try
        {
            discovery = scanner::discoverAlbums(bandFolder);
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw MigrationException{ std::string{ "Cannot explore band folder: " } + e.what() };
        }

        const scanner::FolderStructure structure{ scanner::detectFolderStructure(discovery) };
        const scanner::StructureType expectedStructure{ getExpectedStructureType(request.type) };
        if (!request.force && structure.type != expectedStructure)
        {
            result.errorMessages.push_back("Migration '" + std::string{ migrationTypeToString(request.type) } + "' does not apply to a '" + std::string{ scanner::structureTypeToString(structure.type) }
                                           + "' folder structure (expected '" + std::string{ scanner::structureTypeToString(expectedStructure) } + "')");
            MCOL_LOG(MIGRATION, WARNING, "Band '" << bandName << "': " << result.errorMessages.back());

            result.status = MigrationStatus::Failed;
            setElapsedTime(result, start);
            return result;
        }

        result.operations = planOperations(discovery, loadBandDocument(bandName), request);
        MCOL_LOG(MIGRATION, DEBUG, "Band '" << bandName << "': " << result.operations.size() << " operation(s) planned");

        if (request.dryRun || result.operations.empty())
        {
            result.status = MigrationStatus::Success;
            setElapsedTime(result, start);
            return result;
        }

        if (request.backupOriginal)
        {
            result.backupInfo = createMigrationBackup(bandFolder, structure.type);
            result.rollbackAvailable = true;
        }

        RecoveryManager recoveryManager{ _recoverySettings, *_lockProbe };
        if (const std::optional<ErrorDetails> abortError{ executeOperations(bandFolder, request, result, recoveryManager, progressCallback) })
        {
            MCOL_LOG(MIGRATION, ERROR, "Band '" << bandName << "': migration aborted on album '" << abortError->context.albumName << "', rolling back");

            rollback(bandFolder, result);
            recoveryManager.recordRollback(abortError->context.albumName, abortError->kind, "Band folder restored to its pre-migration state");

            result.recoveryLog = recoveryManager.getLog();
            result.abortError = abortError;
            result.status = MigrationStatus::RolledBack;
            setElapsedTime(result, start);
            return result;
        }

        removeEmptyTypeFolders(bandFolder);

        try
        {
            updateMetadata(bandName, bandFolder, result.operations);
        }
        catch (const storage::Exception& e)
        {
            // next scan reconciles the document with the folders
            result.errorMessages.push_back(std::string{ "Cannot update band metadata: " } + e.what());
            MCOL_LOG(MIGRATION, ERROR, "Band '" << bandName << "': " << result.errorMessages.back());
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            result.errorMessages.push_back(std::string{ "Cannot update band metadata: " } + e.what());
            MCOL_LOG(MIGRATION, ERROR, "Band '" << bandName << "': " << result.errorMessages.back());
        }

        result.recoveryLog = recoveryManager.getLog();
        if (result.albumsFailed == 0)
            result.status = MigrationStatus::Success;
        else if (result.albumsMigrated > 0)
            result.status = MigrationStatus::PartialSuccess;
        else
            result.status = MigrationStatus::Failed;

        setElapsedTime(result, start);

        MCOL_LOG(MIGRATION, INFO, "Band '" << bandName << "': migration " << migrationStatusToString(result.status) << ", " << result.albumsMigrated << " album(s) migrated, " << result.albumsFailed << " failed");
        return result;
    }

    std::optional<storage::BandDocument> MigrationEngine::loadBandDocument(std::string_view bandName) const
    {
        try
        {
            return _repository.loadBandDocument(bandName);
        }
        catch (const storage::DocumentCorruptException& e)
        {
            MCOL_LOG(MIGRATION, WARNING, "Band '" << bandName << "': ignoring unreadable metadata: " << e.what());
        }
        catch (const storage::ValidationException& e)
        {
            MCOL_LOG(MIGRATION, WARNING, "Band '" << bandName << "': ignoring invalid metadata: " << e.what());
        }

        return std::nullopt;
    }

    std::vector<MigrationOperation> MigrationEngine::planOperations(const scanner::AlbumDiscovery& discovery, const std::optional<storage::BandDocument>& document, const MigrationRequest& request) const
    {
        std::vector<MigrationOperation> operations;

        for (const scanner::DiscoveredAlbum& album : discovery.albums)
        {
            if (isExcluded(request, album))
            {
                MCOL_LOG(MIGRATION, DEBUG, "Excluding album folder '" << album.folderPath.string() << "'");
                continue;
            }

            const storage::AlbumRecord* storedAlbum{ findStoredAlbum(document, album) };
            const storage::AlbumType albumType{ getAlbumType(request, album, storedAlbum) };
            const std::filesystem::path targetPath{ getTargetPath(request.type, album, albumType, getTargetYear(request.type, album, storedAlbum)) };
            if (targetPath == album.folderPath)
                continue;

            MigrationOperation operation;
            operation.albumName = album.parsed.albumName;
            operation.sourcePath = album.folderPath;
            operation.targetPath = targetPath;
            operation.albumType = albumType;
            operation.operationType = targetPath.parent_path() == album.folderPath.parent_path() ? "rename" : "move";

            operations.push_back(std::move(operation));
        }

        return operations;
    }

    std::optional<ErrorDetails> MigrationEngine::executeOperations(const std::filesystem::path& bandFolder, const MigrationRequest& request, MigrationResult& result, RecoveryManager& recoveryManager, const ProgressCallback& progressCallback)
    {
        std::optional<ErrorDetails> abortError;

        std::size_t processedCount{};
        for (MigrationOperation& operation : result.operations)
        {
            const std::filesystem::path source{ bandFolder / operation.sourcePath };
            const std::filesystem::path target{ bandFolder / operation.targetPath };

            try
            {
                _folderMover->move(source, target);
                operation.completed = true;
            }
            catch (const std::exception& e)
            {
                const ErrorDetails error{ analyzeError(e, ErrorContext{ operation.albumName, source, target }) };
                const bool mergeIntoTarget{ request.force && error.kind == MigrationErrorKind::TargetExists };

                const RecoveryOutcome outcome{ recoveryManager.recover(
                    error, [&] {
                        if (mergeIntoTarget)
                            _folderMover->merge(source, target);
                        else
                            _folderMover->move(source, target);
                    },
                    request.force) };

                if (outcome.isResolved() && !outcome.isSkipped())
                {
                    operation.completed = true;
                }
                else
                {
                    operation.errorMessage = outcome.lastError.message;
                    result.errorMessages.push_back("Failed to migrate album '" + operation.albumName + "': " + outcome.message);
                    if (!outcome.isResolved() && !request.force)
                        abortError = outcome.lastError;
                }
            }

            if (operation.completed)
                result.albumsMigrated++;
            else
                result.albumsFailed++;

            processedCount++;
            if (progressCallback)
                progressCallback("Migrated album '" + operation.albumName + "'" + (operation.completed ? "" : " (failed)"), static_cast<double>(processedCount) * 100.0 / static_cast<double>(result.operations.size()));

            if (abortError)
                break;
        }

        return abortError;
    }

    void MigrationEngine::rollback(const std::filesystem::path& bandFolder, MigrationResult& result)
    {
        if (result.backupInfo)
            restoreMigrationBackup(bandFolder, *result.backupInfo);
        else
            undoOperations(bandFolder, result.operations);

        for (MigrationOperation& operation : result.operations)
        {
            if (!operation.completed)
                continue;

            operation.completed = false;
            operation.errorMessage = "rolled back";
        }
        result.albumsMigrated = 0;

        MCOL_LOG(MIGRATION, INFO, "Band folder '" << bandFolder.string() << "' rolled back");
    }

    void MigrationEngine::undoOperations(const std::filesystem::path& bandFolder, const std::vector<MigrationOperation>& operations)
    {
        for (auto it{ std::crbegin(operations) }; it != std::crend(operations); ++it)
        {
            if (!it->completed)
                continue;

            try
            {
                _folderMover->move(bandFolder / it->targetPath, bandFolder / it->sourcePath);
            }
            catch (const std::exception& e)
            {
                throw RollbackException{ "Cannot move album '" + it->albumName + "' back to '" + it->sourcePath.string() + "': " + e.what() };
            }
        }

        removeEmptyTypeFolders(bandFolder);
    }

    void MigrationEngine::updateMetadata(std::string_view bandName, const std::filesystem::path& bandFolder, const std::vector<MigrationOperation>& operations)
    {
        std::optional<storage::BandDocument> document{ loadBandDocument(bandName) };
        if (!document)
        {
            document.emplace();
            document->bandName = bandName;
        }

        const scanner::AlbumDiscovery discovery{ scanner::discoverAlbums(bandFolder) };
        scanner::reconcileAlbums(*document, discovery.albums);

        // albums moved out of a type folder keep the type they had
        for (const MigrationOperation& operation : operations)
        {
            if (!operation.completed)
                continue;

            const std::string folderPath{ operation.targetPath.generic_string() };
            auto it{ std::find_if(std::begin(document->albums), std::end(document->albums), [&](const storage::AlbumRecord& album) { return album.folderPath == folderPath; }) };
            if (it != std::end(document->albums))
                it->type = operation.albumType;
        }
        document->folderStructure = scanner::toFolderStructureInfo(scanner::detectFolderStructure(discovery));

        const storage::BandDocument savedDocument{ _repository.saveBandDocument(bandName, std::move(*document), false) };
        _repository.updateIndex([&](storage::CollectionIndex& index) {
            index.upsert(storage::createIndexEntry(savedDocument, bandName));
        });
    }
} // namespace mcol::migration
