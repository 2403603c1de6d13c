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

#include "CollectionService.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "scanner/IScanner.hpp"
#include "storage/Exception.hpp"

#include "ErrorMapping.hpp"

namespace mcol::collection
{
    namespace
    {
        using details::invoke;

        void checkBandName(std::string_view bandName)
        {
            if (core::stringUtils::stringTrim(bandName).empty())
                throw storage::ValidationException{ "Band name must not be empty" };

            if (bandName == "." || bandName == ".." || bandName.find_first_of("/\\") != std::string_view::npos)
                throw storage::ValidationException{ "Invalid band name '" + std::string{ bandName } + "'" };
        }

        void checkRate(int rate, std::string_view what)
        {
            if (rate < 0 || rate > 10)
                throw storage::ValidationException{ std::string{ what } + " rate must be between 0 and 10, got " + std::to_string(rate) };
        }

        bool containsName(const std::vector<std::string>& names, std::string_view name)
        {
            for (const std::string& existing : names)
            {
                if (core::stringUtils::stringCaseInsensitiveEqual(existing, name))
                    return true;
            }
            return false;
        }

        const storage::CollectionIndexEntry* findIndexEntry(const storage::CollectionIndex& index, std::string_view bandName)
        {
            for (const storage::CollectionIndexEntry& entry : index.getEntries())
            {
                if (core::stringUtils::stringCaseInsensitiveEqual(entry.getName(), bandName))
                    return &entry;
            }
            return nullptr;
        }

        // Entries of similarBands and similarBandsMissing are sorted again using the index
        void sortSimilarBands(storage::BandAnalysis& analysis, std::string_view bandName, const std::optional<storage::CollectionIndex>& index)
        {
            std::vector<std::string> candidates{ std::move(analysis.similarBands) };
            candidates.insert(std::end(candidates), std::make_move_iterator(std::begin(analysis.similarBandsMissing)), std::make_move_iterator(std::end(analysis.similarBandsMissing)));

            analysis.similarBands.clear();
            analysis.similarBandsMissing.clear();

            for (const std::string& candidate : candidates)
            {
                const std::string_view name{ core::stringUtils::stringTrim(candidate) };
                if (name.empty() || core::stringUtils::stringCaseInsensitiveEqual(name, bandName))
                    continue;
                if (containsName(analysis.similarBands, name) || containsName(analysis.similarBandsMissing, name))
                    continue;

                if (const storage::CollectionIndexEntry* entry{ index ? findIndexEntry(*index, name) : nullptr })
                    analysis.similarBands.push_back(entry->getName());
                else
                    analysis.similarBandsMissing.emplace_back(name);
            }
        }
    } // namespace

    std::unique_ptr<ICollectionService> createCollectionService(const CollectionSettings& settings)
    {
        return std::make_unique<CollectionService>(settings);
    }

    CollectionService::CollectionService(const CollectionSettings& settings)
        : _settings{ settings }
        , _store{ settings.lockTimeout }
        , _cacheValidator{ _store, settings.musicRootPath, settings.cacheDuration }
        , _repository{ settings.musicRootPath, _store, _cacheValidator }
        , _migrationEngine{ migration::createMigrationEngine(_repository, migration::RecoverySettings{ .maxRetries = settings.maxRetries, .lockWaitTimeout = settings.lockWaitTimeout }) }
    {
        MCOL_LOG(COLLECTION, INFO, "Collection service started, music root = '" << _settings.musicRootPath.string() << "'");
    }

    Result<scanner::ScanReport> CollectionService::scan()
    {
        return invoke<scanner::ScanReport>("Scan", [&] {
            return scanner::createScanner(_repository)->scan();
        });
    }

    Result<storage::BandDocument> CollectionService::saveDocument(std::string_view bandName, const storage::BandDocument& document)
    {
        return invoke<storage::BandDocument>("Save document", [&] {
            checkBandName(bandName);

            const storage::BandDocument saved{ _repository.saveBandDocument(bandName, document) };
            refreshIndexEntry(bandName, saved);

            MCOL_LOG(COLLECTION, INFO, "Band '" << bandName << "': document saved, " << saved.getAlbumsCount() << " album(s)");
            return saved;
        });
    }

    Result<storage::BandDocument> CollectionService::saveAnalysis(std::string_view bandName, const storage::BandAnalysis& analysis)
    {
        return invoke<storage::BandDocument>("Save analysis", [&] {
            checkBandName(bandName);
            checkRate(analysis.rate, "Band");
            for (const storage::AlbumAnalysis& albumAnalysis : analysis.albums)
                checkRate(albumAnalysis.rate, "Album '" + albumAnalysis.albumName + "'");

            storage::BandAnalysis sortedAnalysis{ analysis };
            sortSimilarBands(sortedAnalysis, bandName, _repository.loadIndex());

            std::optional<storage::BandDocument> saved;
            try
            {
                saved = _repository.saveBandAnalysis(bandName, sortedAnalysis);
            }
            catch (const storage::DocumentNotFoundException&)
            {
                throw storage::ValidationException{ "Band '" + std::string{ bandName } + "' has no metadata, save its document before its analysis" };
            }
            refreshIndexEntry(bandName, *saved);

            MCOL_LOG(COLLECTION, INFO, "Band '" << bandName << "': analysis saved, " << sortedAnalysis.similarBands.size() << " similar band(s) in the collection, " << sortedAnalysis.similarBandsMissing.size() << " missing");
            return std::move(*saved);
        });
    }

    Result<std::optional<storage::BandDocument>> CollectionService::loadDocument(std::string_view bandName)
    {
        return invoke<std::optional<storage::BandDocument>>("Load document", [&] {
            checkBandName(bandName);
            return _repository.loadBandDocument(bandName);
        });
    }

    Result<storage::BandCacheReport> CollectionService::getCacheReport(std::string_view bandName)
    {
        return invoke<storage::BandCacheReport>("Cache report", [&] {
            checkBandName(bandName);
            return _cacheValidator.getBandReport(bandName);
        });
    }

    Result<std::optional<storage::CollectionIndex>> CollectionService::loadIndex()
    {
        return invoke<std::optional<storage::CollectionIndex>>("Load index", [&] {
            return _repository.loadIndex();
        });
    }

    Result<storage::CollectionIndex> CollectionService::updateIndex(const storage::CollectionIndex& index)
    {
        return invoke<storage::CollectionIndex>("Update index", [&] {
            return _repository.updateIndex([&](storage::CollectionIndex& storedIndex) {
                storedIndex = index;
            });
        });
    }

    Result<migration::MigrationResult> CollectionService::migrate(std::string_view bandName, const migration::MigrationRequest& request, migration::ProgressCallback progressCallback)
    {
        return invoke<migration::MigrationResult>("Migration", [&] {
            checkBandName(bandName);

            migration::MigrationResult result{ _migrationEngine->migrate(bandName, request, std::move(progressCallback)) };
            if (const std::optional<Error> error{ getMigrationError(result) })
                MCOL_LOG(COLLECTION, WARNING, "Band '" << bandName << "': migration " << migration::migrationStatusToString(result.status) << ": " << error->message);

            return result;
        });
    }

    Result<storage::CollectionValidation> CollectionService::validateCollection()
    {
        return invoke<storage::CollectionValidation>("Validation", [&] {
            return _cacheValidator.validate();
        });
    }

    Result<storage::CollectionSchemaMigration> CollectionService::migrateSchemas(std::string_view targetVersion)
    {
        return invoke<storage::CollectionSchemaMigration>("Schema migration", [&] {
            return _cacheValidator.migrateCollection(targetVersion);
        });
    }

    Result<storage::BackupCleanupReport> CollectionService::cleanupBackups()
    {
        return invoke<storage::BackupCleanupReport>("Backup cleanup", [&] {
            return storage::cleanupDatedBackups(_settings.musicRootPath, _settings.maxBackups);
        });
    }

    void CollectionService::refreshIndexEntry(std::string_view bandName, const storage::BandDocument& document)
    {
        _repository.updateIndex([&](storage::CollectionIndex& index) {
            index.upsert(storage::createIndexEntry(document, bandName));
        });
    }
} // namespace mcol::collection
