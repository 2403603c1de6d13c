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

#include "storage/CacheValidator.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <vector>

#include <Wt/Json/Object.h>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "storage/AtomicFileStore.hpp"
#include "storage/CollectionIndex.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/Exception.hpp"
#include "storage/SchemaMigration.hpp"

namespace mcol::storage
{
    namespace
    {
        bool isBandDocumentPath(const std::filesystem::path& document)
        {
            return document.filename() == layout::bandDocumentFileName;
        }
    } // namespace

    std::string_view cacheStatusToString(CacheStatus status)
    {
        switch (status)
        {
        case CacheStatus::Missing:
            return "missing";
        case CacheStatus::Valid:
            return "valid";
        case CacheStatus::Expired:
            return "expired";
        case CacheStatus::Corrupted:
            return "corrupted";
        }
        return "";
    }

    CacheValidator::CacheValidator(const AtomicFileStore& store, const std::filesystem::path& musicRoot, std::chrono::days cacheDuration)
        : _store{ store }
        , _musicRoot{ musicRoot }
        , _cacheDuration{ cacheDuration }
    {
    }

    CacheStatus CacheValidator::getStatus(const std::filesystem::path& document) const
    {
        std::error_code ec;
        if (!std::filesystem::exists(document, ec))
            return CacheStatus::Missing;

        const std::filesystem::file_time_type lastWriteTime{ std::filesystem::last_write_time(document, ec) };
        if (ec)
        {
            MCOL_LOG(CACHE, ERROR, "Cannot get last write time of '" << document.string() << "': " << ec.message());
            return CacheStatus::Corrupted;
        }

        if (std::filesystem::file_time_type::clock::now() - lastWriteTime > _cacheDuration)
            return CacheStatus::Expired;

        std::ifstream ifs{ document, std::ios::in | std::ios::binary };
        if (!ifs)
        {
            MCOL_LOG(CACHE, ERROR, "Cannot open '" << document.string() << "'");
            return CacheStatus::Corrupted;
        }
        const std::string content{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };

        try
        {
            const Wt::Json::Object object{ AtomicFileStore::parseDocument(content, document) };

            if (isIndexPath(document) && object.type("bands") != Wt::Json::Type::Array)
            {
                MCOL_LOG(CACHE, WARNING, "Collection index '" << document.string() << "' has no band list");
                return CacheStatus::Corrupted;
            }
            if (isBandDocumentPath(document) && object.type("band_name") != Wt::Json::Type::String)
            {
                MCOL_LOG(CACHE, WARNING, "Band document '" << document.string() << "' has no band name");
                return CacheStatus::Corrupted;
            }
        }
        catch (const DocumentCorruptException& e)
        {
            MCOL_LOG(CACHE, WARNING, e.what());
            return CacheStatus::Corrupted;
        }

        return CacheStatus::Valid;
    }

    BandCacheReport CacheValidator::getBandReport(std::string_view bandName) const
    {
        BandCacheReport report;

        report.bandName = bandName;
        report.documentPath = layout::getBandDocumentPath(_musicRoot, bandName);
        report.status = getStatus(report.documentPath);

        if (report.status != CacheStatus::Missing)
        {
            std::error_code ec;
            report.size = std::filesystem::file_size(report.documentPath, ec);

            const auto lastWriteTime{ std::filesystem::last_write_time(report.documentPath, ec) };
            if (!ec)
            {
                const std::chrono::duration<double, std::ratio<86400>> age{ std::filesystem::file_time_type::clock::now() - lastWriteTime };
                report.ageDays = age.count();
                report.lastModified = core::stringUtils::toISO8601String(core::pathUtils::getLastWriteTime(report.documentPath));
            }
        }

        switch (report.status)
        {
        case CacheStatus::Missing:
            report.recommendations.push_back("create: scan the collection or save metadata for this band");
            break;
        case CacheStatus::Expired:
            report.recommendations.push_back("refresh: metadata is older than " + std::to_string(_cacheDuration.count()) + " days");
            break;
        case CacheStatus::Corrupted:
            report.recommendations.push_back("regenerate: metadata cannot be read, restore it from a backup or save it again");
            break;
        case CacheStatus::Valid:
            break;
        }

        return report;
    }

    CollectionValidation CacheValidator::validate() const
    {
        CollectionValidation validation;

        const std::filesystem::path indexPath{ layout::getIndexPath(_musicRoot) };
        validation.indexStatus = getStatus(indexPath);

        std::optional<CollectionIndex> index;
        if (validation.indexStatus == CacheStatus::Valid || validation.indexStatus == CacheStatus::Expired)
        {
            try
            {
                index = parseCollectionIndex(_store.load(indexPath));
            }
            catch (const core::McolException& e)
            {
                MCOL_LOG(CACHE, ERROR, "Cannot load collection index: " << e.what());
                validation.indexStatus = CacheStatus::Corrupted;
            }
        }

        const std::vector<std::string> bandFolders{ layout::listBandFolders(_musicRoot) };
        const std::set<std::string> bandFolderSet(std::cbegin(bandFolders), std::cend(bandFolders));

        for (const std::string& bandFolder : bandFolders)
        {
            const CacheStatus status{ getStatus(layout::getBandDocumentPath(_musicRoot, bandFolder)) };
            switch (status)
            {
            case CacheStatus::Missing:
                validation.missingDocuments++;
                break;
            case CacheStatus::Valid:
                validation.validDocuments++;
                break;
            case CacheStatus::Expired:
                validation.expiredDocuments++;
                break;
            case CacheStatus::Corrupted:
                validation.corruptedDocuments++;
                validation.inconsistencies.push_back("Band '" + bandFolder + "' has a corrupted metadata document");
                break;
            }

            if (index && !index->find(bandFolder))
            {
                validation.foldersNotIndexed.push_back(bandFolder);
                validation.inconsistencies.push_back("Band folder '" + bandFolder + "' is not indexed");
            }
        }

        if (index)
        {
            for (const CollectionIndexEntry& entry : index->getEntries())
            {
                if (!bandFolderSet.contains(entry.getName()))
                {
                    validation.bandsWithoutFolder.push_back(entry.getName());
                    validation.inconsistencies.push_back("Indexed band '" + entry.getName() + "' has no folder");
                }
                else if (entry.hasMetadata() && !std::filesystem::exists(layout::getBandDocumentPath(_musicRoot, entry.getName())))
                {
                    validation.inconsistencies.push_back("Indexed band '" + entry.getName() + "' claims metadata but has no document");
                }
            }
        }

        switch (validation.indexStatus)
        {
        case CacheStatus::Missing:
            validation.recommendations.push_back("Scan the collection to create the collection index");
            break;
        case CacheStatus::Corrupted:
            validation.inconsistencies.push_back("Collection index is corrupted");
            validation.recommendations.push_back("Scan the collection to rebuild the collection index");
            break;
        case CacheStatus::Expired:
            validation.recommendations.push_back("Scan the collection to refresh the collection index");
            break;
        case CacheStatus::Valid:
            break;
        }

        if (!validation.bandsWithoutFolder.empty() || !validation.foldersNotIndexed.empty())
            validation.recommendations.push_back("Scan the collection to reconcile the index with the band folders");
        if (validation.expiredDocuments > 0)
            validation.recommendations.push_back("Refresh " + std::to_string(validation.expiredDocuments) + " expired band document(s)");
        if (validation.corruptedDocuments > 0)
            validation.recommendations.push_back("Regenerate " + std::to_string(validation.corruptedDocuments) + " corrupted band document(s)");

        MCOL_LOG(CACHE, INFO, "Collection validation: " << bandFolders.size() << " band folders, " << validation.inconsistencies.size() << " inconsistencies");

        return validation;
    }

    SchemaMigrationOutcome CacheValidator::migrate(const std::filesystem::path& document, std::string_view targetVersion) const
    {
        checkSchemaVersion(targetVersion);

        SchemaMigrationOutcome outcome;
        outcome.documentPath = document;

        const bool isIndex{ isIndexPath(document) };
        auto migrateObject{ [&](Wt::Json::Object& object) {
            return isIndex ? migrateCollectionIndexSchema(object, targetVersion) : migrateBandDocumentSchema(object, targetVersion);
        } };

        Wt::Json::Object current{ _store.load(document) };
        outcome.fromVersion = getSchemaVersion(current, isIndex ? "metadata_version" : "schema_version");
        if (!migrateObject(current))
        {
            MCOL_LOG(CACHE, DEBUG, "'" << document.string() << "' is up to date");
            return outcome;
        }

        _store.update(
            document,
            [&](const AtomicFileStore::CurrentDocument& stored) {
                if (stored.corrupted)
                    throw DocumentCorruptException{ document, "changed during migration" };
                if (!stored.document)
                    throw DocumentNotFoundException{ document };

                outcome.backupPath = _store.createDatedBackup(document);

                Wt::Json::Object migrated = *stored.document;
                migrateObject(migrated);
                return migrated;
            },
            false);

        outcome.migrated = true;
        MCOL_LOG(CACHE, INFO, "Migrated '" << document.string() << "' from version " << outcome.fromVersion << " to " << targetVersion);

        return outcome;
    }

    CollectionSchemaMigration CacheValidator::migrateCollection(std::string_view targetVersion) const
    {
        checkSchemaVersion(targetVersion);

        CollectionSchemaMigration result;
        result.targetVersion = targetVersion;

        std::vector<std::filesystem::path> documents;
        if (std::filesystem::exists(layout::getIndexPath(_musicRoot)))
            documents.push_back(layout::getIndexPath(_musicRoot));

        for (const std::string& bandFolder : layout::listBandFolders(_musicRoot))
        {
            const std::filesystem::path documentPath{ layout::getBandDocumentPath(_musicRoot, bandFolder) };
            if (std::filesystem::exists(documentPath))
                documents.push_back(documentPath);
        }

        for (const std::filesystem::path& document : documents)
        {
            try
            {
                const SchemaMigrationOutcome outcome{ migrate(document, targetVersion) };
                if (outcome.migrated)
                {
                    result.migratedFiles.push_back(document);
                    result.backupFiles.push_back(outcome.backupPath);
                }
                else
                    result.upToDateFiles++;
            }
            catch (const core::McolException& e)
            {
                MCOL_LOG(CACHE, ERROR, "Cannot migrate '" << document.string() << "': " << e.what());
                result.errors.push_back(document.string() + ": " + e.what());
            }
        }

        MCOL_LOG(CACHE, INFO, "Schema migration to " << targetVersion << ": " << result.migratedFiles.size() << " migrated, " << result.upToDateFiles << " up to date, " << result.errors.size() << " errors");

        return result;
    }

    bool CacheValidator::isIndexPath(const std::filesystem::path& document) const
    {
        return document.filename() == layout::indexFileName;
    }
} // namespace mcol::storage
