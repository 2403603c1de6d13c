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

#include "storage/CollectionRepository.hpp"

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "storage/AtomicFileStore.hpp"
#include "storage/CacheValidator.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/Exception.hpp"
#include "storage/SchemaMigration.hpp"

namespace mcol::storage
{
    namespace
    {
        std::string getCurrentTimestamp()
        {
            return core::stringUtils::toISO8601String(Wt::WDateTime::currentDateTime());
        }

        // Refuse documents that fail the integrity check, warn on expired ones
        bool checkCacheStatus(const CacheValidator& cacheValidator, const std::filesystem::path& path)
        {
            switch (cacheValidator.getStatus(path))
            {
            case CacheStatus::Missing:
                return false;
            case CacheStatus::Corrupted:
                throw DocumentCorruptException{ path, "integrity check failed" };
            case CacheStatus::Expired:
                MCOL_LOG(CACHE, INFO, "'" << path.string() << "' is older than " << cacheValidator.getCacheDuration().count() << " days, refresh recommended");
                break;
            case CacheStatus::Valid:
                break;
            }

            return true;
        }

        BandDocument toBandDocument(Wt::Json::Object object)
        {
            migrateBandDocumentSchema(object, BandDocument::currentSchemaVersion);
            return parseBandDocument(object);
        }

        CollectionIndex toCollectionIndex(Wt::Json::Object object)
        {
            migrateCollectionIndexSchema(object, CollectionIndex::currentMetadataVersion);
            return parseCollectionIndex(object);
        }
    } // namespace

    CollectionRepository::CollectionRepository(const std::filesystem::path& musicRoot, const AtomicFileStore& store, const CacheValidator& cacheValidator)
        : _musicRoot{ musicRoot }
        , _store{ store }
        , _cacheValidator{ cacheValidator }
    {
    }

    std::optional<BandDocument> CollectionRepository::loadBandDocument(std::string_view bandName) const
    {
        const std::filesystem::path path{ layout::getBandDocumentPath(_musicRoot, bandName) };
        if (!checkCacheStatus(_cacheValidator, path))
            return std::nullopt;

        return toBandDocument(_store.load(path));
    }

    BandDocument CollectionRepository::saveBandDocument(std::string_view bandName, BandDocument document, bool userSave) const
    {
        if (document.bandName.empty())
            document.bandName = bandName;

        if (const std::size_t removed{ normalizeAlbums(document) }; removed > 0)
            MCOL_LOG(STORAGE, WARNING, "Band '" << bandName << "': dropped " << removed << " duplicate album(s)");

        const std::filesystem::path path{ layout::getBandDocumentPath(_musicRoot, bandName) };
        const std::string now{ getCurrentTimestamp() };

        _store.update(path, [&](const AtomicFileStore::CurrentDocument& current) {
            if (current.document)
            {
                try
                {
                    const BandDocument stored{ toBandDocument(*current.document) };

                    if (!document.analysis)
                        document.analysis = stored.analysis;
                    if (!document.folderStructure)
                        document.folderStructure = stored.folderStructure;
                    for (const auto& [key, value] : stored.extraFields)
                    {
                        if (!document.extraFields.contains(key))
                            document.extraFields[key] = value;
                    }
                    if (!userSave && document.lastMetadataSaved.empty())
                        document.lastMetadataSaved = stored.lastMetadataSaved;
                }
                catch (const ValidationException& e)
                {
                    MCOL_LOG(STORAGE, WARNING, "Band '" << bandName << "': ignoring invalid stored document: " << e.what());
                }
            }

            document.lastUpdated = now;
            if (userSave)
                document.lastMetadataSaved = now;
            document.schemaVersion = BandDocument::currentSchemaVersion;

            return toJson(document);
        });

        MCOL_LOG(STORAGE, INFO, "Saved metadata of band '" << bandName << "' (" << document.albums.size() << " local, " << document.albumsMissing.size() << " missing albums)");
        return document;
    }

    BandDocument CollectionRepository::saveBandAnalysis(std::string_view bandName, const BandAnalysis& analysis) const
    {
        const std::filesystem::path path{ layout::getBandDocumentPath(_musicRoot, bandName) };

        BandDocument document;
        _store.update(path, [&](const AtomicFileStore::CurrentDocument& current) {
            if (!current.document)
            {
                if (current.corrupted)
                    throw DocumentCorruptException{ path, "cannot attach analysis" };
                throw DocumentNotFoundException{ path };
            }

            document = toBandDocument(*current.document);
            document.analysis = analysis;
            document.lastUpdated = getCurrentTimestamp();
            document.schemaVersion = BandDocument::currentSchemaVersion;

            return toJson(document);
        });

        MCOL_LOG(STORAGE, INFO, "Saved analysis of band '" << bandName << "'");
        return document;
    }

    std::optional<CollectionIndex> CollectionRepository::loadIndex() const
    {
        const std::filesystem::path path{ layout::getIndexPath(_musicRoot) };
        if (!checkCacheStatus(_cacheValidator, path))
            return std::nullopt;

        return toCollectionIndex(_store.load(path));
    }

    void CollectionRepository::saveIndex(const CollectionIndex& index) const
    {
        _store.save(layout::getIndexPath(_musicRoot), toJson(index));
        MCOL_LOG(STORAGE, DEBUG, "Saved collection index (" << index.getEntries().size() << " bands)");
    }

    CollectionIndex CollectionRepository::updateIndex(std::function<void(CollectionIndex&)> updateFunc) const
    {
        CollectionIndex index;
        _store.update(layout::getIndexPath(_musicRoot), [&](const AtomicFileStore::CurrentDocument& current) {
            index = CollectionIndex{};
            if (current.document)
            {
                try
                {
                    index = toCollectionIndex(*current.document);
                }
                catch (const ValidationException& e)
                {
                    MCOL_LOG(STORAGE, WARNING, "Rebuilding invalid collection index: " << e.what());
                }
            }

            updateFunc(index);
            return toJson(index);
        });

        return index;
    }
} // namespace mcol::storage
