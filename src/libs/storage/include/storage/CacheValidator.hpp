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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcol::storage
{
    class AtomicFileStore;

    enum class CacheStatus
    {
        Missing,
        Valid,
        Expired,
        Corrupted,
    };
    std::string_view cacheStatusToString(CacheStatus status);

    struct BandCacheReport
    {
        std::string bandName;
        std::filesystem::path documentPath;
        CacheStatus status{ CacheStatus::Missing };
        std::uintmax_t size{};
        std::string lastModified;
        std::optional<double> ageDays;
        std::vector<std::string> recommendations;
    };

    struct CollectionValidation
    {
        CacheStatus indexStatus{ CacheStatus::Missing };
        std::size_t validDocuments{};
        std::size_t expiredDocuments{};
        std::size_t corruptedDocuments{};
        std::size_t missingDocuments{};
        std::vector<std::string> bandsWithoutFolder; // indexed, but no folder on disk
        std::vector<std::string> foldersNotIndexed;  // on disk, but not indexed
        std::vector<std::string> inconsistencies;
        std::vector<std::string> recommendations;

        bool isConsistent() const { return inconsistencies.empty(); }
    };

    struct SchemaMigrationOutcome
    {
        std::filesystem::path documentPath;
        std::string fromVersion;
        bool migrated{};
        std::filesystem::path backupPath; // empty if not migrated
    };

    struct CollectionSchemaMigration
    {
        std::string targetVersion;
        std::vector<std::filesystem::path> migratedFiles;
        std::vector<std::filesystem::path> backupFiles;
        std::size_t upToDateFiles{};
        std::vector<std::string> errors;
    };

    // Decides whether stored documents can be trusted, and upgrades older schemas
    class CacheValidator
    {
    public:
        static constexpr std::chrono::days defaultCacheDuration{ 30 };

        CacheValidator(const AtomicFileStore& store, const std::filesystem::path& musicRoot, std::chrono::days cacheDuration = defaultCacheDuration);

        // Expired takes precedence over Corrupted: content is only checked within the cache duration
        CacheStatus getStatus(const std::filesystem::path& document) const;

        BandCacheReport getBandReport(std::string_view bandName) const;

        // Cross-check index entries against band folders, nothing is fixed
        CollectionValidation validate() const;

        // Band document or collection index, a dated backup is made before any change
        SchemaMigrationOutcome migrate(const std::filesystem::path& document, std::string_view targetVersion) const;
        CollectionSchemaMigration migrateCollection(std::string_view targetVersion) const;

        const std::filesystem::path& getMusicRoot() const { return _musicRoot; }
        std::chrono::days getCacheDuration() const { return _cacheDuration; }

    private:
        bool isIndexPath(const std::filesystem::path& document) const;

        const AtomicFileStore& _store;
        const std::filesystem::path _musicRoot;
        const std::chrono::days _cacheDuration;
    };
} // namespace mcol::storage
