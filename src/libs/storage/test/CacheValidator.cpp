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

#include <gtest/gtest.h>

#include <algorithm>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>

#include "storage/AtomicFileStore.hpp"
#include "storage/CacheValidator.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/Exception.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::storage::tests
{
    namespace
    {
        class CacheValidatorTest : public ::testing::Test
        {
        protected:
            void writeBandDocument(std::string_view bandName, std::string_view content)
            {
                mcol::tests::writeFile(layout::getBandDocumentPath(getRoot(), bandName), content);
            }

            void writeIndex(std::string_view content)
            {
                mcol::tests::writeFile(layout::getIndexPath(getRoot()), content);
            }

            void age(const std::filesystem::path& path, std::chrono::days days)
            {
                std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - days);
            }

            const std::filesystem::path& getRoot() const { return tmpDir.getPath(); }

            mcol::tests::ScopedTmpDirectory tmpDir;
            AtomicFileStore store{ std::chrono::milliseconds{ 500 } };
            CacheValidator validator{ store, tmpDir.getPath() };
        };
    } // namespace

    TEST_F(CacheValidatorTest, status)
    {
        const std::filesystem::path documentPath{ layout::getBandDocumentPath(getRoot(), "Beatles") };
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Missing);

        writeBandDocument("Beatles", R"({ "band_name": "The Beatles" })");
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Valid);

        age(documentPath, std::chrono::days{ 40 });
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Expired);

        writeBandDocument("Beatles", R"({ "band_name": "The Beat)");
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Corrupted);

        writeBandDocument("Beatles", R"({ "albums": [] })");
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Corrupted);

        // content is not checked once expired
        age(documentPath, std::chrono::days{ 31 });
        EXPECT_EQ(validator.getStatus(documentPath), CacheStatus::Expired);

        writeIndex(R"({ "last_scan": "" })");
        EXPECT_EQ(validator.getStatus(layout::getIndexPath(getRoot())), CacheStatus::Corrupted);
        writeIndex(R"({ "bands": [] })");
        EXPECT_EQ(validator.getStatus(layout::getIndexPath(getRoot())), CacheStatus::Valid);
    }

    TEST_F(CacheValidatorTest, cacheDuration)
    {
        const CacheValidator shortValidator{ store, getRoot(), std::chrono::days{ 1 } };

        writeBandDocument("Beatles", R"({ "band_name": "The Beatles" })");
        age(layout::getBandDocumentPath(getRoot(), "Beatles"), std::chrono::days{ 2 });

        EXPECT_EQ(shortValidator.getStatus(layout::getBandDocumentPath(getRoot(), "Beatles")), CacheStatus::Expired);
        EXPECT_EQ(validator.getStatus(layout::getBandDocumentPath(getRoot(), "Beatles")), CacheStatus::Valid);
    }

    TEST_F(CacheValidatorTest, bandReport)
    {
        {
            const BandCacheReport report{ validator.getBandReport("Beatles") };
            EXPECT_EQ(report.status, CacheStatus::Missing);
            EXPECT_FALSE(report.ageDays);
            ASSERT_EQ(report.recommendations.size(), 1);
            EXPECT_TRUE(report.recommendations[0].starts_with("create"));
        }

        writeBandDocument("Beatles", R"({ "band_name": "The Beatles" })");
        {
            const BandCacheReport report{ validator.getBandReport("Beatles") };
            EXPECT_EQ(report.status, CacheStatus::Valid);
            EXPECT_GT(report.size, 0);
            ASSERT_TRUE(report.ageDays);
            EXPECT_LT(*report.ageDays, 1.0);
            EXPECT_FALSE(report.lastModified.empty());
            EXPECT_TRUE(report.recommendations.empty());
        }

        age(layout::getBandDocumentPath(getRoot(), "Beatles"), std::chrono::days{ 45 });
        {
            const BandCacheReport report{ validator.getBandReport("Beatles") };
            EXPECT_EQ(report.status, CacheStatus::Expired);
            ASSERT_TRUE(report.ageDays);
            EXPECT_GT(*report.ageDays, 44.0);
            ASSERT_EQ(report.recommendations.size(), 1);
            EXPECT_TRUE(report.recommendations[0].starts_with("refresh"));
        }
    }

    TEST_F(CacheValidatorTest, validate)
    {
        std::filesystem::create_directories(getRoot() / "Beatles");
        std::filesystem::create_directories(getRoot() / "Metallica");
        std::filesystem::create_directories(getRoot() / "Slayer");
        std::filesystem::create_directories(getRoot() / "Covers");
        writeBandDocument("Beatles", R"({ "band_name": "The Beatles" })");
        writeBandDocument("Metallica", "not json");
        writeIndex(R"({ "bands": [
            { "name": "Beatles", "albums_count": 0, "has_metadata": true },
            { "name": "Slayer", "albums_count": 0, "has_metadata": true },
            { "name": "Queen", "albums_count": 0 }
        ] })");

        const CollectionValidation validation{ validator.validate() };
        EXPECT_EQ(validation.indexStatus, CacheStatus::Valid);
        EXPECT_EQ(validation.validDocuments, 1);
        EXPECT_EQ(validation.corruptedDocuments, 1);
        EXPECT_EQ(validation.missingDocuments, 1);
        EXPECT_EQ(validation.expiredDocuments, 0);
        EXPECT_EQ(validation.foldersNotIndexed, (std::vector<std::string>{ "Metallica" }));
        EXPECT_EQ(validation.bandsWithoutFolder, (std::vector<std::string>{ "Queen" }));
        EXPECT_FALSE(validation.isConsistent());
        // corrupted Metallica, Metallica not indexed, Slayer without document, Queen without folder
        EXPECT_EQ(validation.inconsistencies.size(), 4);
        EXPECT_FALSE(validation.recommendations.empty());
    }

    TEST_F(CacheValidatorTest, validateWithoutIndex)
    {
        std::filesystem::create_directories(getRoot() / "Beatles");

        const CollectionValidation validation{ validator.validate() };
        EXPECT_EQ(validation.indexStatus, CacheStatus::Missing);
        EXPECT_EQ(validation.missingDocuments, 1);
        EXPECT_TRUE(validation.foldersNotIndexed.empty());
        EXPECT_TRUE(validation.isConsistent());
        ASSERT_FALSE(validation.recommendations.empty());
    }

    TEST_F(CacheValidatorTest, migrateLegacyTrackCount)
    {
        writeBandDocument("Beatles", R"({
            "band_name": "The Beatles",
            "albums": [ { "album_name": "Revolver", "year": "1966", "tracks_count": 14 } ]
        })");
        const std::filesystem::path documentPath{ layout::getBandDocumentPath(getRoot(), "Beatles") };

        const SchemaMigrationOutcome outcome{ validator.migrate(documentPath, "2.0") };
        EXPECT_TRUE(outcome.migrated);
        EXPECT_EQ(outcome.fromVersion, "0.9");
        ASSERT_FALSE(outcome.backupPath.empty());
        EXPECT_TRUE(std::filesystem::exists(outcome.backupPath));

        const Wt::Json::Object document{ store.load(documentPath) };
        EXPECT_EQ(static_cast<std::string>(document.get("schema_version")), "2.0");
        EXPECT_EQ(static_cast<int>(document.get("albums_count")), 1);

        const Wt::Json::Array& albums = document.get("albums");
        ASSERT_EQ(albums.size(), 1);
        const Wt::Json::Object& album = albums[0];
        EXPECT_EQ(static_cast<int>(album.get("track_count")), 14);
        EXPECT_FALSE(album.contains("tracks_count"));
        EXPECT_EQ(static_cast<std::string>(album.get("type")), "Album");
        EXPECT_EQ(static_cast<std::string>(album.get("folder_path")), "Revolver");

        const SchemaMigrationOutcome secondOutcome{ validator.migrate(documentPath, "2.0") };
        EXPECT_FALSE(secondOutcome.migrated);
        EXPECT_EQ(secondOutcome.fromVersion, "2.0");
        EXPECT_TRUE(secondOutcome.backupPath.empty());
    }

    TEST_F(CacheValidatorTest, migrateMissingFlags)
    {
        writeBandDocument("Beatles", R"({
            "schema_version": "1.0",
            "band_name": "The Beatles",
            "genre": ["Rock"],
            "last_updated": "2020-01-01T00:00:00.000Z",
            "albums": [
                { "album_name": "Revolver", "track_count": 14 },
                { "album_name": "Let It Be", "track_count": 0, "missing": true }
            ],
            "albums_count": 2
        })");
        const std::filesystem::path documentPath{ layout::getBandDocumentPath(getRoot(), "Beatles") };

        ASSERT_TRUE(validator.migrate(documentPath, "2.0").migrated);

        const Wt::Json::Object document{ store.load(documentPath) };
        EXPECT_FALSE(document.contains("genre"));
        EXPECT_EQ(static_cast<const Wt::Json::Array&>(document.get("genres")).size(), 1);
        EXPECT_EQ(static_cast<std::string>(document.get("last_updated")), "2020-01-01T00:00:00.000Z");

        const Wt::Json::Array& albums = document.get("albums");
        const Wt::Json::Array& albumsMissing = document.get("albums_missing");
        ASSERT_EQ(albums.size(), 1);
        ASSERT_EQ(albumsMissing.size(), 1);
        const Wt::Json::Object& missingAlbum = albumsMissing[0];
        EXPECT_EQ(static_cast<std::string>(missingAlbum.get("album_name")), "Let It Be");
        EXPECT_FALSE(missingAlbum.contains("missing"));
        EXPECT_EQ(static_cast<std::string>(missingAlbum.get("folder_path")), "");
    }

    TEST_F(CacheValidatorTest, migrateErrors)
    {
        const std::filesystem::path documentPath{ layout::getBandDocumentPath(getRoot(), "Beatles") };
        EXPECT_THROW(validator.migrate(documentPath, "2.0"), DocumentNotFoundException);

        writeBandDocument("Beatles", R"({ "band_name": "The Beatles" })");
        EXPECT_THROW(validator.migrate(documentPath, "3.0"), ValidationException);

        writeBandDocument("Beatles", "{");
        EXPECT_THROW(validator.migrate(documentPath, "2.0"), DocumentCorruptException);
    }

    TEST_F(CacheValidatorTest, migrateCollection)
    {
        std::filesystem::create_directories(getRoot() / "Beatles");
        std::filesystem::create_directories(getRoot() / "Metallica");
        std::filesystem::create_directories(getRoot() / "Slayer");
        writeBandDocument("Beatles", R"({ "band_name": "The Beatles", "albums": [ { "album_name": "Revolver", "tracks_count": 14 } ] })");
        writeBandDocument("Metallica", "[ broken");
        writeIndex(R"({ "bands": [ { "name": "Beatles", "albums_count": 1 } ] })");

        const CollectionSchemaMigration result{ validator.migrateCollection("2.0") };
        EXPECT_EQ(result.targetVersion, "2.0");
        EXPECT_EQ(result.migratedFiles.size(), 2);
        EXPECT_EQ(result.backupFiles.size(), 2);
        EXPECT_EQ(result.upToDateFiles, 0);
        ASSERT_EQ(result.errors.size(), 1);
        EXPECT_NE(result.errors[0].find("Metallica"), std::string::npos);

        const Wt::Json::Object index{ store.load(layout::getIndexPath(getRoot())) };
        EXPECT_EQ(static_cast<std::string>(index.get("metadata_version")), "2.0");
        const Wt::Json::Object& entry = static_cast<const Wt::Json::Array&>(index.get("bands"))[0];
        EXPECT_EQ(static_cast<int>(entry.get("local_albums_count")), 1);

        const CollectionSchemaMigration secondResult{ validator.migrateCollection("2.0") };
        EXPECT_TRUE(secondResult.migratedFiles.empty());
        EXPECT_EQ(secondResult.upToDateFiles, 2);
        EXPECT_EQ(secondResult.errors.size(), 1);
    }
} // namespace mcol::storage::tests
