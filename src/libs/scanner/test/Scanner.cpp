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

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "scanner/Exception.hpp"
#include "scanner/IScanner.hpp"
#include "storage/AtomicFileStore.hpp"
#include "storage/CacheValidator.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/CollectionRepository.hpp"
#include "storage/Exception.hpp"
#include "testutils/TmpDirectory.hpp"

namespace mcol::scanner::tests
{
    namespace
    {
        class ScannerTest : public ::testing::Test
        {
        protected:
            const std::filesystem::path& getRoot() const { return tmpDir.getPath(); }

            ScanReport scan() const { return createScanner(repository)->scan(); }

            storage::CollectionIndexEntry getIndexEntry(std::string_view bandName) const
            {
                const std::optional<storage::CollectionIndex> index{ repository.loadIndex() };
                if (!index)
                    throw std::runtime_error{ "no index" };

                const storage::CollectionIndexEntry* entry{ index->find(bandName) };
                if (!entry)
                    throw std::runtime_error{ "no entry for " + std::string{ bandName } };

                return *entry;
            }

            mcol::tests::ScopedTmpDirectory tmpDir;
            storage::AtomicFileStore store{ std::chrono::seconds{ 5 } };
            storage::CacheValidator validator{ store, tmpDir.getPath() };
            storage::CollectionRepository repository{ tmpDir.getPath(), store, validator };
        };
    } // namespace

    TEST_F(ScannerTest, missingRoot)
    {
        const storage::CollectionRepository otherRepository{ getRoot() / "NotThere", store, validator };
        EXPECT_THROW(createScanner(otherRepository)->scan(), ScanException);
    }

    TEST_F(ScannerTest, emptyCollection)
    {
        const ScanReport report{ scan() };

        EXPECT_EQ(report.bandsDiscovered, 0);
        EXPECT_FALSE(report.changesMade);
        EXPECT_TRUE(report.scanErrors.empty());
        EXPECT_FALSE(report.scanTimestamp.empty());

        const std::optional<storage::CollectionIndex> index{ repository.loadIndex() };
        ASSERT_TRUE(index);
        EXPECT_TRUE(index->getEntries().empty());
        EXPECT_EQ(index->getLastScan(), report.scanTimestamp);
    }

    TEST_F(ScannerTest, missingAlbumFromMetadata)
    {
        storage::BandDocument document;
        document.bandName = "Beatles";
        storage::AlbumRecord revolver;
        revolver.albumName = "Revolver";
        revolver.year = "1966";
        revolver.trackCount = 14;
        revolver.folderPath = "1966 - Revolver";
        document.albums.push_back(revolver);
        repository.saveBandDocument("Beatles", document);

        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1970 - Let It Be", 2);

        const ScanReport report{ scan() };
        EXPECT_EQ(report.bandsDiscovered, 1);
        EXPECT_EQ(report.bandsAdded, 1);
        EXPECT_EQ(report.albumsDiscovered, 2);
        EXPECT_EQ(report.totalTracks, 5);
        EXPECT_EQ(report.missingAlbums, 1);
        EXPECT_TRUE(report.changesMade);
        EXPECT_EQ(report.changesDetected, (std::vector<std::string>{ "Added new band: Beatles (3 albums)" }));

        ASSERT_EQ(report.bands.size(), 1);
        EXPECT_EQ(report.bands[0].name, "Beatles");
        EXPECT_EQ(report.bands[0].localAlbums, 2);
        EXPECT_EQ(report.bands[0].missingAlbums, 1);
        EXPECT_EQ(report.bands[0].structureType, StructureType::Default);

        const storage::CollectionIndexEntry entry{ getIndexEntry("Beatles") };
        EXPECT_EQ(entry.getAlbumsCount(), 3);
        EXPECT_EQ(entry.getLocalAlbumsCount(), 2);
        EXPECT_EQ(entry.getMissingAlbumsCount(), 1);
        EXPECT_TRUE(entry.hasMetadata());

        const std::optional<storage::BandDocument> saved{ repository.loadBandDocument("Beatles") };
        ASSERT_TRUE(saved);
        ASSERT_EQ(saved->albumsMissing.size(), 1);
        EXPECT_EQ(saved->albumsMissing[0].albumName, "Revolver");
        EXPECT_EQ(saved->albumsMissing[0].trackCount, 0);
        ASSERT_EQ(saved->albums.size(), 2);
        EXPECT_EQ(saved->albums[0].albumName, "Abbey Road");
        EXPECT_EQ(saved->albums[0].trackCount, 3);
        ASSERT_TRUE(saved->folderStructure);
        EXPECT_EQ(saved->folderStructure->structureType, "default");
    }

    TEST_F(ScannerTest, rescanWithoutChanges)
    {
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / "Metallica" / "Live" / "1999 - S&M", 2);

        const ScanReport first{ scan() };
        EXPECT_EQ(first.bandsAdded, 2);
        EXPECT_TRUE(first.changesMade);

        const ScanReport second{ scan() };
        EXPECT_EQ(second.bandsDiscovered, 2);
        EXPECT_EQ(second.bandsAdded, 0);
        EXPECT_EQ(second.bandsUpdated, 0);
        EXPECT_EQ(second.bandsRemoved, 0);
        EXPECT_EQ(second.albumsDiscovered, 2);
        EXPECT_FALSE(second.changesMade);
        EXPECT_TRUE(second.changesDetected.empty());
    }

    TEST_F(ScannerTest, updatedAndRemovedBands)
    {
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / "Queen" / "1975 - A Night at the Opera", 12);
        scan();

        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1970 - Let It Be", 2);
        std::filesystem::remove_all(getRoot() / "Queen");

        const ScanReport report{ scan() };
        EXPECT_EQ(report.bandsDiscovered, 1);
        EXPECT_EQ(report.bandsRemoved, 1);
        EXPECT_EQ(report.bandsUpdated, 1);
        EXPECT_TRUE(report.changesMade);
        EXPECT_EQ(report.changesDetected, (std::vector<std::string>{ "Removed band: Queen", "Updated band: Beatles (album change: +1)" }));

        const std::optional<storage::CollectionIndex> index{ repository.loadIndex() };
        ASSERT_TRUE(index);
        ASSERT_EQ(index->getEntries().size(), 1);
        EXPECT_EQ(index->getEntries()[0].getName(), "Beatles");
        EXPECT_EQ(index->getEntries()[0].getAlbumsCount(), 2);
    }

    TEST_F(ScannerTest, albumRemovedFromDisk)
    {
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1970 - Let It Be", 2);
        scan();

        std::filesystem::remove_all(getRoot() / "Beatles" / "1970 - Let It Be");

        // the album is still known, the total does not change
        const ScanReport report{ scan() };
        EXPECT_EQ(report.bandsUpdated, 1);
        EXPECT_EQ(report.changesDetected, (std::vector<std::string>{ "Updated band: Beatles (album change: +0)" }));
        EXPECT_EQ(report.missingAlbums, 1);

        const storage::CollectionIndexEntry entry{ getIndexEntry("Beatles") };
        EXPECT_EQ(entry.getLocalAlbumsCount(), 1);
        EXPECT_EQ(entry.getMissingAlbumsCount(), 1);
    }

    TEST_F(ScannerTest, corruptedDocument)
    {
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / "Metallica" / "1986 - Master of Puppets", 8);
        mcol::tests::writeFile(storage::layout::getBandDocumentPath(getRoot(), "Metallica"), "{ \"band_name\": ");

        const ScanReport report{ scan() };
        ASSERT_EQ(report.scanErrors.size(), 1);
        EXPECT_NE(report.scanErrors[0].find("Metallica"), std::string::npos);
        EXPECT_EQ(report.bandsAdded, 2);

        // replaced by a fresh document
        const std::optional<storage::BandDocument> document{ repository.loadBandDocument("Metallica") };
        ASSERT_TRUE(document);
        ASSERT_EQ(document->albums.size(), 1);
        EXPECT_EQ(document->albums[0].albumName, "Master of Puppets");
    }

    TEST_F(ScannerTest, ignoredFolders)
    {
        mcol::tests::createAlbumFolder(getRoot() / "Beatles" / "1969 - Abbey Road", 3);
        mcol::tests::createAlbumFolder(getRoot() / ".trash" / "Old" / "1990 - Old", 3);

        const ScanReport report{ scan() };
        EXPECT_EQ(report.bandsDiscovered, 1);
        ASSERT_EQ(report.bands.size(), 1);
        EXPECT_EQ(report.bands[0].name, "Beatles");
    }

    TEST_F(ScannerTest, concurrentIndexUpdates)
    {
        constexpr std::size_t bandCount{ 30 };
        for (std::size_t i{}; i < bandCount; ++i)
            mcol::tests::createAlbumFolder(getRoot() / ("Band " + std::to_string(i)) / "2000 - Album", 2);

        // another writer of the index, as the collection service does on each document save
        const storage::AtomicFileStore writerStore{ std::chrono::seconds{ 1 } };
        const storage::CollectionRepository writerRepository{ getRoot(), writerStore, validator };

        std::atomic<bool> scanDone{};
        std::size_t timeoutCount{};
        std::thread writer{ [&] {
            while (!scanDone)
            {
                try
                {
                    writerRepository.updateIndex([](storage::CollectionIndex&) {});
                }
                catch (const storage::LockTimeoutException&)
                {
                    timeoutCount++;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
            }
        } };

        const ScanReport report{ scan() };
        scanDone = true;
        writer.join();

        EXPECT_EQ(report.bandsAdded, bandCount);
        EXPECT_TRUE(report.scanErrors.empty());
        EXPECT_EQ(timeoutCount, 0);

        const std::optional<storage::CollectionIndex> index{ repository.loadIndex() };
        ASSERT_TRUE(index);
        EXPECT_EQ(index->getEntries().size(), bandCount);
        EXPECT_EQ(index->getLastScan(), report.scanTimestamp);
    }
} // namespace mcol::scanner::tests
