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

#include "Scanner.hpp"

#include <optional>
#include <set>
#include <vector>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "scanner/AlbumDiscovery.hpp"
#include "scanner/AlbumReconciliation.hpp"
#include "scanner/Exception.hpp"
#include "scanner/StructureDetector.hpp"
#include "storage/CollectionIndex.hpp"
#include "storage/CollectionLayout.hpp"
#include "storage/CollectionRepository.hpp"
#include "storage/Exception.hpp"

namespace mcol::scanner
{
    namespace
    {
        void addError(ScanReport& report, std::string error)
        {
            MCOL_LOG(SCANNER, ERROR, error);
            report.scanErrors.push_back(std::move(error));
        }
    } // namespace

    std::unique_ptr<IScanner> createScanner(const storage::CollectionRepository& repository)
    {
        return std::make_unique<Scanner>(repository);
    }

    Scanner::Scanner(const storage::CollectionRepository& repository)
        : _repository{ repository }
    {
    }

    ScanReport Scanner::scan()
    {
        const std::filesystem::path& musicRoot{ _repository.getMusicRoot() };

        std::error_code ec;
        if (!std::filesystem::is_directory(musicRoot, ec))
            throw ScanException{ "Music root '" + musicRoot.string() + "' is not a directory" };

        MCOL_LOG(SCANNER, INFO, "Scanning '" << musicRoot.string() << "'...");

        ScanReport report;
        report.scanTimestamp = core::stringUtils::toISO8601String(Wt::WDateTime::currentDateTime());

        std::vector<std::string> bandFolders;
        try
        {
            bandFolders = storage::layout::listBandFolders(musicRoot);
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ScanException{ std::string{ "Cannot list band folders: " } + e.what() };
        }
        report.bandsDiscovered = bandFolders.size();

        const storage::CollectionIndex previousIndex{ loadPreviousIndex() };
        const std::set<std::string> currentBands(std::cbegin(bandFolders), std::cend(bandFolders));
        for (const storage::CollectionIndexEntry& entry : previousIndex.getEntries())
        {
            if (currentBands.contains(entry.getName()))
                continue;

            // the band document, if any, is left in place
            report.bandsRemoved++;
            report.changesDetected.push_back("Removed band: " + entry.getName());
            MCOL_LOG(SCANNER, INFO, "Removing band '" << entry.getName() << "' from the index");
        }

        std::vector<storage::CollectionIndexEntry> entries;
        for (const std::string& bandFolder : bandFolders)
        {
            try
            {
                entries.push_back(scanBand(bandFolder, previousIndex, report));
            }
            catch (const std::filesystem::filesystem_error& e)
            {
                addError(report, "Error scanning band folder '" + bandFolder + "': " + e.what());
            }
            catch (const core::McolException& e)
            {
                addError(report, "Error scanning band folder '" + bandFolder + "': " + e.what());
            }
        }

        // the index lock is only taken to merge the scan results
        _repository.updateIndex([&](storage::CollectionIndex& index) {
            std::vector<std::string> removedBands;
            for (const storage::CollectionIndexEntry& entry : index.getEntries())
            {
                if (!currentBands.contains(entry.getName()))
                    removedBands.push_back(entry.getName());
            }
            for (const std::string& bandName : removedBands)
                index.remove(bandName);

            for (const storage::CollectionIndexEntry& entry : entries)
                index.upsert(entry);

            index.setLastScan(report.scanTimestamp);
            index.setMetadataVersion(storage::CollectionIndex::currentMetadataVersion);

            report.missingAlbums = index.getStats().totalMissingAlbums;
        });

        report.changesMade = report.bandsAdded + report.bandsRemoved + report.bandsUpdated > 0;

        MCOL_LOG(SCANNER, INFO, "Scan complete: " << report.bandsDiscovered << " bands (" << report.bandsAdded << " added, " << report.bandsRemoved << " removed, " << report.bandsUpdated << " updated), "
                                                   << report.albumsDiscovered << " albums, " << report.totalTracks << " tracks, " << report.missingAlbums << " missing albums, " << report.scanErrors.size() << " errors");

        return report;
    }

    storage::CollectionIndex Scanner::loadPreviousIndex() const
    {
        try
        {
            if (std::optional<storage::CollectionIndex> index{ _repository.loadIndex() })
                return std::move(*index);
        }
        catch (const storage::DocumentCorruptException& e)
        {
            MCOL_LOG(SCANNER, WARNING, "Rebuilding unreadable collection index: " << e.what());
        }
        catch (const storage::ValidationException& e)
        {
            MCOL_LOG(SCANNER, WARNING, "Rebuilding invalid collection index: " << e.what());
        }

        return storage::CollectionIndex{};
    }

    storage::CollectionIndexEntry Scanner::scanBand(const std::string& bandFolder, const storage::CollectionIndex& previousIndex, ScanReport& report)
    {
        const AlbumDiscovery discovery{ discoverAlbums(storage::layout::getBandFolder(_repository.getMusicRoot(), bandFolder)) };
        for (const std::string& error : discovery.errors)
            addError(report, error);

        storage::BandDocument document{ loadOrCreateBandDocument(bandFolder, report) };

        const ReconciliationStats stats{ reconcileAlbums(document, discovery.albums) };
        const FolderStructure structure{ detectFolderStructure(discovery) };
        document.folderStructure = toFolderStructureInfo(structure);

        const storage::BandDocument savedDocument{ _repository.saveBandDocument(bandFolder, std::move(document), false) };
        storage::CollectionIndexEntry entry{ storage::createIndexEntry(savedDocument, bandFolder) };

        if (const storage::CollectionIndexEntry * previousEntry{ previousIndex.find(bandFolder) })
        {
            if (previousEntry->getAlbumsCount() != entry.getAlbumsCount() || stats.hasChanges())
            {
                const long long diff{ static_cast<long long>(entry.getAlbumsCount()) - static_cast<long long>(previousEntry->getAlbumsCount()) };
                report.bandsUpdated++;
                report.changesDetected.push_back("Updated band: " + bandFolder + " (album change: " + (diff >= 0 ? "+" : "") + std::to_string(diff) + ")");
            }
        }
        else
        {
            report.bandsAdded++;
            report.changesDetected.push_back("Added new band: " + bandFolder + " (" + std::to_string(entry.getAlbumsCount()) + " albums)");
        }

        BandScanSummary summary;
        summary.name = bandFolder;
        summary.localAlbums = entry.getLocalAlbumsCount();
        summary.missingAlbums = entry.getMissingAlbumsCount();
        summary.totalAlbums = entry.getAlbumsCount();
        for (const DiscoveredAlbum& album : discovery.albums)
            summary.totalTracks += album.trackCount;
        summary.structureType = structure.type;
        summary.hasMetadata = true;

        report.albumsDiscovered += discovery.albums.size();
        report.totalTracks += summary.totalTracks;
        report.bands.push_back(std::move(summary));

        MCOL_LOG(SCANNER, DEBUG, "Band '" << bandFolder << "': " << stats.added << " new, " << stats.refreshed << " refreshed, " << stats.recovered << " recovered, " << stats.markedMissing << " now missing albums");

        return entry;
    }

    storage::BandDocument Scanner::loadOrCreateBandDocument(const std::string& bandFolder, ScanReport& report)
    {
        try
        {
            if (std::optional<storage::BandDocument> document{ _repository.loadBandDocument(bandFolder) })
                return std::move(*document);
        }
        catch (const storage::DocumentCorruptException& e)
        {
            addError(report, "Band '" + bandFolder + "': replacing unreadable metadata: " + e.what());
        }
        catch (const storage::ValidationException& e)
        {
            addError(report, "Band '" + bandFolder + "': replacing invalid metadata: " + e.what());
        }

        storage::BandDocument document;
        document.bandName = bandFolder;
        return document;
    }
} // namespace mcol::scanner
