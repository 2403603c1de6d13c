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

#include "scanner/AlbumDiscovery.hpp"

#include <algorithm>
#include <array>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "storage/CollectionLayout.hpp"

namespace mcol::scanner
{
    namespace
    {
        const std::array<std::filesystem::path, 9> musicFileExtensions{
            ".mp3", ".flac", ".wav", ".aac", ".m4a", ".ogg", ".wma", ".mp4", ".m4p"
        };

        bool isCandidateFolder(const std::filesystem::directory_entry& entry)
        {
            std::error_code ec;
            if (!entry.is_directory(ec))
                return false;

            const std::string name{ entry.path().filename().string() };
            return !name.empty() && name.front() != '.' && !storage::layout::isIgnoredFolderName(name);
        }

        std::vector<std::filesystem::path> listCandidateFolders(const std::filesystem::path& folder)
        {
            std::vector<std::filesystem::path> res;
            for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ folder })
            {
                if (isCandidateFolder(entry))
                    res.push_back(entry.path());
            }

            std::sort(std::begin(res), std::end(res));
            return res;
        }

        void addAlbum(AlbumDiscovery& discovery, const std::filesystem::path& bandFolder, const std::filesystem::path& albumFolder, std::optional<storage::AlbumType> typeFolderType)
        {
            const std::size_t trackCount{ countMusicFiles(albumFolder, discovery.errors) };
            if (trackCount == 0)
            {
                MCOL_LOG(SCANNER, DEBUG, "Skipping '" << albumFolder.string() << "': no music file");
                return;
            }

            DiscoveredAlbum album;
            album.folderName = albumFolder.filename().string();
            album.folderPath = albumFolder.lexically_relative(bandFolder);
            album.typeFolderType = typeFolderType;
            album.parsed = parseAlbumFolderName(album.folderName);
            album.type = detectAlbumType(album.folderName, typeFolderType);
            album.trackCount = trackCount;

            discovery.albums.push_back(std::move(album));
        }
    } // namespace

    storage::AlbumRecord DiscoveredAlbum::toAlbumRecord() const
    {
        storage::AlbumRecord record;

        record.albumName = parsed.albumName;
        record.year = parsed.year;
        record.type = type;
        record.edition = parsed.edition;
        record.trackCount = trackCount;
        record.folderPath = folderPath.generic_string();

        return record;
    }

    bool isMusicFile(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, musicFileExtensions);
    }

    std::size_t countMusicFiles(const std::filesystem::path& folder, std::vector<std::string>& errors)
    {
        std::size_t count{};
        core::pathUtils::exploreFilesRecursive(folder, [&](std::error_code ec, const std::filesystem::path& path) {
            if (ec)
            {
                MCOL_LOG(SCANNER, ERROR, "Cannot explore '" << path.string() << "': " << ec.message());
                errors.push_back("Cannot explore '" + path.string() + "': " + ec.message());
            }
            else if (isMusicFile(path))
                count++;

            return true;
        });

        return count;
    }

    AlbumDiscovery discoverAlbums(const std::filesystem::path& bandFolder)
    {
        AlbumDiscovery discovery;

        for (const std::filesystem::path& folder : listCandidateFolders(bandFolder))
        {
            const std::string folderName{ folder.filename().string() };

            std::vector<std::filesystem::path> subFolders;
            const std::optional<storage::AlbumType> typeFolderType{ getTypeFolderType(folderName) };
            if (typeFolderType)
            {
                try
                {
                    subFolders = listCandidateFolders(folder);
                }
                catch (const std::filesystem::filesystem_error& e)
                {
                    MCOL_LOG(SCANNER, ERROR, "Cannot list '" << folder.string() << "': " << e.what());
                    discovery.errors.push_back("Cannot list '" + folder.string() + "': " + e.what());
                    continue;
                }
            }

            // a type named folder without subfolders is an album on its own
            if (!subFolders.empty())
            {
                discovery.typeFoldersFound.push_back(folderName);
                for (const std::filesystem::path& albumFolder : subFolders)
                    addAlbum(discovery, bandFolder, albumFolder, typeFolderType);
            }
            else
                addAlbum(discovery, bandFolder, folder, std::nullopt);
        }

        MCOL_LOG(SCANNER, DEBUG, "Discovered " << discovery.albums.size() << " albums in '" << bandFolder.string() << "'");
        return discovery;
    }
} // namespace mcol::scanner
