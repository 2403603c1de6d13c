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

#include "storage/CollectionLayout.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace mcol::storage::layout
{
    namespace
    {
        constexpr std::array<std::string_view, 14> ignoredFolderNames{
            "temp", "tmp", "cache", "trash", ".trash", "$recycle.bin",
            "itunes", "windows media player", "winamp",
            "artwork", "covers", "images", "scans", "logs"
        };
    } // namespace

    std::filesystem::path getIndexPath(const std::filesystem::path& musicRoot)
    {
        return musicRoot / indexFileName;
    }

    std::filesystem::path getBandFolder(const std::filesystem::path& musicRoot, std::string_view bandName)
    {
        return musicRoot / bandName;
    }

    std::filesystem::path getBandDocumentPath(const std::filesystem::path& musicRoot, std::string_view bandName)
    {
        return getBandFolder(musicRoot, bandName) / bandDocumentFileName;
    }

    bool isIgnoredFolderName(std::string_view folderName)
    {
        const std::string lowerName{ core::stringUtils::stringToLower(folderName) };
        return std::find(std::cbegin(ignoredFolderNames), std::cend(ignoredFolderNames), lowerName) != std::cend(ignoredFolderNames);
    }

    std::vector<std::string> listBandFolders(const std::filesystem::path& musicRoot)
    {
        std::vector<std::string> bandFolders;

        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ musicRoot })
        {
            std::error_code ec;
            if (!entry.is_directory(ec))
                continue;

            const std::string name{ entry.path().filename().string() };
            if (name.empty() || name.front() == '.' || isIgnoredFolderName(name))
            {
                MCOL_LOG(SCANNER, DEBUG, "Skipping folder '" << name << "'");
                continue;
            }

            bandFolders.push_back(name);
        }

        std::sort(std::begin(bandFolders), std::end(bandFolders));
        return bandFolders;
    }
} // namespace mcol::storage::layout
