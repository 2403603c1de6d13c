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

#include "core/Path.hpp"

#include <algorithm>
#include <array>

#include <sys/stat.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace mcol::core::pathUtils
{
    Wt::WDateTime getLastWriteTime(const std::filesystem::path& file)
    {
        struct stat sb{};

        if (::stat(file.c_str(), &sb) == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            throw McolException{ "Failed to get stats on file '" + file.string() + "': " + ec.message() };
        }

        return Wt::WDateTime::fromTime_t(sb.st_mtime);
    }

    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb)
    {
        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, std::filesystem::directory_options::follow_directory_symlink, ec };

        if (ec)
        {
            cb(ec, directory);
            return true; // try to continue exploring anyway
        }

        std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            bool continueExploring{ true };

            if (std::filesystem::is_regular_file(*itPath, ec))
            {
                continueExploring = cb(ec, *itPath);
            }
            else if (std::filesystem::is_directory(*itPath, ec))
            {
                if (!ec)
                    continueExploring = exploreFilesRecursive(*itPath, cb);
                else
                    continueExploring = cb(ec, *itPath);
            }

            if (!continueExploring)
                return false;

            itPath.increment(ec);
            if (ec)
            {
                cb(ec, directory);
                break;
            }
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions)
    {
        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().c_str()) };

        return (std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions));
    }

    std::string sanitizeFileStem(std::string_view fileStem)
    {
        // Keep UTF8-encoded characters, but skip illegal ASCII characters
        constexpr std::array<unsigned char, 9> illegalChars{ '/', '\\', ':', '*', '?', '"', '<', '>', '|' };
        static_assert(std::all_of(std::begin(illegalChars), std::end(illegalChars), [](unsigned char c) { return c < 128; }), "Illegal characters must be ASCII");

        std::string sanitized;
        sanitized.reserve(fileStem.size());

        for (const char c : fileStem)
        {
            if (std::any_of(std::begin(illegalChars), std::end(illegalChars), [c](unsigned char illegalChar) { return static_cast<unsigned char>(c) == illegalChar; }))
                continue;

            sanitized.push_back(c);
        }

        return std::string{ stringUtils::stringTrim(sanitized) };
    }

    void copyDirectoryContent(const std::filesystem::path& source, const std::filesystem::path& destination, std::function<bool(const std::filesystem::path&)> filter)
    {
        std::filesystem::create_directories(destination);

        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ source })
        {
            if (filter && !filter(entry.path()))
                continue;

            const std::filesystem::path target{ destination / entry.path().filename() };
            if (entry.is_directory())
                copyDirectoryContent(entry.path(), target, filter);
            else
                std::filesystem::copy(entry.path(), target, std::filesystem::copy_options::overwrite_existing | std::filesystem::copy_options::copy_symlinks);
        }
    }
} // namespace mcol::core::pathUtils
