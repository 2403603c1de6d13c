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

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace mcol::tests
{
    class ScopedTmpDirectory final
    {
    public:
        ScopedTmpDirectory()
        {
            std::string pattern{ (std::filesystem::temp_directory_path() / "mcol-test-XXXXXX").string() };
            if (!::mkdtemp(pattern.data()))
                throw std::system_error{ errno, std::generic_category(), "Cannot create temporary directory" };

            _path = pattern;
        }

        ~ScopedTmpDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        ScopedTmpDirectory(const ScopedTmpDirectory&) = delete;
        ScopedTmpDirectory(ScopedTmpDirectory&&) = delete;
        ScopedTmpDirectory& operator=(const ScopedTmpDirectory&) = delete;
        ScopedTmpDirectory& operator=(ScopedTmpDirectory&&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    inline void writeFile(const std::filesystem::path& file, std::string_view content)
    {
        std::filesystem::create_directories(file.parent_path());

        std::ofstream ofs{ file, std::ios::out | std::ios::trunc | std::ios::binary };
        ofs << content;
        if (!ofs)
            throw std::system_error{ errno, std::generic_category(), "Cannot write '" + file.string() + "'" };
    }

    inline std::string readFile(const std::filesystem::path& file)
    {
        std::ifstream ifs{ file, std::ios::in | std::ios::binary };
        return std::string{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
    }

    // Creates an album folder filled with empty .mp3 tracks
    inline void createAlbumFolder(const std::filesystem::path& albumFolder, std::size_t trackCount)
    {
        std::filesystem::create_directories(albumFolder);
        for (std::size_t i{ 1 }; i <= trackCount; ++i)
            writeFile(albumFolder / ("track" + std::to_string(i) + ".mp3"), "");
    }
} // namespace mcol::tests
