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

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mcol::tests
{
    // Exclusive flock held on a file, the way another program holding the file open would
    class ScopedFileLock final
    {
    public:
        explicit ScopedFileLock(const std::filesystem::path& file)
            : _fd{ ::open(file.c_str(), O_RDWR | O_CLOEXEC) }
        {
            if (_fd < 0)
                throw std::system_error{ errno, std::generic_category(), "Cannot open '" + file.string() + "'" };

            if (::flock(_fd, LOCK_EX | LOCK_NB) != 0)
            {
                const int error{ errno };
                ::close(_fd);
                throw std::system_error{ error, std::generic_category(), "Cannot lock '" + file.string() + "'" };
            }
        }

        ~ScopedFileLock() { release(); }

        ScopedFileLock(const ScopedFileLock&) = delete;
        ScopedFileLock(ScopedFileLock&&) = delete;
        ScopedFileLock& operator=(const ScopedFileLock&) = delete;
        ScopedFileLock& operator=(ScopedFileLock&&) = delete;

        void release()
        {
            if (_fd < 0)
                return;

            ::close(_fd);
            _fd = -1;
        }

    private:
        int _fd;
    };
} // namespace mcol::tests
