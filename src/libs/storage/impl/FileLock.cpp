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

#include "storage/FileLock.hpp"

#include <algorithm>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/ILogger.hpp"
#include "storage/Exception.hpp"

namespace mcol::storage
{
    namespace
    {
        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }
    } // namespace

    FileLock::FileLock(const std::filesystem::path& target, std::chrono::milliseconds timeout)
        : _lockPath{ getLockPath(target) }
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };
        std::chrono::milliseconds backoff{ minBackoff };

        while (!tryLock())
        {
            const auto now{ std::chrono::steady_clock::now() };
            if (now >= deadline)
            {
                MCOL_LOG(STORAGE, WARNING, "Timeout while waiting for lock '" << _lockPath.string() << "'");
                throw LockTimeoutException{ target, timeout };
            }

            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(backoff, deadline - now));
            backoff = std::min(backoff * 2, maxBackoff);
        }

        MCOL_LOG(STORAGE, DEBUG, "Acquired lock '" << _lockPath.string() << "'");
    }

    FileLock::~FileLock()
    {
        // unlink before unlocking: waiters that opened the old inode will notice it is gone
        ::unlink(_lockPath.c_str());
        ::close(_fd);

        MCOL_LOG(STORAGE, DEBUG, "Released lock '" << _lockPath.string() << "'");
    }

    std::filesystem::path FileLock::getLockPath(const std::filesystem::path& target)
    {
        std::filesystem::path lockPath{ target };
        lockPath += ".lock";
        return lockPath;
    }

    bool FileLock::tryLock()
    {
        const int fd{ ::open(_lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644) };
        if (fd < 0)
            throw StorageIOException{ "Cannot open lock file", _lockPath, lastError() };

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            const std::error_code ec{ lastError() };
            ::close(fd);

            if (ec == std::errc::operation_would_block || ec == std::errc::interrupted)
                return false;

            throw StorageIOException{ "Cannot lock file", _lockPath, ec };
        }

        // The previous holder may have removed the sidecar between our open and our flock
        struct stat fdStat{};
        struct stat pathStat{};
        if (::fstat(fd, &fdStat) != 0 || ::stat(_lockPath.c_str(), &pathStat) != 0
            || fdStat.st_dev != pathStat.st_dev || fdStat.st_ino != pathStat.st_ino)
        {
            ::close(fd);
            return false;
        }

        _fd = fd;
        return true;
    }
} // namespace mcol::storage
