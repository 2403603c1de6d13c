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
#include <filesystem>

namespace mcol::storage
{
    // Exclusive advisory lock held on the "<target>.lock" sidecar file
    // The sidecar is removed when the lock is released
    class FileLock
    {
    public:
        static constexpr std::chrono::milliseconds minBackoff{ 10 };
        static constexpr std::chrono::milliseconds maxBackoff{ 100 };

        // Throws LockTimeoutException if the lock cannot be acquired within timeout
        FileLock(const std::filesystem::path& target, std::chrono::milliseconds timeout);
        ~FileLock();

        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;
        FileLock(FileLock&&) = delete;
        FileLock& operator=(FileLock&&) = delete;

        static std::filesystem::path getLockPath(const std::filesystem::path& target);

    private:
        bool tryLock();

        const std::filesystem::path _lockPath;
        int _fd{ -1 };
    };
} // namespace mcol::storage
