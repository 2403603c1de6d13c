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
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Json/Object.h>

namespace mcol::storage
{
    // Read/write of whole JSON documents
    // Every access holds the document's sidecar lock and writes are made visible by a single rename
    class AtomicFileStore
    {
    public:
        static constexpr std::chrono::milliseconds defaultLockTimeout{ 10'000 };
        static constexpr std::size_t maxDatedBackupsPerMillisecond{ 100 };

        struct CurrentDocument
        {
            std::optional<Wt::Json::Object> document; // unset if absent or corrupted
            bool corrupted{};
        };
        using UpdateFunction = std::function<Wt::Json::Object(const CurrentDocument& current)>;

        explicit AtomicFileStore(std::chrono::milliseconds lockTimeout = defaultLockTimeout);

        // Replace the document, copying the previous one to the ".backup" sidecar if requested
        // Parent directories are created as needed
        void save(const std::filesystem::path& path, const Wt::Json::Object& document, bool backup = true) const;

        // Throws DocumentNotFoundException, DocumentCorruptException
        Wt::Json::Object load(const std::filesystem::path& path) const;

        // Read-modify-write within a single lock acquisition
        // A corrupted stored document is passed as absent, with the corrupted flag set
        Wt::Json::Object update(const std::filesystem::path& path, UpdateFunction updateFunc, bool backup = true) const;

        // Copy the document to "<file>.backup_<YYYYmmdd_HHMMSS_mmm>", returns the copy path
        // An existing backup is never overwritten: "_01", "_02"... are appended within the same millisecond
        std::filesystem::path createDatedBackup(const std::filesystem::path& path) const;

        std::chrono::milliseconds getLockTimeout() const { return _lockTimeout; }

        static std::filesystem::path getBackupPath(const std::filesystem::path& path);
        static std::filesystem::path getTmpPath(const std::filesystem::path& path);

        // Throws DocumentCorruptException if content is not a JSON object
        static Wt::Json::Object parseDocument(std::string_view content, const std::filesystem::path& origin);
        static std::string serializeDocument(const Wt::Json::Object& document);

    private:
        Wt::Json::Object readDocument(const std::filesystem::path& path) const;
        void writeDocument(const std::filesystem::path& path, const Wt::Json::Object& document, bool backup) const;

        const std::chrono::milliseconds _lockTimeout;
    };
} // namespace mcol::storage
