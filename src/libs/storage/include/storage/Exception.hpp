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
#include <system_error>

#include "core/Exception.hpp"

namespace mcol::storage
{
    class Exception : public core::McolException
    {
    public:
        using McolException::McolException;
    };

    class StorageIOException : public Exception
    {
    public:
        StorageIOException(std::string_view message, const std::filesystem::path& path, std::error_code err)
            : Exception{ std::string{ message } + " '" + path.string() + "': " + err.message() }
            , _path{ path }
            , _err{ err }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }
        std::error_code getErrorCode() const { return _err; }

    private:
        std::filesystem::path _path;
        std::error_code _err;
    };

    class DocumentNotFoundException : public Exception
    {
    public:
        DocumentNotFoundException(const std::filesystem::path& path)
            : Exception{ "Document '" + path.string() + "' not found" }
            , _path{ path }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    class DocumentCorruptException : public Exception
    {
    public:
        DocumentCorruptException(const std::filesystem::path& path, std::string_view details)
            : Exception{ "Document '" + path.string() + "' is corrupted: " + std::string{ details } }
            , _path{ path }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    class LockTimeoutException : public Exception
    {
    public:
        LockTimeoutException(const std::filesystem::path& path, std::chrono::milliseconds timeout)
            : Exception{ "Cannot lock '" + path.string() + "' within " + std::to_string(timeout.count()) + " ms" }
            , _path{ path }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    // Content does not match the expected document model
    class ValidationException : public core::McolException
    {
    public:
        using McolException::McolException;
    };
} // namespace mcol::storage
