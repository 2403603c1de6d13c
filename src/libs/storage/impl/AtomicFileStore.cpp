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

#include "storage/AtomicFileStore.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <Wt/Json/Parser.h>
#include <Wt/Json/Serializer.h>
#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "storage/Exception.hpp"
#include "storage/FileLock.hpp"

namespace mcol::storage
{
    AtomicFileStore::AtomicFileStore(std::chrono::milliseconds lockTimeout)
        : _lockTimeout{ lockTimeout }
    {
    }

    void AtomicFileStore::save(const std::filesystem::path& path, const Wt::Json::Object& document, bool backup) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            throw StorageIOException{ "Cannot create directory", path.parent_path(), ec };

        const FileLock lock{ path, _lockTimeout };
        writeDocument(path, document, backup);
    }

    Wt::Json::Object AtomicFileStore::load(const std::filesystem::path& path) const
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            throw DocumentNotFoundException{ path };

        const FileLock lock{ path, _lockTimeout };
        return readDocument(path);
    }

    Wt::Json::Object AtomicFileStore::update(const std::filesystem::path& path, UpdateFunction updateFunc, bool backup) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            throw StorageIOException{ "Cannot create directory", path.parent_path(), ec };

        const FileLock lock{ path, _lockTimeout };

        CurrentDocument current;
        try
        {
            current.document = readDocument(path);
        }
        catch (const DocumentNotFoundException&)
        {
            // first write
        }
        catch (const DocumentCorruptException& e)
        {
            MCOL_LOG(STORAGE, WARNING, "Replacing corrupted document: " << e.what());
            current.corrupted = true;
        }

        Wt::Json::Object document{ updateFunc(current) };
        writeDocument(path, document, backup);

        return document;
    }

    std::filesystem::path AtomicFileStore::createDatedBackup(const std::filesystem::path& path) const
    {
        std::filesystem::path datedPath{ path };
        datedPath += ".backup_" + Wt::WDateTime::currentDateTime().toString("yyyyMMdd_hhmmss_zzz").toUTF8();

        // backups of the same millisecond get a two digit counter, so that names still sort by age
        std::error_code ec;
        for (std::size_t counter{}; counter < maxDatedBackupsPerMillisecond; ++counter)
        {
            std::filesystem::path backupPath{ datedPath };
            if (counter > 0)
                backupPath += (counter < 10 ? "_0" : "_") + std::to_string(counter);

            std::filesystem::copy_file(path, backupPath, std::filesystem::copy_options::none, ec);
            if (ec == std::errc::file_exists)
                continue;
            if (ec)
                throw StorageIOException{ "Cannot create backup of", path, ec };

            MCOL_LOG(STORAGE, DEBUG, "Created backup '" << backupPath.string() << "'");
            return backupPath;
        }

        throw StorageIOException{ "Too many backups at once of", path, ec };
    }

    std::filesystem::path AtomicFileStore::getBackupPath(const std::filesystem::path& path)
    {
        std::filesystem::path backupPath{ path };
        backupPath += ".backup";
        return backupPath;
    }

    std::filesystem::path AtomicFileStore::getTmpPath(const std::filesystem::path& path)
    {
        std::filesystem::path tmpPath{ path };
        tmpPath += ".tmp";
        return tmpPath;
    }

    Wt::Json::Object AtomicFileStore::parseDocument(std::string_view content, const std::filesystem::path& origin)
    {
        Wt::Json::Object document;
        try
        {
            Wt::Json::parse(std::string{ content }, document);
        }
        catch (const Wt::WException& e)
        {
            throw DocumentCorruptException{ origin, e.what() };
        }

        return document;
    }

    std::string AtomicFileStore::serializeDocument(const Wt::Json::Object& document)
    {
        return Wt::Json::serialize(document, 2);
    }

    Wt::Json::Object AtomicFileStore::readDocument(const std::filesystem::path& path) const
    {
        std::ifstream ifs{ path, std::ios::in | std::ios::binary };
        if (!ifs)
        {
            const std::error_code ec{ errno, std::generic_category() };
            if (ec == std::errc::no_such_file_or_directory)
                throw DocumentNotFoundException{ path };

            throw StorageIOException{ "Cannot open", path, ec };
        }

        const std::string content{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
        if (ifs.bad())
            throw StorageIOException{ "Cannot read", path, std::error_code{ errno, std::generic_category() } };

        return parseDocument(content, path);
    }

    void AtomicFileStore::writeDocument(const std::filesystem::path& path, const Wt::Json::Object& document, bool backup) const
    {
        const std::string content{ serializeDocument(document) };

        std::error_code ec;
        if (backup && std::filesystem::exists(path, ec))
        {
            std::filesystem::copy_file(path, getBackupPath(path), std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
                throw StorageIOException{ "Cannot backup", path, ec };
        }

        const std::filesystem::path tmpPath{ getTmpPath(path) };
        try
        {
            {
                std::ofstream ofs{ tmpPath, std::ios::out | std::ios::trunc | std::ios::binary };
                if (!ofs)
                    throw StorageIOException{ "Cannot create", tmpPath, std::error_code{ errno, std::generic_category() } };

                ofs << content;
                ofs.flush();
                if (!ofs)
                    throw StorageIOException{ "Cannot write", tmpPath, std::error_code{ errno, std::generic_category() } };
            }

            std::filesystem::rename(tmpPath, path, ec);
            if (ec)
                throw StorageIOException{ "Cannot replace", path, ec };
        }
        catch (...)
        {
            std::filesystem::remove(tmpPath, ec);
            throw;
        }

        MCOL_LOG(STORAGE, DEBUG, "Saved '" << path.string() << "' (" << content.size() << " bytes)");
    }
} // namespace mcol::storage
