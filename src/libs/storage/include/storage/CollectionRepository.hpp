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

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

#include "storage/BandDocument.hpp"
#include "storage/CollectionIndex.hpp"

namespace mcol::storage
{
    class AtomicFileStore;
    class CacheValidator;

    // Band documents and collection index of one music root
    class CollectionRepository
    {
    public:
        CollectionRepository(const std::filesystem::path& musicRoot, const AtomicFileStore& store, const CacheValidator& cacheValidator);

        const std::filesystem::path& getMusicRoot() const { return _musicRoot; }
        const AtomicFileStore& getStore() const { return _store; }
        const CacheValidator& getCacheValidator() const { return _cacheValidator; }

        // Returns nullopt if the band has no document
        // Throws DocumentCorruptException if the document fails the integrity check, ValidationException if it does not fit the model
        // Expired documents are returned
        std::optional<BandDocument> loadBandDocument(std::string_view bandName) const;

        // Stored analysis and folder structure are kept when the document has none
        // userSave also stamps last_metadata_saved
        BandDocument saveBandDocument(std::string_view bandName, BandDocument document, bool userSave = true) const;

        // Throws DocumentNotFoundException if the band has no document
        BandDocument saveBandAnalysis(std::string_view bandName, const BandAnalysis& analysis) const;

        std::optional<CollectionIndex> loadIndex() const;
        void saveIndex(const CollectionIndex& index) const;

        // Read-modify-write of the index within a single lock acquisition
        CollectionIndex updateIndex(std::function<void(CollectionIndex&)> updateFunc) const;

    private:
        const std::filesystem::path _musicRoot;
        const AtomicFileStore& _store;
        const CacheValidator& _cacheValidator;
    };
} // namespace mcol::storage
