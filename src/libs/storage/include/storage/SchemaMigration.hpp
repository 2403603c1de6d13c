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

#include <string>
#include <string_view>

#include <Wt/Json/Object.h>

namespace mcol::storage
{
    // Known versions, oldest first. Documents without version are "0.9"
    inline constexpr std::string_view schemaVersions[]{ "0.9", "1.0", "2.0" };

    std::string getSchemaVersion(const Wt::Json::Object& document, std::string_view versionField = "schema_version");

    // Throws ValidationException on unknown versions
    void checkSchemaVersion(std::string_view version);

    // Upgrade in place up to targetVersion, fields introduced along the way are backfilled
    // Returns false if the document was already up to date
    bool migrateBandDocumentSchema(Wt::Json::Object& document, std::string_view targetVersion);
    bool migrateCollectionIndexSchema(Wt::Json::Object& index, std::string_view targetVersion);
} // namespace mcol::storage
