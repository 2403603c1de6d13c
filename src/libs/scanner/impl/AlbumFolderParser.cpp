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

#include "scanner/AlbumFolderParser.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <vector>

#include "core/Path.hpp"
#include "core/String.hpp"

namespace mcol::scanner
{
    namespace
    {
        struct FolderNameRule
        {
            FolderNamePattern pattern;
            const char* expression;
            std::size_t yearGroup; // 0 if none
            std::size_t nameGroup;
            std::size_t editionGroup; // 0 if none
        };

        constexpr FolderNameRule folderNameRules[]{
            { FolderNamePattern::DefaultWithEdition, R"(^(\d{4})\s*-\s*(.+?)\s*\(([^)]+)\)$)", 1, 2, 3 },
            { FolderNamePattern::DefaultNoEdition, R"(^(\d{4})\s*-\s*(.+)$)", 1, 2, 0 },
            { FolderNamePattern::LegacyWithEdition, R"(^(.+?)\s*\(([^)]+)\)$)", 0, 1, 2 },
            { FolderNamePattern::LegacyNoEdition, R"(^(.+)$)", 0, 1, 0 },
        };

        constexpr std::string_view editionKeywords[]{
            "deluxe",
            "limited",
            "anniversary",
            "remastered",
            "remaster",
            "remix",
            "special edition",
            "expanded",
            "director's cut",
            "collector's edition",
            "premium edition",
            "ultimate edition",
            "bonus edition",
            "extended edition",
            "platinum edition",
            "gold edition",
            "complete edition",
            "definitive edition",
            // types that are also used as editions
            "live",
            "demo",
            "instrumental",
            "split",
            "acoustic",
            "unplugged",
        };

        struct TypeKeywordRule
        {
            storage::AlbumType type;
            std::vector<std::string_view> keywords;
        };

        const TypeKeywordRule typeKeywordRules[]{
            { storage::AlbumType::Live, { "live", "concert", "unplugged", "acoustic" } },
            { storage::AlbumType::Compilation, { "greatest hits", "best of", "collection", "anthology", "compilation" } },
            { storage::AlbumType::EP, { "ep", "e.p." } },
            { storage::AlbumType::Single, { "single" } },
            { storage::AlbumType::Demo, { "demo", "demos", "early recordings", "unreleased" } },
            { storage::AlbumType::Instrumental, { "instrumental", "instrumentals" } },
            { storage::AlbumType::Split, { "split", "vs.", "vs", "versus" } },
        };

        struct TypeFolderName
        {
            std::string_view plural;
            storage::AlbumType type;
        };

        constexpr TypeFolderName typeFolderPlurals[]{
            { "albums", storage::AlbumType::Album },
            { "eps", storage::AlbumType::EP },
            { "singles", storage::AlbumType::Single },
            { "lives", storage::AlbumType::Live },
            { "demos", storage::AlbumType::Demo },
            { "compilations", storage::AlbumType::Compilation },
            { "instrumentals", storage::AlbumType::Instrumental },
            { "splits", storage::AlbumType::Split },
        };

        const std::vector<std::regex>& getFolderNameRegexes()
        {
            static const std::vector<std::regex> regexes{ [] {
                std::vector<std::regex> res;
                for (const FolderNameRule& rule : folderNameRules)
                    res.emplace_back(rule.expression);
                return res;
            }() };

            return regexes;
        }

        bool isWordChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c));
        }

        // keyword must be lower case
        bool containsWord(std::string_view lowerStr, std::string_view keyword)
        {
            std::string_view::size_type pos{ lowerStr.find(keyword) };
            while (pos != std::string_view::npos)
            {
                const std::string_view::size_type end{ pos + keyword.size() };
                const bool startsWord{ pos == 0 || !isWordChar(lowerStr[pos - 1]) || !isWordChar(keyword.front()) };
                const bool endsWord{ end == lowerStr.size() || !isWordChar(lowerStr[end]) || !isWordChar(keyword.back()) };
                if (startsWord && endsWord)
                    return true;

                pos = lowerStr.find(keyword, pos + 1);
            }

            return false;
        }

        std::string getGroup(const std::smatch& match, std::size_t group)
        {
            return std::string{ core::stringUtils::stringTrim(match[group].str()) };
        }
    } // namespace

    std::string_view folderNamePatternToString(FolderNamePattern pattern)
    {
        switch (pattern)
        {
        case FolderNamePattern::DefaultWithEdition:
            return "default_with_edition";
        case FolderNamePattern::DefaultNoEdition:
            return "default_no_edition";
        case FolderNamePattern::LegacyWithEdition:
            return "legacy_with_edition";
        case FolderNamePattern::LegacyNoEdition:
            return "legacy_no_edition";
        }
        return "";
    }

    ParsedAlbumFolder parseAlbumFolderName(std::string_view folderName)
    {
        const std::string name{ core::stringUtils::stringTrim(folderName) };
        const std::vector<std::regex>& regexes{ getFolderNameRegexes() };

        for (std::size_t i{}; i < std::size(folderNameRules); ++i)
        {
            const FolderNameRule& rule{ folderNameRules[i] };

            std::smatch match;
            if (!std::regex_match(name, match, regexes[i]))
                continue;

            ParsedAlbumFolder parsed;
            parsed.pattern = rule.pattern;
            parsed.albumName = getGroup(match, rule.nameGroup);
            if (rule.yearGroup)
            {
                parsed.year = getGroup(match, rule.yearGroup);
                if (!isValidYear(parsed.year))
                    continue;
            }
            if (rule.editionGroup)
            {
                parsed.edition = getGroup(match, rule.editionGroup);
                if (!isEditionMarker(parsed.edition))
                    continue;
            }

            return parsed;
        }

        return ParsedAlbumFolder{ .albumName = name, .year = "", .edition = "", .pattern = FolderNamePattern::LegacyNoEdition };
    }

    bool isValidYear(std::string_view year)
    {
        if (year.size() != 4 || !std::all_of(std::cbegin(year), std::cend(year), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
            return false;

        const std::optional<int> value{ core::stringUtils::readAs<int>(year) };
        return value && *value >= 1950 && *value <= 2030;
    }

    bool isEditionMarker(std::string_view str)
    {
        const std::string lowerStr{ core::stringUtils::stringToLower(str) };
        return std::any_of(std::cbegin(editionKeywords), std::cend(editionKeywords), [&](std::string_view keyword) { return containsWord(lowerStr, keyword); });
    }

    std::optional<storage::AlbumType> inferAlbumTypeFromName(std::string_view folderName)
    {
        if (const std::optional<storage::AlbumType> type{ storage::albumTypeFromString(folderName) })
            return type;

        const std::string lowerName{ core::stringUtils::stringToLower(folderName) };
        for (const TypeKeywordRule& rule : typeKeywordRules)
        {
            if (std::any_of(std::cbegin(rule.keywords), std::cend(rule.keywords), [&](std::string_view keyword) { return containsWord(lowerName, keyword); }))
                return rule.type;
        }

        return std::nullopt;
    }

    std::optional<storage::AlbumType> getTypeFolderType(std::string_view folderName)
    {
        if (const std::optional<storage::AlbumType> type{ storage::albumTypeFromString(folderName) })
            return type;

        const std::string lowerName{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(folderName)) };
        for (const TypeFolderName& typeFolder : typeFolderPlurals)
        {
            if (lowerName == typeFolder.plural)
                return typeFolder.type;
        }

        return std::nullopt;
    }

    std::string_view getTypeFolderName(storage::AlbumType type)
    {
        return storage::albumTypeToString(type);
    }

    storage::AlbumType detectAlbumType(std::string_view albumFolderName, std::optional<storage::AlbumType> typeFolderType)
    {
        if (typeFolderType)
            return *typeFolderType;

        return inferAlbumTypeFromName(albumFolderName).value_or(storage::AlbumType::Album);
    }

    std::string formatAlbumFolderName(std::string_view albumName, std::string_view year, std::string_view edition)
    {
        std::string res;

        if (!year.empty())
        {
            res += year;
            res += " - ";
        }
        res += albumName;
        if (!edition.empty())
        {
            res += " (";
            res += edition;
            res += ")";
        }

        return core::pathUtils::sanitizeFileStem(res);
    }
} // namespace mcol::scanner
