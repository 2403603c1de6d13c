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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace mcol::core::stringUtils::tests
{
    TEST(StringUtils, stringTrim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { " ", "" },
            { "a", "a" },
            { " a ", "a" },
            { "\tThe Wall\n", "The Wall" },
            { "  a b  ", "a b" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(stringTrim(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(StringUtils, caseInsensitive)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("Pink Floyd", "pink floyd"));
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_FALSE(stringCaseInsensitiveEqual("Pink Floyd", "Pink Floy"));


        EXPECT_EQ(stringToLower("Deluxe EDITION"), "deluxe edition");
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("1973"), 1973);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
    }

    TEST(StringUtils, ISO8601)
    {
        const Wt::WDateTime dateTime{ Wt::WDate{ 2024, 3, 15 }, Wt::WTime{ 12, 30, 45, 123 } };

        EXPECT_EQ(toISO8601String(dateTime), "2024-03-15T12:30:45.123Z");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
    }
} // namespace mcol::core::stringUtils::tests
