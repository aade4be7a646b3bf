/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace shelf::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '/', { "abc" } },
            { "", '/', { "" } },
            { "a/b/c", '/', { "a", "b", "c" } },
            { "/similar/12", '/', { "", "similar", "12" } },
            { "similar/", '/', { "similar", "" } },
            { "//", '/', { "", "", "" } },
            { "a-b/c", '-', { "a", "b/c" } },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(splitString(test.input, test.delimiter), test.expectedOutput) << "Input = '" << test.input << "'";
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(" a "), "a");
        EXPECT_EQ(stringTrim("\ta b\r"), "a b");
    }

    TEST(StringUtils, caseHelpers)
    {
        EXPECT_EQ(stringToLower("MiXeD"), "mixed");
        EXPECT_TRUE(stringCaseInsensitiveEqual("Info", "INFO"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("Info", "Inf"));
    }

    TEST(StringUtils, startsEndsWith)
    {
        EXPECT_TRUE(stringStartsWith("/similar/1", "/similar/"));
        EXPECT_FALSE(stringStartsWith("/simi", "/similar/"));
        EXPECT_TRUE(stringEndsWith("generation.xml", ".xml"));
        EXPECT_FALSE(stringEndsWith("xml", ".xml"));
    }

    TEST(StringUtils, readAs_int)
    {
        EXPECT_EQ(readAs<int>("0"), 0);
        EXPECT_EQ(readAs<int>("-12"), -12);
        EXPECT_EQ(readAs<long long>("123456789012"), 123456789012LL);
        EXPECT_EQ(readAs<int>(""), std::nullopt);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
        EXPECT_EQ(readAs<int>("12abc"), std::nullopt);
    }

    TEST(StringUtils, readAs_double)
    {
        EXPECT_EQ(readAs<double>("1.5"), 1.5);
        EXPECT_EQ(readAs<double>("1.5x"), std::nullopt);
    }

    TEST(StringUtils, DateTimeToString)
    {
        const Wt::WDateTime dateTime{ Wt::WDate{ 2025, 3, 2 }, Wt::WTime{ 12, 4, 5, 6 } };
        EXPECT_EQ(toISO8601String(dateTime), "2025-03-02T12:04:05.006Z");
        EXPECT_EQ(toISO8601String(Wt::WDateTime{}), "");
    }

    TEST(StringUtils, DateTimeFromString)
    {
        const Wt::WDateTime dateTime{ Wt::WDate{ 2025, 3, 2 }, Wt::WTime{ 12, 4, 5, 6 } };
        EXPECT_EQ(fromISO8601String("2025-03-02T12:04:05.006Z"), dateTime);
        EXPECT_EQ(fromISO8601String(toISO8601String(dateTime)), dateTime);
        EXPECT_FALSE(fromISO8601String("not a date").isValid());
    }
} // namespace shelf::core::stringUtils::tests
