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

#include "core/ILogger.hpp"

namespace shelf::core::logging::tests
{
    TEST(Logger, parseSeverity)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("info"), Severity::INFO);
        EXPECT_EQ(parseSeverity("warning"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("error"), Severity::ERROR);
        EXPECT_EQ(parseSeverity("fatal"), Severity::FATAL);

        EXPECT_EQ(parseSeverity("WARNING"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("Info"), Severity::INFO);

        EXPECT_FALSE(parseSeverity("").has_value());
        EXPECT_FALSE(parseSeverity("warn").has_value());
        EXPECT_FALSE(parseSeverity("info ").has_value());
        EXPECT_FALSE(parseSeverity("verbose").has_value());
    }

    TEST(Logger, severityNamesParseBack)
    {
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
            EXPECT_EQ(parseSeverity(getSeverityName(severity)), severity);
    }
} // namespace shelf::core::logging::tests
