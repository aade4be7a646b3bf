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

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace shelf::core::tests
{
    namespace
    {
        class ScopedConfigFile
        {
        public:
            ScopedConfigFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("shelf_test_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".conf") }
            {
                std::ofstream ofs{ _path, std::ios::trunc };
                ofs << content;
            }

            ~ScopedConfigFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(Config, values)
    {
        const ScopedConfigFile file{ R"(
working-dir = "/tmp/shelf";
listen-port = 5090;
recommendation-precomputed-neighbour-count = 20;
recommendation-train-at-startup = true;
log-min-severity = "debug";
wt-resources = "/usr/share/Wt/resources";
)" };

        std::unique_ptr<IConfig> config{ createConfig(file.getPath()) };

        EXPECT_EQ(config->getPath("working-dir", "/var/shelf"), "/tmp/shelf");
        EXPECT_EQ(config->getULong("listen-port", 1), 5090UL);
        EXPECT_EQ(config->getULong("recommendation-precomputed-neighbour-count", 0), 20UL);
        EXPECT_TRUE(config->getBool("recommendation-train-at-startup", false));
        EXPECT_EQ(config->getString("log-min-severity", "info"), "debug");
        EXPECT_EQ(config->getPath("wt-resources", ""), "/usr/share/Wt/resources");
    }

    TEST(Config, defaults)
    {
        const ScopedConfigFile file{ R"(
listen-addr = "";
listen-port = "not a number";
)" };

        std::unique_ptr<IConfig> config{ createConfig(file.getPath()) };

        EXPECT_EQ(config->getPath("working-dir", "/var/shelf"), "/var/shelf");
        EXPECT_EQ(config->getPath("listen-addr", "0.0.0.0"), "0.0.0.0");
        EXPECT_EQ(config->getULong("listen-port", 5090), 5090UL);
        EXPECT_FALSE(config->getBool("recommendation-train-at-startup", false));
        EXPECT_EQ(config->getString("log-min-severity", "info"), "info");
    }

    TEST(Config, invalidFile)
    {
        {
            const ScopedConfigFile file{ "this is = not ; valid" };
            EXPECT_THROW(createConfig(file.getPath()), ShelfException);
        }

        EXPECT_THROW(createConfig("/nonexistent/shelf.conf"), ShelfException);
    }
} // namespace shelf::core::tests
