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


#include "Common.hpp"

#include <cstdio>

namespace shelf::db::tests
{
    TmpDatabase::TmpDatabase()
        : _path{ std::tmpnam(nullptr) }
        , _db{ createDb(_path) }
    {
        Session session{ *_db };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();

        std::error_code ec;
        for (const char* suffix : { "", "-wal", "-shm" })
            std::filesystem::remove(_path.string() + suffix, ec);
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::TearDown()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(OrderItem::getCount(session), 0);
        EXPECT_EQ(Order::getCount(session), 0);
        EXPECT_EQ(Product::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, vacuum)
    {
        session.vacuum();
    }

    TEST_F(DatabaseFixture, ping)
    {
        EXPECT_TRUE(session.ping());
    }

    TEST_F(DatabaseFixture, prepareTablesTwice)
    {
        EXPECT_NO_THROW(session.prepareTablesIfNeeded());
        EXPECT_NO_THROW(session.createIndexesIfNeeded());
    }

    TEST_F(DatabaseFixture, Common_IdType)
    {
        {
            const ProductId id{};
            EXPECT_FALSE(id.isValid());
        }

        {
            const ProductId id{ 0 };
            EXPECT_TRUE(id.isValid());
            EXPECT_EQ(id.toString(), "0");
        }

        {
            const ProductId id1{ 0 };
            const ProductId id2{ 0 };
            EXPECT_EQ(id1, id2);
            EXPECT_EQ(std::hash<ProductId>{}(id1), std::hash<ProductId>{}(id2));
        }

        {
            const ProductId id1{ 0 };
            const ProductId id2{ 1 };
            EXPECT_NE(id1, id2);
            EXPECT_LT(id1, id2);
            EXPECT_GT(id2, id1);
        }
    }
} // namespace shelf::db::tests
