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


#pragma once

#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/Order.hpp"
#include "database/objects/OrderItem.hpp"
#include "database/objects/Product.hpp"

namespace shelf::db::tests
{
    // Row inserted on construction, deleted on destruction
    template<typename T>
    class [[nodiscard]] ScopedRow
    {
    public:
        using IdType = typename T::IdType;

        ScopedRow(Session& session, const typename T::Attributes& attributes)
            : _session{ session }
        {
            auto transaction{ _session.createWriteTransaction() };

            const typename T::pointer row{ _session.create<T>(attributes) };
            EXPECT_TRUE(row);
            _id = row->getId();
        }

        ~ScopedRow()
        {
            auto transaction{ _session.createWriteTransaction() };

            if (typename T::pointer row{ T::find(_session, _id) })
                row.remove();
        }

        ScopedRow(const ScopedRow&) = delete;
        ScopedRow& operator=(const ScopedRow&) = delete;

        // caller must hold a transaction
        typename T::pointer get() const
        {
            _session.checkReadTransaction();

            typename T::pointer row{ T::find(_session, _id) };
            EXPECT_TRUE(row);
            return row;
        }

        typename T::pointer operator->() const { return get(); }
        IdType getId() const { return _id; }

    private:
        Session& _session;
        IdType _id;
    };

    using ScopedOrder = ScopedRow<Order>;
    using ScopedOrderItem = ScopedRow<OrderItem>;
    using ScopedProduct = ScopedRow<Product>;

    // Sqlite file created in the temp directory with all the tables and indexes
    // The file and its journal files are removed on destruction
    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        IDb& getDb() { return *_db; }
        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
        std::unique_ptr<IDb> _db;
    };

    // Shares one database across the tests of a suite, each test must leave the tables empty
    class DatabaseFixture : public ::testing::Test
    {
    public:
        static void SetUpTestSuite();
        static void TearDownTestSuite();

    protected:
        void TearDown() override;

    private:
        static inline std::unique_ptr<TmpDatabase> _tmpDb;

    protected:
        Session session{ _tmpDb->getDb() };
    };
} // namespace shelf::db::tests
