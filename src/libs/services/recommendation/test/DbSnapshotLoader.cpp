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


#include <cstdio>
#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WTime.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Order.hpp"
#include "database/objects/OrderItem.hpp"
#include "database/objects/Product.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/IRecommendationService.hpp"

#include "ISnapshotLoader.hpp"

namespace shelf::recommendation::tests
{
    namespace
    {
        class TmpDatabase final
        {
        public:
            TmpDatabase(bool createTables = true)
                : _tmpFile{ std::tmpnam(nullptr) }
                , _db{ db::createDb(_tmpFile) }
            {
                if (createTables)
                {
                    db::Session session{ *_db };
                    session.prepareTablesIfNeeded();
                    session.createIndexesIfNeeded();
                }
            }

            ~TmpDatabase()
            {
                _db.reset();

                std::error_code ec;
                std::filesystem::remove(_tmpFile, ec);
                std::filesystem::remove(_tmpFile.string() + "-wal", ec);
                std::filesystem::remove(_tmpFile.string() + "-shm", ec);
            }

            db::IDb& getDb() { return *_db; }
            db::Session& getSession() { return _db->getTLSSession(); }

        private:
            const std::filesystem::path _tmpFile;
            std::unique_ptr<db::IDb> _db;
        };

        void addOrderItem(db::Session& session, db::IdType::ValueType id, db::IdType::ValueType orderId, db::IdType::ValueType productId)
        {
            db::OrderItem::insert(session, db::OrderItemId{ id }, db::OrderItem::Attributes{ db::OrderId{ orderId }, db::ProductId{ productId }, 1, 10. });
        }
    } // namespace

    class DbSnapshotLoaderTest : public ::testing::Test
    {
    protected:
        void populate()
        {
            db::Session& session{ _db.getSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Product::insert(session, db::ProductId{ 30 }, db::Product::Attributes{}.setName("Cable").setStock(100));
            db::Product::insert(session, db::ProductId{ 10 }, db::Product::Attributes{}.setName("Laptop").setPrice(999.).setBrand("Acme").setCategory("Computers").setRating(4.2).setPicture("laptop.jpg").setStock(5));
            db::Product::insert(session, db::ProductId{ 20 }, db::Product::Attributes{}.setName("Mouse").setPrice(19.9).setCategory("Accessories"));

            const Wt::WDateTime dateTime{ Wt::WDate{ 2025, 2, 1 }, Wt::WTime{ 9, 0, 0 } };
            db::Order::insert(session, db::OrderId{ 2 }, db::Order::Attributes{ 42, 30., dateTime });
            db::Order::insert(session, db::OrderId{ 1 }, db::Order::Attributes{ 43, 1030., dateTime });

            addOrderItem(session, 100, 2, 20);
            addOrderItem(session, 101, 1, 20);
            addOrderItem(session, 102, 1, 10);
            addOrderItem(session, 103, 2, 20); // same product twice in the same order
            addOrderItem(session, 104, 2, 99); // product no longer in the catalog
        }

        TmpDatabase _db;
        std::unique_ptr<ISnapshotLoader> _loader{ createDbSnapshotLoader(_db.getDb()) };
    };

    TEST_F(DbSnapshotLoaderTest, empty)
    {
        EXPECT_THROW(_loader->load(), SnapshotUnavailableException);
    }

    TEST_F(DbSnapshotLoaderTest, load)
    {
        populate();

        const Snapshot snapshot{ _loader->load() };

        ASSERT_EQ(snapshot.products.size(), 3);
        EXPECT_EQ(snapshot.products[0].id, db::ProductId{ 10 });
        EXPECT_EQ(snapshot.products[1].id, db::ProductId{ 20 });
        EXPECT_EQ(snapshot.products[2].id, db::ProductId{ 30 });

        const ProductRecord& laptop{ snapshot.products[0] };
        EXPECT_EQ(laptop.name, "Laptop");
        EXPECT_EQ(laptop.price, 999.);
        EXPECT_EQ(laptop.brand, "Acme");
        EXPECT_EQ(laptop.category, "Computers");
        EXPECT_EQ(laptop.rating, 4.2);
        EXPECT_EQ(laptop.picture, "laptop.jpg");
        EXPECT_EQ(laptop.stock, 5);

        const ProductRecord& cable{ snapshot.products[2] };
        EXPECT_FALSE(cable.price);
        EXPECT_FALSE(cable.brand);
        EXPECT_FALSE(cable.category);
        EXPECT_FALSE(cable.rating);
        EXPECT_EQ(cable.getPriceOrDefault(), 0.);
        EXPECT_EQ(cable.getRatingOrDefault(), 3.);

        ASSERT_EQ(snapshot.baskets.size(), 2);
        EXPECT_EQ(snapshot.baskets[0].orderId, db::OrderId{ 1 });
        EXPECT_EQ(snapshot.baskets[0].productIds, (std::vector<db::ProductId>{ db::ProductId{ 10 }, db::ProductId{ 20 } }));
        EXPECT_EQ(snapshot.baskets[1].orderId, db::OrderId{ 2 });
        EXPECT_EQ(snapshot.baskets[1].productIds, (std::vector<db::ProductId>{ db::ProductId{ 20 }, db::ProductId{ 99 } }));
    }

    TEST_F(DbSnapshotLoaderTest, productsWithoutOrders)
    {
        {
            db::Session& session{ _db.getSession() };
            auto transaction{ session.createWriteTransaction() };
            db::Product::insert(session, db::ProductId{ 1 }, db::Product::Attributes{}.setName("Alone"));
        }

        const Snapshot snapshot{ _loader->load() };
        EXPECT_EQ(snapshot.products.size(), 1);
        EXPECT_TRUE(snapshot.baskets.empty());
    }

    TEST_F(DbSnapshotLoaderTest, trainFromDatabase)
    {
        populate();

        auto service{ createRecommendationService(_db.getDb(), std::filesystem::path{ std::tmpnam(nullptr) }) };
        const TrainResult result{ service->train() };
        EXPECT_EQ(result.productCount, 3);
        EXPECT_EQ(result.basketCount, 2);

        const ResultContainer results{ service->getCoPurchased(db::ProductId{ 10 }, 5) };
        ASSERT_EQ(results.size(), 1);
        EXPECT_EQ(results[0].productId, db::ProductId{ 20 });
        EXPECT_DOUBLE_EQ(results[0].score, 1.);

        const std::optional<ModelInfo> info{ service->getModelInfo() };
        ASSERT_TRUE(info);
        std::error_code ec;
        std::filesystem::remove_all(info->cacheFile.parent_path(), ec);
    }

    TEST(DbSnapshotLoader, unreadableDatabase)
    {
        TmpDatabase db{ false };
        auto loader{ createDbSnapshotLoader(db.getDb()) };

        EXPECT_THROW(loader->load(), SnapshotUnavailableException);
    }
} // namespace shelf::recommendation::tests
