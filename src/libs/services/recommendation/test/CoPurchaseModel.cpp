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


#include <memory>
#include <random>

#include <gtest/gtest.h>

#include "services/recommendation/Exception.hpp"

#include "Catalog.hpp"
#include "CoPurchaseModel.hpp"
#include "Common.hpp"

namespace shelf::recommendation::tests
{
    namespace
    {
        std::shared_ptr<const Catalog> createCatalog(std::size_t productCount)
        {
            std::vector<ProductRecord> products;
            for (std::size_t i{ 1 }; i <= productCount; ++i)
                products.push_back(makeProduct(i, std::nullopt, std::nullopt, std::nullopt, std::nullopt));

            return std::make_shared<const Catalog>(std::move(products));
        }
    } // namespace

    TEST(CoPurchaseModel, strengthScenario)
    {
        const CoPurchaseModel model{ createCatalog(3), { makeBasket(1, { 1, 2 }), makeBasket(2, { 1, 2 }), makeBasket(3, { 1, 3 }) } };

        const ResultContainer results{ model.getCoPurchased(db::ProductId{ 1 }, 5) };
        ASSERT_EQ(results.size(), 2);
        EXPECT_EQ(results[0].productId, db::ProductId{ 2 });
        EXPECT_DOUBLE_EQ(results[0].score, 2. / 3.);
        EXPECT_EQ(results[1].productId, db::ProductId{ 3 });
        EXPECT_DOUBLE_EQ(results[1].score, 1. / 3.);

        // normalized by the support of the queried product
        const ResultContainer resultsB{ model.getCoPurchased(db::ProductId{ 2 }, 5) };
        ASSERT_EQ(resultsB.size(), 1);
        EXPECT_EQ(resultsB[0].productId, db::ProductId{ 1 });
        EXPECT_DOUBLE_EQ(resultsB[0].score, 1.);

        EXPECT_EQ(model.getBasketCount(), 3);
        EXPECT_EQ(model.getPairCount(), 4);
    }

    TEST(CoPurchaseModel, singleProductBasketsCountAsSupport)
    {
        const CoPurchaseModel model{ createCatalog(3), { makeBasket(1, { 1, 3 }), makeBasket(2, { 3 }) } };

        const ResultContainer results{ model.getCoPurchased(db::ProductId{ 3 }, 5) };
        ASSERT_EQ(results.size(), 1);
        EXPECT_DOUBLE_EQ(results[0].score, 0.5);

        EXPECT_EQ(model.getSupports(), (std::vector<std::size_t>{ 1, 0, 2 }));
        EXPECT_EQ(model.getBasketCount(), 2);
    }

    TEST(CoPurchaseModel, neverPurchased)
    {
        const CoPurchaseModel model{ createCatalog(4), { makeBasket(1, { 1, 2 }) } };

        EXPECT_TRUE(model.getCoPurchased(db::ProductId{ 4 }, 5).empty());
    }

    TEST(CoPurchaseModel, notFound)
    {
        const CoPurchaseModel model{ createCatalog(2), { makeBasket(1, { 1, 2 }) } };

        EXPECT_THROW(model.getCoPurchased(db::ProductId{ 3 }, 5), NotFoundException);
    }

    TEST(CoPurchaseModel, emptyBasketSet)
    {
        EXPECT_THROW((CoPurchaseModel{ createCatalog(2), {} }), EmptyBasketSetException);
    }

    TEST(CoPurchaseModel, unknownProductsIgnored)
    {
        // product 99 is not in the catalog anymore
        const CoPurchaseModel model{ createCatalog(2), { makeBasket(1, { 1, 99 }), makeBasket(2, { 1, 2 }) } };

        const ResultContainer results{ model.getCoPurchased(db::ProductId{ 1 }, 5) };
        ASSERT_EQ(results.size(), 1);
        EXPECT_EQ(results[0].productId, db::ProductId{ 2 });
        EXPECT_DOUBLE_EQ(results[0].score, 0.5);

        EXPECT_THROW((CoPurchaseModel{ createCatalog(2), { makeBasket(1, { 98, 99 }) } }), EmptyBasketSetException);
    }

    TEST(CoPurchaseModel, tieBreak)
    {
        auto catalog{ std::make_shared<const Catalog>(std::vector<ProductRecord>{
            makeProduct(1, std::nullopt, std::nullopt, std::nullopt, 4.0),
            makeProduct(2, std::nullopt, std::nullopt, std::nullopt, 3.0),
            makeProduct(3, std::nullopt, std::nullopt, std::nullopt, 5.0),
            makeProduct(4, std::nullopt, std::nullopt, std::nullopt, 3.0),
            makeProduct(5, std::nullopt, std::nullopt, std::nullopt, std::nullopt),
        }) };
        const CoPurchaseModel model{ catalog, { makeBasket(1, { 1, 2, 3, 4, 5 }) } };

        const ResultContainer results{ model.getCoPurchased(db::ProductId{ 1 }, 5) };
        ASSERT_EQ(results.size(), 4);
        EXPECT_EQ(results[0].productId, db::ProductId{ 3 });
        // no rating counts as 3
        EXPECT_EQ(results[1].productId, db::ProductId{ 2 });
        EXPECT_EQ(results[2].productId, db::ProductId{ 4 });
        EXPECT_EQ(results[3].productId, db::ProductId{ 5 });
    }

    TEST(CoPurchaseModel, limits)
    {
        const CoPurchaseModel model{ createCatalog(4), { makeBasket(1, { 1, 2, 3, 4 }) } };

        EXPECT_TRUE(model.getCoPurchased(db::ProductId{ 1 }, 0).empty());
        EXPECT_EQ(model.getCoPurchased(db::ProductId{ 1 }, 2).size(), 2);
        EXPECT_EQ(model.getCoPurchased(db::ProductId{ 1 }, 10).size(), 3);
    }

    TEST(CoPurchaseModel, strengthBounds)
    {
        constexpr std::size_t productCount{ 20 };
        auto catalog{ createCatalog(productCount) };

        std::mt19937 generator{ 42 };
        std::uniform_int_distribution<db::IdType::ValueType> productDistribution{ 1, productCount };
        std::uniform_int_distribution<std::size_t> sizeDistribution{ 1, 6 };

        std::vector<OrderBasket> baskets;
        for (db::IdType::ValueType orderId{ 1 }; orderId <= 200; ++orderId)
        {
            OrderBasket basket{ db::OrderId{ orderId }, {} };
            const std::size_t size{ sizeDistribution(generator) };
            for (std::size_t i{}; i < size; ++i)
                basket.productIds.push_back(db::ProductId{ productDistribution(generator) });

            // duplicated products are counted once
            baskets.push_back(std::move(basket));
        }

        const CoPurchaseModel model{ catalog, baskets };
        for (const ProductRecord& product : catalog->getProducts())
        {
            for (const ScoredProduct& result : model.getCoPurchased(product.id, maxResultCount))
            {
                EXPECT_GT(result.score, 0);
                EXPECT_LE(result.score, 1);
                EXPECT_NE(result.productId, product.id);
            }
        }
    }
} // namespace shelf::recommendation::tests
