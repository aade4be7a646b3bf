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

#include "services/recommendation/Types.hpp"

#include "Error.hpp"
#include "RequestParsing.hpp"

namespace shelf::api::tests
{
    TEST(RequestParsing, routes)
    {
        {
            const Route route{ parseRoute("GET", "/similar/12") };
            EXPECT_EQ(route.endpoint, Endpoint::Similar);
            ASSERT_TRUE(route.productId);
            EXPECT_EQ(*route.productId, db::ProductId{ 12 });
        }
        {
            const Route route{ parseRoute("GET", "/copurchase/7/") };
            EXPECT_EQ(route.endpoint, Endpoint::CoPurchase);
            ASSERT_TRUE(route.productId);
            EXPECT_EQ(*route.productId, db::ProductId{ 7 });
        }

        EXPECT_EQ(parseRoute("POST", "/train").endpoint, Endpoint::Train);
        EXPECT_EQ(parseRoute("POST", "/sync-data").endpoint, Endpoint::SyncData);
        EXPECT_EQ(parseRoute("POST", "/full-retrain").endpoint, Endpoint::FullRetrain);
        EXPECT_EQ(parseRoute("GET", "/health").endpoint, Endpoint::Health);
        EXPECT_EQ(parseRoute("GET", "/models/info").endpoint, Endpoint::ModelsInfo);
        EXPECT_FALSE(parseRoute("GET", "/health").productId);
    }

    TEST(RequestParsing, unknownRoutes)
    {
        EXPECT_THROW(parseRoute("GET", ""), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/foo"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/similar"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/similar/"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/similar/1/2"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/similarities/1"), UnknownEndpointError);
        EXPECT_THROW(parseRoute("GET", "/models"), UnknownEndpointError);
    }

    TEST(RequestParsing, badProductId)
    {
        EXPECT_THROW(parseRoute("GET", "/similar/abc"), BadParameterError);
        EXPECT_THROW(parseRoute("GET", "/similar/-1"), BadParameterError);
        EXPECT_THROW(parseRoute("GET", "/copurchase/1.5"), BadParameterError);
    }

    TEST(RequestParsing, wrongMethod)
    {
        EXPECT_THROW(parseRoute("GET", "/train"), MethodNotAllowedError);
        EXPECT_THROW(parseRoute("POST", "/similar/1"), MethodNotAllowedError);
        EXPECT_THROW(parseRoute("POST", "/similar/abc"), MethodNotAllowedError);
        EXPECT_THROW(parseRoute("DELETE", "/copurchase/-3"), MethodNotAllowedError);
    }

    TEST(RequestParsing, limit)
    {
        EXPECT_EQ(parseLimit({}), recommendation::defaultResultCount);
        EXPECT_EQ(parseLimit({ { "limit", { "5" } } }), 5);
        EXPECT_EQ(parseLimit({ { "limit", { "0" } } }), 0);
        EXPECT_EQ(parseLimit({ { "limit", { "50" } } }), 50);
        EXPECT_EQ(parseLimit({ { "limit", { "51" } } }), recommendation::maxResultCount);
        EXPECT_EQ(parseLimit({ { "limit", { "100000" } } }), recommendation::maxResultCount);
        EXPECT_EQ(parseLimit({ { "other", { "3" } } }), recommendation::defaultResultCount);

        EXPECT_THROW(parseLimit({ { "limit", { "abc" } } }), BadParameterError);
        EXPECT_THROW(parseLimit({ { "limit", { "-1" } } }), BadParameterError);
        EXPECT_THROW(parseLimit({ { "limit", { "" } } }), BadParameterError);
        EXPECT_THROW(parseLimit({ { "limit", { "1", "2" } } }), BadParameterError);
    }
} // namespace shelf::api::tests
