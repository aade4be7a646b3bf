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

#include <Wt/WDate.h>
#include <Wt/WTime.h>

namespace shelf::db::tests
{
    TEST_F(DatabaseFixture, Order)
    {
        const Wt::WDateTime createdAt{ Wt::WDate{ 2025, 1, 15 }, Wt::WTime{ 10, 30, 0 } };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Order::getCount(session), 0);
        }

        ScopedOrder order{ session, Order::Attributes{ 7, 59.9, createdAt } };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Order::getCount(session), 1);

            const Order::pointer found{ Order::find(session, order.getId()) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getCustomerId(), 7);
            EXPECT_DOUBLE_EQ(found->getTotalAmount(), 59.9);
            EXPECT_EQ(found->getCreatedAt(), createdAt);
        }
    }

    TEST_F(DatabaseFixture, Order_insertWithId)
    {
        const Wt::WDateTime createdAt{ Wt::WDate{ 2024, 12, 24 }, Wt::WTime{ 18, 0, 0 } };
        const OrderId id{ 100 };

        {
            auto transaction{ session.createWriteTransaction() };
            Order::insert(session, id, Order::Attributes{ 3, 12.5, createdAt });
        }

        {
            auto transaction{ session.createReadTransaction() };

            std::vector<OrderId> ids;
            Order::find(session, [&](const Order::pointer& order) {
                ids.push_back(order->getId());
                EXPECT_EQ(order->getCreatedAt(), createdAt);
                EXPECT_EQ(order->getCustomerId(), 3);
            });
            EXPECT_EQ(ids, std::vector<OrderId>{ id });
        }

        {
            auto transaction{ session.createWriteTransaction() };
            session.destroyAll<Order>();
        }
    }
} // namespace shelf::db::tests
