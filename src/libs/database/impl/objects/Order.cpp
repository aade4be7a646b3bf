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


#include "database/objects/Order.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(shelf::db::Order)

namespace shelf::db
{
    Order::Order(const Attributes& attributes)
        : _customerId{ attributes.customerId }
        , _totalAmount{ attributes.totalAmount }
        , _createdAt{ attributes.createdAt }
    {
    }

    Order::pointer Order::create(Session& session, const Attributes& attributes)
    {
        return session.getDboSession()->add(std::unique_ptr<Order>{ new Order{ attributes } });
    }

    std::size_t Order::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM orders"));
    }

    Order::pointer Order::find(Session& session, OrderId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->find<Order>().where("id = ?").bind(id));
    }

    void Order::find(Session& session, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->find<Order>().orderBy("id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Order>& order) {
            func(order);
        });
    }

    void Order::insert(Session& session, OrderId id, const Attributes& attributes)
    {
        session.checkWriteTransaction();

        utils::executeCommand(*session.getDboSession(),
            "INSERT INTO orders (id, version, customer_id, total_amount, created_at) VALUES (?, 0, ?, ?, ?)",
            id, attributes.customerId, attributes.totalAmount, attributes.createdAt);
    }
} // namespace shelf::db
