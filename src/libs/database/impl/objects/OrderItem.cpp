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


#include "database/objects/OrderItem.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(shelf::db::OrderItem)

namespace shelf::db
{
    OrderItem::OrderItem(const Attributes& attributes)
        : _orderId{ attributes.order }
        , _productId{ attributes.product }
        , _quantity{ attributes.quantity }
        , _totalAmount{ attributes.totalAmount }
    {
    }

    OrderItem::pointer OrderItem::create(Session& session, const Attributes& attributes)
    {
        return session.getDboSession()->add(std::unique_ptr<OrderItem>{ new OrderItem{ attributes } });
    }

    std::size_t OrderItem::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM orderitem"));
    }

    OrderItem::pointer OrderItem::find(Session& session, OrderItemId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->find<OrderItem>().where("id = ?").bind(id));
    }

    void OrderItem::find(Session& session, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->find<OrderItem>().orderBy("order_id, product_id, id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<OrderItem>& orderItem) {
            func(orderItem);
        });
    }

    std::vector<OrderItem::pointer> OrderItem::findByOrder(Session& session, OrderId order)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->find<OrderItem>().where("order_id = ?").bind(order).orderBy("product_id, id") };

        std::vector<pointer> res;
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<OrderItem>& orderItem) {
            res.push_back(orderItem);
        });

        return res;
    }

    void OrderItem::insert(Session& session, OrderItemId id, const Attributes& attributes)
    {
        session.checkWriteTransaction();

        utils::executeCommand(*session.getDboSession(),
            "INSERT INTO orderitem (id, version, order_id, product_id, quantity, total_amount) VALUES (?, 0, ?, ?, ?, ?)",
            id, attributes.order, attributes.product, attributes.quantity, attributes.totalAmount);
    }
} // namespace shelf::db
