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

#include <functional>
#include <vector>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/OrderId.hpp"
#include "database/objects/OrderItemId.hpp"
#include "database/objects/ProductId.hpp"

namespace shelf::db
{
    class Session;

    // Order and product are plain ids: the order history may refer to
    // products that are no longer in the catalog
    class OrderItem final : public Object<OrderItem, OrderItemId>
    {
    public:
        struct Attributes
        {
            OrderId order;
            ProductId product;
            int quantity{ 1 };
            double totalAmount{};
        };

        OrderItem() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, OrderItemId id);
        static void find(Session& session, const std::function<void(const pointer&)>& func); // ordered by order, then by product
        static std::vector<pointer> findByOrder(Session& session, OrderId order);

        // Inserts a row using the given id
        static void insert(Session& session, OrderItemId id, const Attributes& attributes);

        OrderId getOrderId() const { return _orderId; }
        ProductId getProductId() const { return _productId; }
        int getQuantity() const { return _quantity; }
        double getTotalAmount() const { return _totalAmount; }
        Attributes getAttributes() const { return Attributes{ _orderId, _productId, _quantity, _totalAmount }; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _orderId, "order_id");
            Wt::Dbo::field(a, _productId, "product_id");
            Wt::Dbo::field(a, _quantity, "quantity");
            Wt::Dbo::field(a, _totalAmount, "total_amount");
        }

    private:
        friend class Session;
        OrderItem(const Attributes& attributes);
        static pointer create(Session& session, const Attributes& attributes);

        OrderId _orderId;
        ProductId _productId;
        int _quantity{};
        double _totalAmount{};
    };
} // namespace shelf::db
