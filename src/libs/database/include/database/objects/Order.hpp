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

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/OrderId.hpp"

namespace shelf::db
{
    class Session;

    class Order final : public Object<Order, OrderId>
    {
    public:
        struct Attributes
        {
            long long customerId{};
            double totalAmount{};
            Wt::WDateTime createdAt;
        };

        Order() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, OrderId id);
        static void find(Session& session, const std::function<void(const pointer&)>& func); // ordered by id

        // Inserts a row using the given id
        static void insert(Session& session, OrderId id, const Attributes& attributes);

        long long getCustomerId() const { return _customerId; }
        double getTotalAmount() const { return _totalAmount; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        Attributes getAttributes() const { return Attributes{ _customerId, _totalAmount, _createdAt }; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _customerId, "customer_id");
            Wt::Dbo::field(a, _totalAmount, "total_amount");
            Wt::Dbo::field(a, _createdAt, "created_at");
        }

    private:
        friend class Session;
        Order(const Attributes& attributes);
        static pointer create(Session& session, const Attributes& attributes);

        long long _customerId{};
        double _totalAmount{};
        Wt::WDateTime _createdAt;
    };
} // namespace shelf::db
