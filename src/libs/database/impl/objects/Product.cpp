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


#include "database/objects/Product.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(shelf::db::Product)

namespace shelf::db
{
    Product::Product(const Attributes& attributes)
        : _name{ attributes.name }
        , _price{ attributes.price }
        , _brand{ attributes.brand }
        , _category{ attributes.category }
        , _rating{ attributes.rating }
        , _picture{ attributes.picture }
        , _stock{ attributes.stock }
    {
    }

    Product::pointer Product::create(Session& session, const Attributes& attributes)
    {
        return session.getDboSession()->add(std::unique_ptr<Product>{ new Product{ attributes } });
    }

    std::size_t Product::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM products"));
    }

    Product::pointer Product::find(Session& session, ProductId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->find<Product>().where("id = ?").bind(id));
    }

    void Product::find(Session& session, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->find<Product>().orderBy("id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Product>& product) {
            func(product);
        });
    }

    void Product::insert(Session& session, ProductId id, const Attributes& attributes)
    {
        session.checkWriteTransaction();

        utils::executeCommand(*session.getDboSession(),
            "INSERT INTO products (id, version, name, price, brand, category, rating, picture, stock) VALUES (?, 0, ?, ?, ?, ?, ?, ?, ?)",
            id, attributes.name, attributes.price, attributes.brand, attributes.category, attributes.rating, attributes.picture, attributes.stock);
    }

    Product::Attributes Product::getAttributes() const
    {
        return Attributes{ _name, _price, _brand, _category, _rating, _picture, _stock };
    }
} // namespace shelf::db
