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


#include "database/Session.hpp"

#include <Wt/Dbo/Exception.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"

#include "database/objects/Order.hpp"
#include "database/objects/OrderItem.hpp"
#include "database/objects/Product.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

namespace shelf::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Order>("orders");
        _session.mapClass<OrderItem>("orderitem");
        _session.mapClass<Product>("products");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::check(transactionChecker::TransactionType::Write, _session);
#endif
    }

    void Session::checkReadTransaction() const
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::check(transactionChecker::TransactionType::Read, _session);
#endif
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, statement);
    }

    bool Session::ping()
    {
        try
        {
            auto transaction{ createReadTransaction() };
            return utils::fetchQuerySingleResult(_session.query<int>("SELECT 1")) == 1;
        }
        catch (const Wt::Dbo::Exception& e)
        {
            SHELF_LOG(DB, ERROR, "Database ping failed: " << e.what());
            return false;
        }
    }

    void Session::prepareTablesIfNeeded()
    {
        SHELF_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            SHELF_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            SHELF_LOG(DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                SHELF_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        SHELF_LOG(DB, INFO, "Creating indexes...");

        {
            auto transaction{ createWriteTransaction() };

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS orders_customer_idx ON orders(customer_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS orders_created_at_idx ON orders(created_at)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS orderitem_order_product_idx ON orderitem(order_id, product_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS orderitem_product_idx ON orderitem(product_id)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS products_category_idx ON products(category)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS products_brand_idx ON products(brand)");
        }

        SHELF_LOG(DB, INFO, "Indexes created!");
    }

    void Session::vacuum()
    {
        SHELF_LOG(DB, INFO, "Performing vacuum...");

        // We manually take a lock here since vacuum cannot be inside a transaction
        {
            std::unique_lock lock{ static_cast<Db&>(_db).getMutex() };
            static_cast<Db&>(_db).executeSql("VACUUM");
        }

        SHELF_LOG(DB, INFO, "Vacuum complete!");
    }
} // namespace shelf::db
