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


#include "SyncService.hpp"

#include <chrono>

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"

namespace shelf::sync
{
    std::unique_ptr<ISyncService> createSyncService(db::IDb& transactionalDb, db::IDb& analyticsDb)
    {
        return std::make_unique<SyncService>(transactionalDb, analyticsDb);
    }

    SyncService::SyncService(db::IDb& transactionalDb, db::IDb& analyticsDb)
        : _transactionalDb{ transactionalDb }
        , _analyticsDb{ analyticsDb }
    {
    }

    SyncStats SyncService::sync()
    {
        std::scoped_lock lock{ _syncMutex };

        SHELF_LOG(SYNC, INFO, "Starting analytics data sync...");
        const auto startTime{ std::chrono::steady_clock::now() };

        // never hold transactions on both databases at the same time
        const Rows rows{ readTransactionalRows() };
        replaceAnalyticsRows(rows);

        SyncStats stats;
        stats.productCount = rows.products.size();
        stats.orderCount = rows.orders.size();
        stats.orderItemCount = rows.orderItems.size();
        stats.syncTime = Wt::WDateTime::currentDateTime();

        const auto duration{ std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime) };
        SHELF_LOG(SYNC, INFO, "Sync complete in " << duration.count() << " ms: " << stats.productCount << " products, " << stats.orderCount << " orders, " << stats.orderItemCount << " order items");

        return stats;
    }

    SyncService::Rows SyncService::readTransactionalRows()
    {
        Rows rows;

        try
        {
            db::Session& session{ _transactionalDb.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Product::find(session, [&](const db::Product::pointer& product) {
                rows.products.emplace_back(product->getId(), product->getAttributes());
            });
            db::Order::find(session, [&](const db::Order::pointer& order) {
                rows.orders.emplace_back(order->getId(), order->getAttributes());
            });
            db::OrderItem::find(session, [&](const db::OrderItem::pointer& orderItem) {
                rows.orderItems.emplace_back(orderItem->getId(), orderItem->getAttributes());
            });
        }
        catch (const Wt::Dbo::Exception& e)
        {
            SHELF_LOG(SYNC, ERROR, "Cannot read transactional data: " << e.what());
            throw Exception{ std::string{ "Cannot read transactional data: " } + e.what() };
        }

        SHELF_LOG(SYNC, DEBUG, "Read " << rows.products.size() << " products, " << rows.orders.size() << " orders and " << rows.orderItems.size() << " order items");

        return rows;
    }

    void SyncService::replaceAnalyticsRows(const Rows& rows)
    {
        try
        {
            db::Session& session{ _analyticsDb.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            session.destroyAll<db::OrderItem>();
            session.destroyAll<db::Order>();
            session.destroyAll<db::Product>();

            for (const auto& [id, attributes] : rows.products)
                db::Product::insert(session, id, attributes);
            for (const auto& [id, attributes] : rows.orders)
                db::Order::insert(session, id, attributes);
            for (const auto& [id, attributes] : rows.orderItems)
                db::OrderItem::insert(session, id, attributes);
        }
        catch (const Wt::Dbo::Exception& e)
        {
            SHELF_LOG(SYNC, ERROR, "Cannot write analytics data: " << e.what());
            throw Exception{ std::string{ "Cannot write analytics data: " } + e.what() };
        }
    }
} // namespace shelf::sync
