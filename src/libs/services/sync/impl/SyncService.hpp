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

#include <mutex>
#include <utility>
#include <vector>

#include "database/objects/Order.hpp"
#include "database/objects/OrderItem.hpp"
#include "database/objects/Product.hpp"
#include "services/sync/ISyncService.hpp"

namespace shelf::sync
{
    class SyncService final : public ISyncService
    {
    public:
        SyncService(db::IDb& transactionalDb, db::IDb& analyticsDb);
        ~SyncService() override = default;
        SyncService(const SyncService&) = delete;
        SyncService& operator=(const SyncService&) = delete;

    private:
        SyncStats sync() override;

        // Full copy of the transactional tables
        struct Rows
        {
            std::vector<std::pair<db::ProductId, db::Product::Attributes>> products;
            std::vector<std::pair<db::OrderId, db::Order::Attributes>> orders;
            std::vector<std::pair<db::OrderItemId, db::OrderItem::Attributes>> orderItems;
        };

        Rows readTransactionalRows();
        void replaceAnalyticsRows(const Rows& rows);

        db::IDb& _transactionalDb;
        db::IDb& _analyticsDb;

        std::mutex _syncMutex;
    };
} // namespace shelf::sync
