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


#include "DbSnapshotLoader.hpp"

#include <algorithm>

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/OrderItem.hpp"
#include "database/objects/Product.hpp"
#include "services/recommendation/Exception.hpp"

namespace shelf::recommendation
{
    namespace
    {
        ProductRecord toProductRecord(const db::Product::pointer& product)
        {
            ProductRecord record;
            record.id = product->getId();
            record.name = product->getName();
            record.category = product->getCategory();
            record.brand = product->getBrand();
            record.price = product->getPrice();
            record.rating = product->getRating();
            record.picture = product->getPicture();
            record.stock = product->getStock();

            return record;
        }
    } // namespace

    std::unique_ptr<ISnapshotLoader> createDbSnapshotLoader(db::IDb& db)
    {
        return std::make_unique<DbSnapshotLoader>(db);
    }

    DbSnapshotLoader::DbSnapshotLoader(db::IDb& db)
        : _db{ db }
    {
    }

    Snapshot DbSnapshotLoader::load()
    {
        Snapshot snapshot;
        std::size_t orderItemCount{};

        try
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Product::find(session, [&](const db::Product::pointer& product) {
                snapshot.products.push_back(toProductRecord(product));
            });

            // items come ordered by order
            db::OrderItem::find(session, [&](const db::OrderItem::pointer& orderItem) {
                orderItemCount++;

                if (snapshot.baskets.empty() || snapshot.baskets.back().orderId != orderItem->getOrderId())
                    snapshot.baskets.push_back(OrderBasket{ orderItem->getOrderId(), {} });

                snapshot.baskets.back().productIds.push_back(orderItem->getProductId());
            });
        }
        catch (const Wt::Dbo::Exception& e)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot read snapshot: " << e.what());
            throw SnapshotUnavailableException{ e.what() };
        }

        if (snapshot.products.empty() && orderItemCount == 0)
            throw SnapshotUnavailableException{ "no product and no order item" };

        for (OrderBasket& basket : snapshot.baskets)
        {
            std::sort(std::begin(basket.productIds), std::end(basket.productIds));
            basket.productIds.erase(std::unique(std::begin(basket.productIds), std::end(basket.productIds)), std::end(basket.productIds));
        }

        SHELF_LOG(RECOMMENDATION, INFO, "Snapshot loaded: " << snapshot.products.size() << " products, " << snapshot.baskets.size() << " baskets (" << orderItemCount << " order items)");

        return snapshot;
    }
} // namespace shelf::recommendation
