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

#include <cstddef>
#include <memory>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"

namespace shelf::db
{
    class IDb;
}

namespace shelf::sync
{
    class Exception : public core::ShelfException
    {
    public:
        using ShelfException::ShelfException;
    };

    struct SyncStats
    {
        std::size_t productCount{};
        std::size_t orderCount{};
        std::size_t orderItemCount{};
        Wt::WDateTime syncTime;
    };

    // Refreshes the analytics database from the transactional database
    class ISyncService
    {
    public:
        virtual ~ISyncService() = default;

        // Blocks until any running sync completes
        // The analytics database is left untouched on failure
        virtual SyncStats sync() = 0;
    };

    std::unique_ptr<ISyncService> createSyncService(db::IDb& transactionalDb, db::IDb& analyticsDb);
} // namespace shelf::sync
