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

#include <memory>

#include <Wt/WResource.h>

namespace shelf::db
{
    class IDb;
}

namespace shelf::recommendation
{
    class IRecommendationService;
}

namespace shelf::sync
{
    class ISyncService;
}

namespace shelf::api
{
    // JSON API, to be mounted under the configured deploy path
    std::unique_ptr<Wt::WResource> createRecommendationResource(db::IDb& transactionalDb, db::IDb& analyticsDb, sync::ISyncService& syncService, recommendation::IRecommendationService& recommendationService);
} // namespace shelf::api
