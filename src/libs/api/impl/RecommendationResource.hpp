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

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Json/Object.h>
#include <Wt/WResource.h>

#include "RequestParsing.hpp"

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
    class RecommendationResource final : public Wt::WResource
    {
    public:
        RecommendationResource(db::IDb& transactionalDb, db::IDb& analyticsDb, sync::ISyncService& syncService, recommendation::IRecommendationService& recommendationService);
        ~RecommendationResource() override;
        RecommendationResource(const RecommendationResource&) = delete;
        RecommendationResource& operator=(const RecommendationResource&) = delete;

    private:
        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;

        // returns either an object or an array, serialized
        std::string processRequest(const Route& route, const Wt::Http::Request& request);

        std::string handleRecommendationRequest(const Route& route, const Wt::Http::Request& request);
        Wt::Json::Object handleHealthRequest();

        db::IDb& _transactionalDb;
        db::IDb& _analyticsDb;
        sync::ISyncService& _syncService;
        recommendation::IRecommendationService& _recommendationService;
    };
} // namespace shelf::api
