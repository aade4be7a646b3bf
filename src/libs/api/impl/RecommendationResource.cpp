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


#include "RecommendationResource.hpp"

#include <atomic>

#include <Wt/Json/Array.h>
#include <Wt/Json/Serializer.h>
#include <Wt/Json/Value.h>

#include "api/RecommendationResource.hpp"
#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/sync/ISyncService.hpp"

#include "Error.hpp"
#include "JsonResponses.hpp"

namespace shelf::api
{
    std::unique_ptr<Wt::WResource> createRecommendationResource(db::IDb& transactionalDb, db::IDb& analyticsDb, sync::ISyncService& syncService, recommendation::IRecommendationService& recommendationService)
    {
        return std::make_unique<RecommendationResource>(transactionalDb, analyticsDb, syncService, recommendationService);
    }

    RecommendationResource::RecommendationResource(db::IDb& transactionalDb, db::IDb& analyticsDb, sync::ISyncService& syncService, recommendation::IRecommendationService& recommendationService)
        : _transactionalDb{ transactionalDb }
        , _analyticsDb{ analyticsDb }
        , _syncService{ syncService }
        , _recommendationService{ recommendationService }
    {
    }

    RecommendationResource::~RecommendationResource()
    {
        beingDeleted();
    }

    void RecommendationResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        static std::atomic<std::size_t> curRequestId{};

        const std::size_t requestId{ curRequestId++ };

        SHELF_LOG(HTTP, DEBUG, "Handling request " << requestId << " " << request.method() << " '" << request.pathInfo() << "'");

        response.setMimeType("application/json");

        try
        {
            const Route route{ parseRoute(request.method(), request.pathInfo()) };
            const std::string body{ processRequest(route, request) };

            response.setStatus(200);
            response.out() << body;

            SHELF_LOG(HTTP, DEBUG, "Request " << requestId << " handled!");
        }
        catch (const core::ShelfException& e)
        {
            const int status{ getHttpStatus(e) };
            if (status >= 500)
            {
                SHELF_LOG(HTTP, ERROR, "Error while processing request " << requestId << " '" << request.pathInfo() << "', status = " << status << ", msg = '" << e.what() << "'");
            }
            else
            {
                SHELF_LOG(HTTP, DEBUG, "Request " << requestId << " rejected, status = " << status << ", msg = '" << e.what() << "'");
            }

            response.setStatus(status);
            response.out() << Wt::Json::serialize(createErrorObject(e.what()));
        }
    }

    std::string RecommendationResource::processRequest(const Route& route, const Wt::Http::Request& request)
    {
        switch (route.endpoint)
        {
        case Endpoint::Similar:
        case Endpoint::CoPurchase:
            return handleRecommendationRequest(route, request);

        case Endpoint::Train:
            return Wt::Json::serialize(createTrainResultObject(_recommendationService.train()));

        case Endpoint::SyncData:
            return Wt::Json::serialize(createSyncStatsObject(_syncService.sync()));

        case Endpoint::FullRetrain:
        {
            const sync::SyncStats stats{ _syncService.sync() };
            const recommendation::TrainResult result{ _recommendationService.train() };
            return Wt::Json::serialize(createFullRetrainObject(stats, result));
        }

        case Endpoint::Health:
            return Wt::Json::serialize(handleHealthRequest());

        case Endpoint::ModelsInfo:
            return Wt::Json::serialize(createModelsInfoObject(_recommendationService.getModelInfo()));
        }

        throw UnknownEndpointError{};
    }

    std::string RecommendationResource::handleRecommendationRequest(const Route& route, const Wt::Http::Request& request)
    {
        const std::size_t limit{ parseLimit(request.getParameterMap()) };

        const bool similar{ route.endpoint == Endpoint::Similar };
        const recommendation::ResultContainer results{ similar ? _recommendationService.getSimilar(*route.productId, limit) : _recommendationService.getCoPurchased(*route.productId, limit) };

        Wt::Json::Array array;
        for (const recommendation::ScoredProduct& result : results)
            array.push_back(createRecommendationObject(result, _recommendationService.getProductInfo(result.productId), similar ? RecommendationKind::Similar : RecommendationKind::CoPurchase));

        return Wt::Json::serialize(array);
    }

    Wt::Json::Object RecommendationResource::handleHealthRequest()
    {
        HealthInfo health;
        health.transactionalDbOk = _transactionalDb.getTLSSession().ping();
        health.analyticsDbOk = _analyticsDb.getTLSSession().ping();
        health.trainingStatus = _recommendationService.getStatus();
        health.modelInfo = _recommendationService.getModelInfo();
        health.now = Wt::WDateTime::currentDateTime();

        return createHealthObject(health);
    }
} // namespace shelf::api
