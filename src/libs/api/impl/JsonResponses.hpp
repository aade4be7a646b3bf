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

#include <optional>
#include <string_view>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/WDateTime.h>

#include "services/recommendation/Types.hpp"
#include "services/sync/ISyncService.hpp"

namespace shelf::api
{
    enum class RecommendationKind
    {
        Similar,
        CoPurchase,
    };

    // product may be unknown if it is not in the catalog
    Wt::Json::Object createRecommendationObject(const recommendation::ScoredProduct& scoredProduct, const std::optional<recommendation::ProductRecord>& product, RecommendationKind kind);

    Wt::Json::Object createTrainResultObject(const recommendation::TrainResult& result);
    Wt::Json::Object createSyncStatsObject(const sync::SyncStats& stats);
    Wt::Json::Object createFullRetrainObject(const sync::SyncStats& stats, const recommendation::TrainResult& result);

    struct HealthInfo
    {
        bool transactionalDbOk{};
        bool analyticsDbOk{};
        recommendation::TrainingStatus trainingStatus;
        std::optional<recommendation::ModelInfo> modelInfo;
        Wt::WDateTime now;
    };
    Wt::Json::Object createHealthObject(const HealthInfo& health);

    Wt::Json::Object createModelsInfoObject(const std::optional<recommendation::ModelInfo>& modelInfo);

    Wt::Json::Object createErrorObject(std::string_view message);
} // namespace shelf::api
