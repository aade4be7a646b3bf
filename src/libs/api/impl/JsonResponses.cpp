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


#include "JsonResponses.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

#include <Wt/Json/Value.h>

#include "core/String.hpp"

namespace shelf::api
{
    namespace
    {
        Wt::Json::Value toValue(std::size_t value)
        {
            return Wt::Json::Value{ static_cast<long long>(value) };
        }

        Wt::Json::Value toStringValue(std::string_view value)
        {
            return Wt::Json::Value{ std::string{ value } };
        }

        Wt::Json::Value toOptionalValue(const std::optional<std::string>& value)
        {
            return value ? toStringValue(*value) : Wt::Json::Value::Null;
        }

        Wt::Json::Value toOptionalValue(const std::optional<double>& value)
        {
            return value ? Wt::Json::Value{ *value } : Wt::Json::Value::Null;
        }

        Wt::Json::Value toDateTimeValue(const Wt::WDateTime& dateTime)
        {
            if (!dateTime.isValid())
                return Wt::Json::Value::Null;

            return toStringValue(core::stringUtils::toISO8601String(dateTime));
        }

        std::string createReason(RecommendationKind kind, double score)
        {
            std::ostringstream oss;

            switch (kind)
            {
            case RecommendationKind::Similar:
                oss << "Similar to your selected product (similarity: " << std::fixed << std::setprecision(2) << score << ")";
                break;
            case RecommendationKind::CoPurchase:
                oss << "Frequently bought together (in " << std::lround(score * 100) << "% of orders with your selected product)";
                break;
            }

            return oss.str();
        }

        Wt::Json::Object createStatisticsObject(const recommendation::ModelInfo& modelInfo)
        {
            Wt::Json::Object statistics;
            statistics["generation_id"] = toValue(modelInfo.generationId);
            statistics["products_count"] = toValue(modelInfo.productCount);
            statistics["baskets_count"] = toValue(modelInfo.basketCount);
            statistics["feature_dimension"] = toValue(modelInfo.featureDimension);
            statistics["similarity_pairs"] = toValue(modelInfo.similarityPairCount);
            statistics["copurchase_pairs"] = toValue(modelInfo.coPurchasePairCount);

            return statistics;
        }
    } // namespace

    Wt::Json::Object createRecommendationObject(const recommendation::ScoredProduct& scoredProduct, const std::optional<recommendation::ProductRecord>& product, RecommendationKind kind)
    {
        Wt::Json::Object res;

        res["product_id"] = Wt::Json::Value{ static_cast<long long>(scoredProduct.productId.getValue()) };
        if (product)
        {
            res["name"] = toStringValue(product->name);
            res["price"] = toOptionalValue(product->price);
            res["brand"] = toOptionalValue(product->brand);
            res["category"] = toOptionalValue(product->category);
            res["rating"] = toOptionalValue(product->rating);
            res["picture"] = toStringValue(product->picture);
            res["stock"] = Wt::Json::Value{ product->stock };
        }
        res["score"] = Wt::Json::Value{ scoredProduct.score };
        res["reason"] = toStringValue(createReason(kind, scoredProduct.score));

        return res;
    }

    Wt::Json::Object createTrainResultObject(const recommendation::TrainResult& result)
    {
        Wt::Json::Object res;

        res["status"] = toStringValue("success");
        res["generation_id"] = toValue(result.generationId);
        res["products_count"] = toValue(result.productCount);
        res["baskets_count"] = toValue(result.basketCount);
        res["similarity_pairs"] = toValue(result.similarityPairCount);
        res["copurchase_pairs"] = toValue(result.coPurchasePairCount);
        res["training_time_seconds"] = Wt::Json::Value{ std::chrono::duration<double>(result.duration).count() };
        res["timestamp"] = toDateTimeValue(result.createdAt);

        return res;
    }

    Wt::Json::Object createSyncStatsObject(const sync::SyncStats& stats)
    {
        Wt::Json::Object res;

        res["status"] = toStringValue("success");
        res["products_synced"] = toValue(stats.productCount);
        res["orders_synced"] = toValue(stats.orderCount);
        res["order_items_synced"] = toValue(stats.orderItemCount);
        res["sync_timestamp"] = toDateTimeValue(stats.syncTime);

        return res;
    }

    Wt::Json::Object createFullRetrainObject(const sync::SyncStats& stats, const recommendation::TrainResult& result)
    {
        Wt::Json::Object res;

        res["status"] = toStringValue("success");
        res["sync_result"] = createSyncStatsObject(stats);
        res["training_result"] = createTrainResultObject(result);

        return res;
    }

    Wt::Json::Object createHealthObject(const HealthInfo& health)
    {
        const bool healthy{ health.modelInfo && health.transactionalDbOk && health.analyticsDbOk };

        Wt::Json::Object res;
        res["status"] = toStringValue(healthy ? "healthy" : "degraded");
        res["models_trained"] = Wt::Json::Value{ health.modelInfo.has_value() };
        res["training_state"] = toStringValue(recommendation::getTrainingStateName(health.trainingStatus.state));

        if (health.trainingStatus.currentStepProgress)
        {
            const recommendation::TrainingStepProgress& stepProgress{ *health.trainingStatus.currentStepProgress };

            Wt::Json::Object progress;
            progress["step"] = toValue(stepProgress.stepIndex + 1);
            progress["step_count"] = toValue(stepProgress.stepCount);
            progress["percent"] = toValue(static_cast<std::size_t>(stepProgress.progress()));
            res["training_progress"] = std::move(progress);
        }
        if (health.trainingStatus.lastError)
            res["last_training_error"] = toStringValue(*health.trainingStatus.lastError);

        Wt::Json::Object databaseStatus;
        databaseStatus["transactional"] = toStringValue(health.transactionalDbOk ? "connected" : "error");
        databaseStatus["analytics"] = toStringValue(health.analyticsDbOk ? "connected" : "error");
        res["database_status"] = std::move(databaseStatus);

        if (health.modelInfo)
            res["model_statistics"] = createStatisticsObject(*health.modelInfo);
        else
            res["model_statistics"] = Wt::Json::Value::Null;

        res["timestamp"] = toDateTimeValue(health.now);

        return res;
    }

    Wt::Json::Object createModelsInfoObject(const std::optional<recommendation::ModelInfo>& modelInfo)
    {
        Wt::Json::Object res;

        res["models_trained"] = Wt::Json::Value{ modelInfo.has_value() };
        if (modelInfo)
        {
            res["model_file"] = toStringValue(modelInfo->cacheFile.string());
            res["statistics"] = createStatisticsObject(*modelInfo);
            res["last_updated"] = toDateTimeValue(modelInfo->createdAt);
        }
        else
        {
            res["model_file"] = Wt::Json::Value::Null;
            res["statistics"] = Wt::Json::Value::Null;
            res["last_updated"] = Wt::Json::Value::Null;
        }

        return res;
    }

    Wt::Json::Object createErrorObject(std::string_view message)
    {
        Wt::Json::Object res;

        res["status"] = toStringValue("error");
        res["error"] = toStringValue(message);

        return res;
    }
} // namespace shelf::api
