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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/objects/OrderId.hpp"
#include "database/objects/ProductId.hpp"

namespace shelf::recommendation
{
    static constexpr std::size_t defaultResultCount{ 10 };
    static constexpr std::size_t maxResultCount{ 50 };

    // Catalog entry, copied from the analytics database at training time
    struct ProductRecord
    {
        db::ProductId id;
        std::string name;
        std::optional<std::string> category;
        std::optional<std::string> brand;
        std::optional<double> price;
        std::optional<double> rating;
        std::string picture;
        long long stock{};

        // values used when the field is not set
        static constexpr double defaultPrice{ 0. };
        static constexpr double defaultRating{ 3. };

        double getPriceOrDefault() const { return price.value_or(defaultPrice); }
        double getRatingOrDefault() const { return rating.value_or(defaultRating); }
    };

    // Distinct products of an order, sorted by id
    struct OrderBasket
    {
        db::OrderId orderId;
        std::vector<db::ProductId> productIds;
    };

    struct ScoredProduct
    {
        db::ProductId productId;
        double score{};

        bool operator==(const ScoredProduct& other) const = default;
    };

    // Ordered by decreasing score
    using ResultContainer = std::vector<ScoredProduct>;

    enum class TrainingState
    {
        Idle,
        Syncing, // loading the snapshot
        Vectorizing,
        ComputingSimilarity,
        ComputingCoPurchase,
        Persisting,
        Ready,
        Failed,
    };

    const char* getTrainingStateName(TrainingState state);

    struct TrainResult
    {
        std::size_t generationId{};
        std::size_t productCount{};
        std::size_t basketCount{};
        std::size_t similarityPairCount{};
        std::size_t coPurchasePairCount{};
        std::chrono::milliseconds duration{};
        Wt::WDateTime createdAt;
    };

    struct TrainingStepProgress
    {
        std::size_t stepIndex{};
        std::size_t stepCount{};
        std::size_t totalElems{};
        std::size_t processedElems{};

        unsigned progress() const; // percentage of the current step
    };

    struct TrainingStatus
    {
        TrainingState state{ TrainingState::Idle };
        std::optional<TrainingStepProgress> currentStepProgress;
        std::optional<TrainResult> lastResult;
        std::optional<std::string> lastError;
    };

    struct ModelInfo
    {
        std::size_t generationId{};
        Wt::WDateTime createdAt;
        std::size_t featureDimension{};
        std::size_t productCount{};
        std::size_t basketCount{};
        std::size_t similarityPairCount{};
        std::size_t coPurchasePairCount{};
        std::filesystem::path cacheFile;
    };
} // namespace shelf::recommendation
