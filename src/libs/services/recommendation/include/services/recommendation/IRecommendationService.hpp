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
#include <filesystem>
#include <memory>
#include <optional>

#include "database/objects/ProductId.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/Types.hpp"

namespace shelf::db
{
    class IDb;
}

namespace shelf::recommendation
{
    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // Reloads the most recent persisted generation, returns false if none could be read
        virtual bool load() = 0;

        // Runs a whole training, the live generation is replaced on success only
        virtual TrainResult train() = 0;

        // Limits above maxResultCount are clamped
        virtual ResultContainer getSimilar(db::ProductId productId, std::size_t limit) const = 0;
        virtual ResultContainer getCoPurchased(db::ProductId productId, std::size_t limit) const = 0;

        // Catalog entry of the live generation
        virtual std::optional<ProductRecord> getProductInfo(db::ProductId productId) const = 0;

        virtual TrainingStatus getStatus() const = 0;
        virtual std::optional<ModelInfo> getModelInfo() const = 0;
    };

    // db is the analytics database
    // precomputedNeighbourCount is the size of the per product similarity cache, 0 to disable it
    std::unique_ptr<IRecommendationService> createRecommendationService(db::IDb& db, const std::filesystem::path& cacheDirectory, std::size_t precomputedNeighbourCount = 0);
} // namespace shelf::recommendation
