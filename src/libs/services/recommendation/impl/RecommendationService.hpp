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
#include <mutex>
#include <shared_mutex>

#include "services/recommendation/IRecommendationService.hpp"

#include "ISnapshotLoader.hpp"
#include "ModelGenerationCache.hpp"
#include "ModelStore.hpp"
#include "Progress.hpp"

namespace shelf::recommendation
{
    class RecommendationService : public IRecommendationService
    {
    public:
        RecommendationService(std::unique_ptr<ISnapshotLoader> snapshotLoader, const std::filesystem::path& cacheDirectory, std::size_t precomputedNeighbourCount);
        ~RecommendationService() override = default;
        RecommendationService(const RecommendationService&) = delete;
        RecommendationService& operator=(const RecommendationService&) = delete;

        bool load() override;
        TrainResult train() override;

        ResultContainer getSimilar(db::ProductId productId, std::size_t limit) const override;
        ResultContainer getCoPurchased(db::ProductId productId, std::size_t limit) const override;
        std::optional<ProductRecord> getProductInfo(db::ProductId productId) const override;

        TrainingStatus getStatus() const override;
        std::optional<ModelInfo> getModelInfo() const override;

    private:
        std::shared_ptr<const ModelGeneration> buildGeneration();
        std::shared_ptr<const ModelGeneration> getLiveGeneration() const; // throws ModelUnavailableException

        void setState(TrainingState state);
        ProgressCallback makeProgressCallback();

        std::unique_ptr<ISnapshotLoader> _snapshotLoader;
        const ModelGenerationCache _cache;
        const std::size_t _precomputedNeighbourCount;
        ModelStore _modelStore;

        std::mutex _trainMutex;

        mutable std::shared_mutex _statusMutex;
        TrainingStatus _status;
    };
} // namespace shelf::recommendation
