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


#include "RecommendationService.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <optional>

#include "core/ILogger.hpp"

#include "CoPurchaseModel.hpp"
#include "DbSnapshotLoader.hpp"
#include "FeatureVectorizer.hpp"
#include "ModelGeneration.hpp"
#include "SimilarityModel.hpp"

namespace shelf::recommendation
{
    namespace
    {
        // Training steps, in order
        constexpr TrainingState trainingSteps[]{
            TrainingState::Syncing,
            TrainingState::Vectorizing,
            TrainingState::ComputingSimilarity,
            TrainingState::ComputingCoPurchase,
            TrainingState::Persisting,
        };

        std::optional<std::size_t> getStepIndex(TrainingState state)
        {
            const auto it{ std::find(std::cbegin(trainingSteps), std::cend(trainingSteps), state) };
            if (it == std::cend(trainingSteps))
                return std::nullopt;

            return std::distance(std::cbegin(trainingSteps), it);
        }

        std::size_t clampLimit(std::size_t limit)
        {
            return std::min(limit, maxResultCount);
        }
    } // namespace

    std::unique_ptr<IRecommendationService> createRecommendationService(db::IDb& db, const std::filesystem::path& cacheDirectory, std::size_t precomputedNeighbourCount)
    {
        return std::make_unique<RecommendationService>(createDbSnapshotLoader(db), cacheDirectory, precomputedNeighbourCount);
    }

    RecommendationService::RecommendationService(std::unique_ptr<ISnapshotLoader> snapshotLoader, const std::filesystem::path& cacheDirectory, std::size_t precomputedNeighbourCount)
        : _snapshotLoader{ std::move(snapshotLoader) }
        , _cache{ cacheDirectory }
        , _precomputedNeighbourCount{ precomputedNeighbourCount }
    {
    }

    bool RecommendationService::load()
    {
        std::unique_ptr<ModelGeneration> generation{ _cache.read(_precomputedNeighbourCount) };
        if (!generation)
        {
            SHELF_LOG(RECOMMENDATION, INFO, "No generation could be reloaded");
            return false;
        }

        SHELF_LOG(RECOMMENDATION, INFO, "Reloaded generation " << generation->getId() << " (" << generation->getCatalog().size() << " products)");
        _modelStore.setLive(std::move(generation));

        return true;
    }

    TrainResult RecommendationService::train()
    {
        std::unique_lock trainLock{ _trainMutex, std::try_to_lock };
        if (!trainLock.owns_lock())
        {
            SHELF_LOG(RECOMMENDATION, WARNING, "Training request rejected: training already in progress");
            throw TrainingInProgressException{};
        }

        SHELF_LOG(RECOMMENDATION, INFO, "Training started");
        const auto start{ std::chrono::steady_clock::now() };

        std::shared_ptr<const ModelGeneration> generation;
        try
        {
            generation = buildGeneration();
        }
        catch (const std::exception& e)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Training failed: " << e.what());

            {
                const std::unique_lock lock{ _statusMutex };
                _status.state = TrainingState::Failed;
                _status.currentStepProgress.reset();
                _status.lastError = e.what();
            }
            throw;
        }

        _modelStore.setLive(generation);

        TrainResult result;
        result.generationId = generation->getId();
        result.productCount = generation->getCatalog().size();
        result.basketCount = generation->getCoPurchaseModel().getBasketCount();
        result.similarityPairCount = generation->getSimilarityModel().getPositivePairCount();
        result.coPurchasePairCount = generation->getCoPurchaseModel().getPairCount();
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        result.createdAt = generation->getCreatedAt();

        {
            const std::unique_lock lock{ _statusMutex };
            _status.state = TrainingState::Ready;
            _status.currentStepProgress.reset();
            _status.lastResult = result;
        }

        SHELF_LOG(RECOMMENDATION, INFO, "Training complete: generation " << result.generationId << ", " << result.productCount << " products, " << result.basketCount << " baskets, duration = " << result.duration.count() << " ms");

        return result;
    }

    std::shared_ptr<const ModelGeneration> RecommendationService::buildGeneration()
    {
        setState(TrainingState::Syncing);
        Snapshot snapshot{ _snapshotLoader->load() };

        setState(TrainingState::Vectorizing);
        FeatureEncoding encoding{ FeatureVectorizer::computeEncoding(snapshot.products) };
        auto catalog{ std::make_shared<const Catalog>(std::move(snapshot.products)) };

        std::vector<FeatureVector> vectors;
        {
            const FeatureVectorizer vectorizer{ encoding };
            vectors.reserve(catalog->size());
            for (const ProductRecord& product : catalog->getProducts())
                vectors.push_back(vectorizer.vectorize(product));
        }
        SHELF_LOG(RECOMMENDATION, DEBUG, "Vectorized " << vectors.size() << " products, dimension = " << encoding.getDimension());

        setState(TrainingState::ComputingSimilarity);
        SimilarityModel similarityModel{ catalog, std::move(vectors), _precomputedNeighbourCount, makeProgressCallback() };

        setState(TrainingState::ComputingCoPurchase);
        CoPurchaseModel coPurchaseModel{ catalog, snapshot.baskets, makeProgressCallback() };

        setState(TrainingState::Persisting);
        // persisted with a millisecond precision
        const Wt::WDateTime createdAt{ std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()) };
        // the cache may hold a generation that was never loaded by this instance
        std::size_t generationId{ _modelStore.getNextGenerationId() };
        if (const std::optional<std::size_t> persistedId{ _cache.readGenerationId() })
            generationId = std::max(generationId, *persistedId + 1);

        auto generation{ std::make_shared<const ModelGeneration>(generationId, createdAt, catalog, std::move(encoding), std::move(similarityModel), std::move(coPurchaseModel)) };
        if (!_cache.write(*generation))
            throw Exception{ "Cannot persist generation " + std::to_string(generation->getId()) };

        return generation;
    }

    void RecommendationService::setState(TrainingState state)
    {
        SHELF_LOG(RECOMMENDATION, DEBUG, "Training state: " << getTrainingStateName(state));

        const std::unique_lock lock{ _statusMutex };

        _status.state = state;
        if (const std::optional<std::size_t> stepIndex{ getStepIndex(state) })
        {
            _status.currentStepProgress = TrainingStepProgress{};
            _status.currentStepProgress->stepIndex = *stepIndex;
            _status.currentStepProgress->stepCount = std::size(trainingSteps);
        }
        else
        {
            _status.currentStepProgress.reset();
        }
    }

    ProgressCallback RecommendationService::makeProgressCallback()
    {
        return [this](const Progress& progress) {
            const std::unique_lock lock{ _statusMutex };
            if (!_status.currentStepProgress)
                return;

            _status.currentStepProgress->totalElems = progress.totalElems;
            _status.currentStepProgress->processedElems = progress.processedElems;
        };
    }

    std::shared_ptr<const ModelGeneration> RecommendationService::getLiveGeneration() const
    {
        std::shared_ptr<const ModelGeneration> generation{ _modelStore.getLive() };
        if (!generation)
            throw ModelUnavailableException{};

        return generation;
    }

    ResultContainer RecommendationService::getSimilar(db::ProductId productId, std::size_t limit) const
    {
        const std::shared_ptr<const ModelGeneration> generation{ getLiveGeneration() };
        return generation->getSimilarityModel().getSimilar(productId, clampLimit(limit));
    }

    ResultContainer RecommendationService::getCoPurchased(db::ProductId productId, std::size_t limit) const
    {
        const std::shared_ptr<const ModelGeneration> generation{ getLiveGeneration() };
        return generation->getCoPurchaseModel().getCoPurchased(productId, clampLimit(limit));
    }

    std::optional<ProductRecord> RecommendationService::getProductInfo(db::ProductId productId) const
    {
        const std::shared_ptr<const ModelGeneration> generation{ _modelStore.getLive() };
        if (!generation)
            return std::nullopt;

        const std::optional<std::size_t> index{ generation->getCatalog().findIndex(productId) };
        if (!index)
            return std::nullopt;

        return generation->getCatalog().get(*index);
    }

    TrainingStatus RecommendationService::getStatus() const
    {
        const std::shared_lock lock{ _statusMutex };
        return _status;
    }

    std::optional<ModelInfo> RecommendationService::getModelInfo() const
    {
        const std::shared_ptr<const ModelGeneration> generation{ _modelStore.getLive() };
        if (!generation)
            return std::nullopt;

        ModelInfo info;
        info.generationId = generation->getId();
        info.createdAt = generation->getCreatedAt();
        info.featureDimension = generation->getEncoding().getDimension();
        info.productCount = generation->getCatalog().size();
        info.basketCount = generation->getCoPurchaseModel().getBasketCount();
        info.similarityPairCount = generation->getSimilarityModel().getPositivePairCount();
        info.coPurchasePairCount = generation->getCoPurchaseModel().getPairCount();
        info.cacheFile = _cache.getFilePath();

        return info;
    }
} // namespace shelf::recommendation
