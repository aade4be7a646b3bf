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


#include "SimilarityModel.hpp"

#include <cassert>
#include <cmath>

#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"

#include "Catalog.hpp"

namespace shelf::recommendation
{
    namespace
    {
        double computeNorm(const FeatureVector& vector)
        {
            double sum{};
            for (double value : vector)
                sum += value * value;

            return std::sqrt(sum);
        }
    } // namespace

    SimilarityModel::SimilarityModel(std::shared_ptr<const Catalog> catalog, std::vector<FeatureVector> vectors, std::size_t neighbourCount, const ProgressCallback& progressCallback)
        : _catalog{ std::move(catalog) }
        , _vectors{ std::move(vectors) }
        , _neighbourCount{ neighbourCount }
    {
        if (_vectors.size() != _catalog->size())
            throw Exception{ "Feature vector count does not match catalog size" };

        _norms.reserve(_vectors.size());
        for (const FeatureVector& vector : _vectors)
            _norms.push_back(computeNorm(vector));

        if (_neighbourCount > 0)
            _neighbours.resize(_vectors.size());

        Progress progress{ _vectors.size(), 0 };
        for (std::size_t i{}; i < _vectors.size(); ++i)
        {
            std::vector<Candidate> candidates{ scan(i) };
            for (const Candidate& candidate : candidates)
            {
                if (candidate.score > 0)
                    _positivePairCount++;
            }

            if (_neighbourCount > 0)
            {
                selectBestCandidates(*_catalog, candidates, _neighbourCount);
                _neighbours[i] = std::move(candidates);
            }

            progress.processedElems++;
            if (progressCallback)
                progressCallback(progress);
        }

        SHELF_LOG(RECOMMENDATION, DEBUG, "Similarity computed for " << _vectors.size() << " products, " << _positivePairCount << " positive pairs");
    }

    double SimilarityModel::computeSimilarity(std::size_t lhsIndex, std::size_t rhsIndex) const
    {
        if (_norms[lhsIndex] == 0 || _norms[rhsIndex] == 0)
            return 0;

        const FeatureVector& lhs{ _vectors[lhsIndex] };
        const FeatureVector& rhs{ _vectors[rhsIndex] };
        assert(lhs.size() == rhs.size());

        double dotProduct{};
        for (std::size_t i{}; i < lhs.size(); ++i)
            dotProduct += lhs[i] * rhs[i];

        return dotProduct / (_norms[lhsIndex] * _norms[rhsIndex]);
    }

    std::vector<Candidate> SimilarityModel::scan(std::size_t index) const
    {
        std::vector<Candidate> candidates;
        candidates.reserve(_vectors.size());

        for (std::size_t other{}; other < _vectors.size(); ++other)
        {
            if (other == index)
                continue;

            candidates.push_back(Candidate{ other, computeSimilarity(index, other) });
        }

        return candidates;
    }

    ResultContainer SimilarityModel::getSimilar(db::ProductId productId, std::size_t maxCount) const
    {
        const std::optional<std::size_t> index{ _catalog->findIndex(productId) };
        if (!index)
            throw NotFoundException{ productId };

        if (maxCount == 0)
            return {};

        if (maxCount <= _neighbourCount)
            return toResults(*_catalog, _neighbours[*index], maxCount);

        std::vector<Candidate> candidates{ scan(*index) };
        selectBestCandidates(*_catalog, candidates, maxCount);

        return toResults(*_catalog, candidates, maxCount);
    }
} // namespace shelf::recommendation
