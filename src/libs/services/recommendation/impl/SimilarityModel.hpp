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
#include <memory>
#include <vector>

#include "database/objects/ProductId.hpp"
#include "services/recommendation/Types.hpp"

#include "FeatureVectorizer.hpp"
#include "Progress.hpp"
#include "Ranking.hpp"

namespace shelf::recommendation
{
    class Catalog;

    // Cosine similarity between the feature vectors of a catalog
    class SimilarityModel
    {
    public:
        // vectors are indexed like the catalog
        // neighbourCount is the number of best neighbours kept per product, 0 to always scan
        SimilarityModel(std::shared_ptr<const Catalog> catalog, std::vector<FeatureVector> vectors, std::size_t neighbourCount, const ProgressCallback& progressCallback = {});

        // throws NotFoundException
        ResultContainer getSimilar(db::ProductId productId, std::size_t maxCount) const;

        double computeSimilarity(std::size_t lhsIndex, std::size_t rhsIndex) const;

        const std::vector<FeatureVector>& getVectors() const { return _vectors; }
        std::size_t getPositivePairCount() const { return _positivePairCount; }
        std::size_t getNeighbourCount() const { return _neighbourCount; }

    private:
        std::vector<Candidate> scan(std::size_t index) const;

        std::shared_ptr<const Catalog> _catalog;
        std::vector<FeatureVector> _vectors;
        std::vector<double> _norms;
        const std::size_t _neighbourCount;
        std::vector<std::vector<Candidate>> _neighbours; // best neighbours, ordered
        std::size_t _positivePairCount{};
    };
} // namespace shelf::recommendation
