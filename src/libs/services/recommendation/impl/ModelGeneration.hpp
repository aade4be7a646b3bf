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

#include <Wt/WDateTime.h>

#include "Catalog.hpp"
#include "CoPurchaseModel.hpp"
#include "FeatureVectorizer.hpp"
#include "SimilarityModel.hpp"

namespace shelf::recommendation
{
    // Immutable result of a training run
    class ModelGeneration
    {
    public:
        ModelGeneration(std::size_t id, const Wt::WDateTime& createdAt, std::shared_ptr<const Catalog> catalog, FeatureEncoding encoding, SimilarityModel similarityModel, CoPurchaseModel coPurchaseModel);

        ModelGeneration(const ModelGeneration&) = delete;
        ModelGeneration& operator=(const ModelGeneration&) = delete;

        std::size_t getId() const { return _id; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Catalog& getCatalog() const { return *_catalog; }
        const FeatureEncoding& getEncoding() const { return _encoding; }
        const SimilarityModel& getSimilarityModel() const { return _similarityModel; }
        const CoPurchaseModel& getCoPurchaseModel() const { return _coPurchaseModel; }

    private:
        const std::size_t _id;
        const Wt::WDateTime _createdAt;
        std::shared_ptr<const Catalog> _catalog;
        const FeatureEncoding _encoding;
        const SimilarityModel _similarityModel;
        const CoPurchaseModel _coPurchaseModel;
    };
} // namespace shelf::recommendation
