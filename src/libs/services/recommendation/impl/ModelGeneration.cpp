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


#include "ModelGeneration.hpp"

namespace shelf::recommendation
{
    ModelGeneration::ModelGeneration(std::size_t id, const Wt::WDateTime& createdAt, std::shared_ptr<const Catalog> catalog, FeatureEncoding encoding, SimilarityModel similarityModel, CoPurchaseModel coPurchaseModel)
        : _id{ id }
        , _createdAt{ createdAt }
        , _catalog{ std::move(catalog) }
        , _encoding{ std::move(encoding) }
        , _similarityModel{ std::move(similarityModel) }
        , _coPurchaseModel{ std::move(coPurchaseModel) }
    {
    }
} // namespace shelf::recommendation
