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
#include <map>
#include <memory>
#include <vector>

#include "database/objects/ProductId.hpp"
#include "services/recommendation/Types.hpp"

#include "Progress.hpp"

namespace shelf::recommendation
{
    class Catalog;

    // Market basket counting over the order history
    // strength(p -> q) = co-occurrences(p, q) / support(p)
    class CoPurchaseModel
    {
    public:
        // per catalog index: other catalog index -> number of baskets containing both
        using CoOccurrenceTable = std::vector<std::map<std::size_t, std::size_t>>;

        // Products that are not part of the catalog are ignored
        // throws EmptyBasketSetException
        CoPurchaseModel(std::shared_ptr<const Catalog> catalog, const std::vector<OrderBasket>& baskets, const ProgressCallback& progressCallback = {});

        // Previously computed tables, indexed like the catalog
        CoPurchaseModel(std::shared_ptr<const Catalog> catalog, std::size_t basketCount, std::vector<std::size_t> supports, CoOccurrenceTable coOccurrences);

        // throws NotFoundException
        ResultContainer getCoPurchased(db::ProductId productId, std::size_t maxCount) const;

        std::size_t getBasketCount() const { return _basketCount; }
        std::size_t getPairCount() const;
        const std::vector<std::size_t>& getSupports() const { return _supports; }
        const CoOccurrenceTable& getCoOccurrences() const { return _coOccurrences; }

    private:
        std::shared_ptr<const Catalog> _catalog;
        std::size_t _basketCount{};
        std::vector<std::size_t> _supports;
        CoOccurrenceTable _coOccurrences;
    };
} // namespace shelf::recommendation
