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


#include "Catalog.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

namespace shelf::recommendation
{
    Catalog::Catalog(std::vector<ProductRecord> products)
        : _products{ std::move(products) }
    {
        std::sort(std::begin(_products), std::end(_products), [](const ProductRecord& lhs, const ProductRecord& rhs) { return lhs.id < rhs.id; });

        _indexes.reserve(_products.size());
        for (std::size_t i{}; i < _products.size(); ++i)
        {
            const auto [it, inserted]{ _indexes.emplace(_products[i].id, i) };
            if (!inserted)
                SHELF_LOG(RECOMMENDATION, WARNING, "Duplicate product id " << _products[i].id.toString() << " in catalog");
        }
    }

    std::optional<std::size_t> Catalog::findIndex(db::ProductId productId) const
    {
        const auto it{ _indexes.find(productId) };
        if (it == std::cend(_indexes))
            return std::nullopt;

        return it->second;
    }
} // namespace shelf::recommendation
