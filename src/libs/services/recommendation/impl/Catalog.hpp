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
#include <optional>
#include <unordered_map>
#include <vector>

#include "database/objects/ProductId.hpp"
#include "services/recommendation/Types.hpp"

namespace shelf::recommendation
{
    // Products of a generation, sorted by id
    // Models refer to products using their index in the catalog
    class Catalog
    {
    public:
        explicit Catalog(std::vector<ProductRecord> products);

        Catalog(const Catalog&) = delete;
        Catalog& operator=(const Catalog&) = delete;

        std::size_t size() const { return _products.size(); }
        bool empty() const { return _products.empty(); }

        const ProductRecord& get(std::size_t index) const { return _products[index]; }
        const std::vector<ProductRecord>& getProducts() const { return _products; }
        std::optional<std::size_t> findIndex(db::ProductId productId) const;

    private:
        std::vector<ProductRecord> _products;
        std::unordered_map<db::ProductId, std::size_t> _indexes;
    };
} // namespace shelf::recommendation
