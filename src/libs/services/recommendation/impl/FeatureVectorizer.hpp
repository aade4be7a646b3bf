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
#include <string>
#include <vector>

#include "services/recommendation/Types.hpp"

namespace shelf::recommendation
{
    using FeatureVector = std::vector<double>;

    // How product attributes are turned into vectors
    // Layout: [categories..., brands..., price, rating]
    struct FeatureEncoding
    {
        std::vector<std::string> categories; // sorted, distinct
        std::vector<std::string> brands;     // sorted, distinct
        double minPrice{};
        double maxPrice{};
        double minRating{};
        double maxRating{};

        std::size_t getDimension() const { return categories.size() + brands.size() + 2; }

        bool operator==(const FeatureEncoding& other) const = default;
    };

    class FeatureVectorizer
    {
    public:
        // throws EmptyCatalogException
        static FeatureEncoding computeEncoding(const std::vector<ProductRecord>& products);

        explicit FeatureVectorizer(FeatureEncoding encoding);

        const FeatureEncoding& getEncoding() const { return _encoding; }
        FeatureVector vectorize(const ProductRecord& product) const;

    private:
        FeatureEncoding _encoding;
    };
} // namespace shelf::recommendation
