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


#include "FeatureVectorizer.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include "services/recommendation/Exception.hpp"

namespace shelf::recommendation
{
    namespace
    {
        double scale(double value, double min, double max)
        {
            if (max == min)
                return 0;

            return (value - min) / (max - min);
        }

        void setOneHot(FeatureVector& vector, std::size_t offset, const std::vector<std::string>& values, const std::optional<std::string>& value)
        {
            if (!value || value->empty())
                return;

            const auto it{ std::lower_bound(std::cbegin(values), std::cend(values), *value) };
            if (it != std::cend(values) && *it == *value)
                vector[offset + std::distance(std::cbegin(values), it)] = 1;
        }
    } // namespace

    FeatureEncoding FeatureVectorizer::computeEncoding(const std::vector<ProductRecord>& products)
    {
        if (products.empty())
            throw EmptyCatalogException{};

        std::set<std::string> categories;
        std::set<std::string> brands;

        FeatureEncoding encoding;
        encoding.minPrice = encoding.maxPrice = products.front().getPriceOrDefault();
        encoding.minRating = encoding.maxRating = products.front().getRatingOrDefault();

        for (const ProductRecord& product : products)
        {
            if (product.category && !product.category->empty())
                categories.insert(*product.category);
            if (product.brand && !product.brand->empty())
                brands.insert(*product.brand);

            encoding.minPrice = std::min(encoding.minPrice, product.getPriceOrDefault());
            encoding.maxPrice = std::max(encoding.maxPrice, product.getPriceOrDefault());
            encoding.minRating = std::min(encoding.minRating, product.getRatingOrDefault());
            encoding.maxRating = std::max(encoding.maxRating, product.getRatingOrDefault());
        }

        encoding.categories.assign(std::cbegin(categories), std::cend(categories));
        encoding.brands.assign(std::cbegin(brands), std::cend(brands));

        return encoding;
    }

    FeatureVectorizer::FeatureVectorizer(FeatureEncoding encoding)
        : _encoding{ std::move(encoding) }
    {
    }

    FeatureVector FeatureVectorizer::vectorize(const ProductRecord& product) const
    {
        FeatureVector res(_encoding.getDimension(), 0.);

        setOneHot(res, 0, _encoding.categories, product.category);
        setOneHot(res, _encoding.categories.size(), _encoding.brands, product.brand);

        const std::size_t numericOffset{ _encoding.categories.size() + _encoding.brands.size() };
        res[numericOffset] = scale(product.getPriceOrDefault(), _encoding.minPrice, _encoding.maxPrice);
        res[numericOffset + 1] = scale(product.getRatingOrDefault(), _encoding.minRating, _encoding.maxRating);

        return res;
    }
} // namespace shelf::recommendation
