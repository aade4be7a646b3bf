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

#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "services/recommendation/Types.hpp"

#include "ISnapshotLoader.hpp"

namespace shelf::recommendation::tests
{
    inline ProductRecord makeProduct(db::IdType::ValueType id, std::optional<std::string> category, std::optional<std::string> brand, std::optional<double> price, std::optional<double> rating)
    {
        ProductRecord product;
        product.id = db::ProductId{ id };
        product.name = "Product " + std::to_string(id);
        product.category = std::move(category);
        product.brand = std::move(brand);
        product.price = price;
        product.rating = rating;

        return product;
    }

    inline OrderBasket makeBasket(db::IdType::ValueType orderId, std::initializer_list<db::IdType::ValueType> productIds)
    {
        OrderBasket basket;
        basket.orderId = db::OrderId{ orderId };
        for (db::IdType::ValueType productId : productIds)
            basket.productIds.push_back(db::ProductId{ productId });

        return basket;
    }

    // A, B, C
    inline std::vector<ProductRecord> makeSmallCatalog()
    {
        return {
            makeProduct(1, "X", "1", 100, 4.5),
            makeProduct(2, "X", "1", 110, 4.0),
            makeProduct(3, "Y", "2", 500, 3.0),
        };
    }

    // Returns whatever the test put in the referenced snapshot
    class TestSnapshotLoader : public ISnapshotLoader
    {
    public:
        TestSnapshotLoader(const Snapshot& snapshot)
            : _snapshot{ snapshot } {}

    private:
        Snapshot load() override { return _snapshot; }

        const Snapshot& _snapshot;
    };

    class ScopedTmpDirectory
    {
    public:
        ScopedTmpDirectory()
            : _path{ std::tmpnam(nullptr) }
        {
            std::filesystem::create_directories(_path);
        }

        ~ScopedTmpDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        ScopedTmpDirectory(const ScopedTmpDirectory&) = delete;
        ScopedTmpDirectory& operator=(const ScopedTmpDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };
} // namespace shelf::recommendation::tests
