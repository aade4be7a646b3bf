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

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ProductId.hpp"

namespace shelf::db
{
    class Session;

    class Product final : public Object<Product, ProductId>
    {
    public:
        struct Attributes
        {
            std::string name;
            std::optional<double> price;
            std::optional<std::string> brand;
            std::optional<std::string> category;
            std::optional<double> rating;
            std::string picture;
            long long stock{};

            Attributes& setName(std::string_view _name)
            {
                name = _name;
                return *this;
            }
            Attributes& setPrice(std::optional<double> _price)
            {
                price = _price;
                return *this;
            }
            Attributes& setBrand(std::optional<std::string> _brand)
            {
                brand = std::move(_brand);
                return *this;
            }
            Attributes& setCategory(std::optional<std::string> _category)
            {
                category = std::move(_category);
                return *this;
            }
            Attributes& setRating(std::optional<double> _rating)
            {
                rating = _rating;
                return *this;
            }
            Attributes& setPicture(std::string_view _picture)
            {
                picture = _picture;
                return *this;
            }
            Attributes& setStock(long long _stock)
            {
                stock = _stock;
                return *this;
            }
        };

        Product() = default;

        // Find utilities
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ProductId id);
        static void find(Session& session, const std::function<void(const pointer&)>& func); // ordered by id

        // Inserts a row using the given id, rows mirrored from another database keep their ids
        static void insert(Session& session, ProductId id, const Attributes& attributes);

        // Accessors
        const std::string& getName() const { return _name; }
        std::optional<double> getPrice() const { return _price; }
        const std::optional<std::string>& getBrand() const { return _brand; }
        const std::optional<std::string>& getCategory() const { return _category; }
        std::optional<double> getRating() const { return _rating; }
        const std::string& getPicture() const { return _picture; }
        long long getStock() const { return _stock; }
        Attributes getAttributes() const;

        // Modifiers
        void setPrice(std::optional<double> price) { _price = price; }
        void setRating(std::optional<double> rating) { _rating = rating; }
        void setStock(long long stock) { _stock = stock; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _name, "name");
            Wt::Dbo::field(a, _price, "price");
            Wt::Dbo::field(a, _brand, "brand");
            Wt::Dbo::field(a, _category, "category");
            Wt::Dbo::field(a, _rating, "rating");
            Wt::Dbo::field(a, _picture, "picture");
            Wt::Dbo::field(a, _stock, "stock");
        }

    private:
        friend class Session;
        Product(const Attributes& attributes);
        static pointer create(Session& session, const Attributes& attributes);

        std::string _name;
        std::optional<double> _price;
        std::optional<std::string> _brand;
        std::optional<std::string> _category;
        std::optional<double> _rating;
        std::string _picture;
        long long _stock{};
    };
} // namespace shelf::db
