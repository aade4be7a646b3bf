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

#include <string>

#include "core/Exception.hpp"
#include "database/objects/ProductId.hpp"

namespace shelf::recommendation
{
    class Exception : public core::ShelfException
    {
    public:
        using ShelfException::ShelfException;
    };

    // The analytics data cannot be read, or holds neither product nor order item
    class SnapshotUnavailableException : public Exception
    {
    public:
        SnapshotUnavailableException(const std::string& reason)
            : Exception{ "Snapshot unavailable: " + reason } {}
    };

    class EmptyCatalogException : public Exception
    {
    public:
        EmptyCatalogException()
            : Exception{ "Cannot train on an empty catalog" } {}
    };

    class EmptyBasketSetException : public Exception
    {
    public:
        EmptyBasketSetException()
            : Exception{ "Cannot train without any order basket" } {}
    };

    class NotFoundException : public Exception
    {
    public:
        NotFoundException(db::ProductId productId)
            : Exception{ "Product " + productId.toString() + " not found" }
            , _productId{ productId } {}

        db::ProductId getProductId() const { return _productId; }

    private:
        db::ProductId _productId;
    };

    class TrainingInProgressException : public Exception
    {
    public:
        TrainingInProgressException()
            : Exception{ "Training already in progress" } {}
    };

    class ModelUnavailableException : public Exception
    {
    public:
        ModelUnavailableException()
            : Exception{ "No trained model available" } {}
    };
} // namespace shelf::recommendation
