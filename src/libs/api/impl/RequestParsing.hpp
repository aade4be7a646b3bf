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
#include <string_view>

#include <Wt/Http/Request.h>

#include "core/String.hpp"
#include "database/objects/ProductId.hpp"

namespace shelf::api
{
    enum class Endpoint
    {
        Similar,
        CoPurchase,
        Train,
        SyncData,
        FullRetrain,
        Health,
        ModelsInfo,
    };

    struct Route
    {
        Endpoint endpoint;
        std::optional<db::ProductId> productId; // for product endpoints only
    };

    // pathInfo is relative to the deploy path, ex: "/similar/12"
    // throws UnknownEndpointError, MethodNotAllowedError or BadParameterError
    Route parseRoute(std::string_view method, std::string_view pathInfo);

    template<typename T>
    std::optional<T> getParameterAs(const Wt::Http::ParameterMap& parameterMap, const std::string& param)
    {
        auto it{ parameterMap.find(param) };
        if (it == std::cend(parameterMap) || it->second.size() != 1)
            return std::nullopt;

        return core::stringUtils::readAs<T>(it->second.front());
    }

    // Defaults to defaultResultCount, clamped to maxResultCount
    // throws BadParameterError
    std::size_t parseLimit(const Wt::Http::ParameterMap& parameterMap);
} // namespace shelf::api
