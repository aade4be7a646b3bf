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


#include "RequestParsing.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "services/recommendation/Types.hpp"

#include "Error.hpp"

namespace shelf::api
{
    namespace
    {
        struct RouteInfo
        {
            std::string_view path;
            std::string_view method;
            Endpoint endpoint;
            bool takesProductId;
        };

        constexpr RouteInfo routes[]{
            { "similar", "GET", Endpoint::Similar, true },
            { "copurchase", "GET", Endpoint::CoPurchase, true },
            { "train", "POST", Endpoint::Train, false },
            { "sync-data", "POST", Endpoint::SyncData, false },
            { "full-retrain", "POST", Endpoint::FullRetrain, false },
            { "health", "GET", Endpoint::Health, false },
            { "models/info", "GET", Endpoint::ModelsInfo, false },
        };

        db::ProductId parseProductId(std::string_view str)
        {
            const std::optional<db::IdType::ValueType> value{ core::stringUtils::readAs<db::IdType::ValueType>(str) };
            if (!value || *value < 0)
                throw BadParameterError{ "product_id", "expected a positive integer" };

            return db::ProductId{ *value };
        }
    } // namespace

    Route parseRoute(std::string_view method, std::string_view pathInfo)
    {
        if (!pathInfo.empty() && pathInfo.front() == '/')
            pathInfo.remove_prefix(1);
        if (!pathInfo.empty() && pathInfo.back() == '/')
            pathInfo.remove_suffix(1);

        for (const RouteInfo& route : routes)
        {
            std::optional<db::ProductId> productId;
            if (route.takesProductId)
            {
                // "<path>/<id>"
                if (pathInfo.size() <= route.path.size() || !pathInfo.starts_with(route.path) || pathInfo[route.path.size()] != '/')
                    continue;

                const std::string_view idStr{ pathInfo.substr(route.path.size() + 1) };
                if (idStr.find('/') != std::string_view::npos)
                    continue;

                if (method != route.method)
                    throw MethodNotAllowedError{ std::string{ method } };

                productId = parseProductId(idStr);
            }
            else if (pathInfo != route.path)
            {
                continue;
            }
            else if (method != route.method)
            {
                throw MethodNotAllowedError{ std::string{ method } };
            }

            return Route{ route.endpoint, productId };
        }

        throw UnknownEndpointError{};
    }

    std::size_t parseLimit(const Wt::Http::ParameterMap& parameterMap)
    {
        if (parameterMap.find("limit") == std::cend(parameterMap))
            return recommendation::defaultResultCount;

        const std::optional<long long> limit{ getParameterAs<long long>(parameterMap, "limit") };
        if (!limit || *limit < 0)
            throw BadParameterError{ "limit", "expected a positive integer" };

        return std::min(static_cast<std::size_t>(*limit), recommendation::maxResultCount);
    }
} // namespace shelf::api
