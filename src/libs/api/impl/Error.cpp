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


#include "Error.hpp"

#include "services/recommendation/Exception.hpp"

namespace shelf::api
{
    int getHttpStatus(const core::ShelfException& exception)
    {
        if (const auto* error{ dynamic_cast<const Error*>(&exception) })
            return error->getHttpStatus();
        if (dynamic_cast<const recommendation::NotFoundException*>(&exception))
            return 404;
        if (dynamic_cast<const recommendation::TrainingInProgressException*>(&exception))
            return 409;
        if (dynamic_cast<const recommendation::ModelUnavailableException*>(&exception))
            return 503;

        return 500;
    }
} // namespace shelf::api
