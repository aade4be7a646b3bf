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


#include "database/IdType.hpp"

namespace shelf::db
{
    namespace
    {
        constexpr IdType::ValueType invalidValue{ -1 };
    }

    IdType::IdType()
        : _id{ invalidValue }
    {
    }

    IdType::IdType(ValueType id)
        : _id{ id }
    {
    }

    bool IdType::isValid() const
    {
        return _id != invalidValue;
    }

    std::string IdType::toString() const
    {
        return isValid() ? std::to_string(_id) : "<invalid>";
    }
} // namespace shelf::db
