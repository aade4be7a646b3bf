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

#include <type_traits>

#include <Wt/Dbo/StdSqlTraits.h>

#include "database/IdType.hpp"

namespace Wt::Dbo
{
    // Strong ids are stored as their underlying integer, NULL reads as an invalid id
    template<typename T>
    struct sql_value_traits<T, std::enable_if_t<std::is_base_of_v<shelf::db::IdType, T> && !std::is_same_v<shelf::db::IdType, T>>>
    {
        using ValueTraits = sql_value_traits<typename T::ValueType>;

        static const bool specialized = true;

        static std::string type(SqlConnection* conn, int size)
        {
            return ValueTraits::type(conn, size);
        }

        static void bind(const T& id, SqlStatement* statement, int column, int size)
        {
            ValueTraits::bind(id.getValue(), statement, column, size);
        }

        static bool read(T& id, SqlStatement* statement, int column, int size)
        {
            typename T::ValueType value{};
            const bool isNotNull{ ValueTraits::read(value, statement, column, size) };
            id = isNotNull ? T{ value } : T{};

            return isNotNull;
        }
    };
} // namespace Wt::Dbo
