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

#include <Wt/Dbo/ptr.h>

#include "database/IdType.hpp"

namespace shelf::db
{
    namespace details
    {
        // no-op unless transaction accesses are checked
        void checkWriteTransaction(Wt::Dbo::Session& session);
    } // namespace details

    // Read-only view on a mapped row, modifications require a write transaction
    template<typename T>
    class ObjectPtr
    {
    public:
        ObjectPtr() = default;
        ObjectPtr(Wt::Dbo::ptr<T> obj)
            : _obj{ std::move(obj) } {}

        const T* operator->() const { return _obj.get(); }
        explicit operator bool() const { return static_cast<bool>(_obj); }
        bool operator==(const ObjectPtr& other) const = default;

        auto modify()
        {
            details::checkWriteTransaction(*_obj.session());
            return _obj.modify();
        }

        void remove()
        {
            details::checkWriteTransaction(*_obj.session());
            _obj.remove();
        }

    private:
        Wt::Dbo::ptr<T> _obj;
    };

    // Base of all the mapped tables, T::IdType is the strong id of the table
    template<typename T, typename TableIdType>
    class Object : public Wt::Dbo::Dbo<T>
    {
        static_assert(std::is_base_of_v<IdType, TableIdType> && !std::is_same_v<IdType, TableIdType>);

    public:
        using pointer = ObjectPtr<T>;
        using IdType = TableIdType;

        IdType getId() const { return IdType{ Wt::Dbo::Dbo<T>::id() }; }
    };
} // namespace shelf::db
