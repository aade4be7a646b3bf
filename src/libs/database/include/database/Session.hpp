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
#include <string_view>

#include <Wt/Dbo/Session.h>

#include "database/Transaction.hpp"
#include "database/Types.hpp"

namespace shelf::db
{
    class IDb;
    class Session
    {
    public:
        Session(IDb& db);
        ~Session() = default;
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        [[nodiscard]] WriteTransaction createWriteTransaction();
        [[nodiscard]] ReadTransaction createReadTransaction();

        void checkWriteTransaction() const;
        void checkReadTransaction() const;

        void execute(std::string_view statement);

        // All these methods will acquire transactions
        bool ping(); // true if the database answers a trivial query
        void prepareTablesIfNeeded(); // need to run only once at startup
        void createIndexesIfNeeded();
        void vacuum();

        // returning a ptr here to ease further wrapping using operator->
        Wt::Dbo::Session* getDboSession() { return &_session; }
        const Wt::Dbo::Session* getDboSession() const { return &_session; }

        IDb& getDb() { return _db; }

        template<typename Object, typename... Args>
        typename Object::pointer create(Args&&... args)
        {
            checkWriteTransaction();

            typename Object::pointer res{ Object::create(*this, std::forward<Args>(args)...) };
            getDboSession()->flush();

            return res;
        }

        template<typename Object>
        void destroyAll()
        {
            checkWriteTransaction();

            // make sure pending changes do not resurrect deleted rows
            _session.flush();
            execute(std::string{ "DELETE FROM " } + _session.tableName<Object>());
            _session.rereadAll(_session.tableName<Object>());
        }

    private:
        IDb& _db;
        Wt::Dbo::Session _session;
    };
} // namespace shelf::db
