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


#include "TransactionChecker.hpp"

#if SHELF_CHECK_TRANSACTION_ACCESSES

    #include <algorithm>
    #include <cassert>
    #include <vector>

namespace shelf::db::transactionChecker
{
    namespace
    {
        struct OpenTransaction
        {
            TransactionType type;
            const Wt::Dbo::Session* session;
        };

        // a thread may have transactions open on both databases
        thread_local std::vector<OpenTransaction> openTransactions;
    } // namespace

    void push(TransactionType type, const Wt::Dbo::Session& session)
    {
        openTransactions.push_back(OpenTransaction{ type, &session });
    }

    void pop([[maybe_unused]] TransactionType type, [[maybe_unused]] const Wt::Dbo::Session& session)
    {
        assert(!openTransactions.empty());
        assert(openTransactions.back().type == type && openTransactions.back().session == &session);
        openTransactions.pop_back();
    }

    void check([[maybe_unused]] TransactionType type, [[maybe_unused]] const Wt::Dbo::Session& session)
    {
        [[maybe_unused]] const bool found{ std::any_of(std::cbegin(openTransactions), std::cend(openTransactions), [&](const OpenTransaction& transaction) {
            return transaction.session == &session && (type == TransactionType::Read || transaction.type == TransactionType::Write);
        }) };
        assert(found);
    }
} // namespace shelf::db::transactionChecker

#endif
