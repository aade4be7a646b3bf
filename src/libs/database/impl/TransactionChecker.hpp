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

#if !defined(NDEBUG)
    #define SHELF_CHECK_TRANSACTION_ACCESSES 1
#else
    #define SHELF_CHECK_TRANSACTION_ACCESSES 0
#endif

#if SHELF_CHECK_TRANSACTION_ACCESSES

namespace Wt::Dbo
{
    class Session;
}

// Debug only bookkeeping of the transactions opened by the current thread
namespace shelf::db::transactionChecker
{
    enum class TransactionType
    {
        Read,
        Write,
    };

    void push(TransactionType type, const Wt::Dbo::Session& session);
    void pop(TransactionType type, const Wt::Dbo::Session& session);

    // A write transaction also satisfies a read check
    void check(TransactionType type, const Wt::Dbo::Session& session);
} // namespace shelf::db::transactionChecker

#endif
