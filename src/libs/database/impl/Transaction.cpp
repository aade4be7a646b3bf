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


#include "database/Transaction.hpp"

#include <exception>

#include "core/RecursiveSharedMutex.hpp"

#include "TransactionChecker.hpp"

namespace shelf::db
{
    WriteTransaction::WriteTransaction(core::RecursiveSharedMutex& mutex, Wt::Dbo::Session& session)
        : _lock{ mutex }
        , _uncaughtExceptions{ std::uncaught_exceptions() }
        , _transaction{ session }
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::push(transactionChecker::TransactionType::Write, _transaction.session());
#endif
    }

    WriteTransaction::~WriteTransaction()
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::pop(transactionChecker::TransactionType::Write, _transaction.session());
#endif

        // rolled back by the dbo transaction if we are unwinding
        if (std::uncaught_exceptions() == _uncaughtExceptions)
            _transaction.commit();
    }

    ReadTransaction::ReadTransaction(Wt::Dbo::Session& session)
        : _transaction{ session }
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::push(transactionChecker::TransactionType::Read, _transaction.session());
#endif
    }

    ReadTransaction::~ReadTransaction()
    {
#if SHELF_CHECK_TRANSACTION_ACCESSES
        transactionChecker::pop(transactionChecker::TransactionType::Read, _transaction.session());
#endif
    }
} // namespace shelf::db
