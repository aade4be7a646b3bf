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

#include "core/RecursiveSharedMutex.hpp"

#include <cassert>

namespace shelf::core
{
    void RecursiveSharedMutex::lock()
    {
        const std::thread::id thisThreadId{ std::this_thread::get_id() };

        if (_uniqueOwner == thisThreadId)
        {
            ++_uniqueCount;
            return;
        }

        _mutex.lock();
        _uniqueOwner = thisThreadId;
        assert(_uniqueCount == 0);
        _uniqueCount = 1;
    }

    void RecursiveSharedMutex::unlock()
    {
        assert(_uniqueOwner == std::this_thread::get_id());
        assert(_uniqueCount > 0);

        if (--_uniqueCount == 0)
        {
            _uniqueOwner = std::thread::id{};
            _mutex.unlock();
        }
    }

    void RecursiveSharedMutex::lock_shared()
    {
        const std::thread::id thisThreadId{ std::this_thread::get_id() };

        if (_uniqueOwner == thisThreadId)
        {
            // already exclusively owned, just keep track of the nesting
            std::scoped_lock lock{ _sharedCountMutex };
            ++_sharedCounts[thisThreadId];
            return;
        }

        {
            std::scoped_lock lock{ _sharedCountMutex };

            auto it{ _sharedCounts.find(thisThreadId) };
            if (it != std::cend(_sharedCounts) && it->second > 0)
            {
                ++it->second;
                return;
            }
        }

        _mutex.lock_shared();

        std::scoped_lock lock{ _sharedCountMutex };
        ++_sharedCounts[thisThreadId];
    }

    void RecursiveSharedMutex::unlock_shared()
    {
        const std::thread::id thisThreadId{ std::this_thread::get_id() };
        const bool uniqueOwner{ _uniqueOwner == thisThreadId };

        bool needUnlock{};
        {
            std::scoped_lock lock{ _sharedCountMutex };

            auto it{ _sharedCounts.find(thisThreadId) };
            assert(it != std::cend(_sharedCounts) && it->second > 0);
            if (--it->second == 0)
            {
                _sharedCounts.erase(it);
                needUnlock = !uniqueOwner;
            }
        }

        if (needUnlock)
            _mutex.unlock_shared();
    }

    bool RecursiveSharedMutex::isUniqueLockedByCurrentThread() const
    {
        return _uniqueOwner == std::this_thread::get_id();
    }
} // namespace shelf::core
