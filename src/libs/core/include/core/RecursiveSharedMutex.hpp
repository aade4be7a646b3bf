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

#include <atomic>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace shelf::core
{
    // API compatible with std::shared_mutex
    // The unique owner may lock again, in both unique and shared modes
    class RecursiveSharedMutex
    {
    public:
        void lock();
        void unlock();

        void lock_shared();
        void unlock_shared();

        bool isUniqueLockedByCurrentThread() const;

    private:
        std::shared_mutex _mutex;
        std::atomic<std::thread::id> _uniqueOwner;
        std::size_t _uniqueCount{};

        std::mutex _sharedCountMutex;
        std::unordered_map<std::thread::id, std::size_t> _sharedCounts;
    };
} // namespace shelf::core
