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

#include <cstddef>
#include <memory>
#include <mutex>

namespace shelf::recommendation
{
    class ModelGeneration;

    // Holds the live generation
    // Readers keep their own reference, replacing the live generation does not affect them
    class ModelStore
    {
    public:
        std::shared_ptr<const ModelGeneration> getLive() const;
        void setLive(std::shared_ptr<const ModelGeneration> generation);

        std::size_t getNextGenerationId() const;

    private:
        mutable std::mutex _mutex;
        std::shared_ptr<const ModelGeneration> _live;
    };
} // namespace shelf::recommendation
