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


#include "ModelStore.hpp"

#include <utility>

#include "ModelGeneration.hpp"

namespace shelf::recommendation
{
    std::shared_ptr<const ModelGeneration> ModelStore::getLive() const
    {
        const std::scoped_lock lock{ _mutex };
        return _live;
    }

    void ModelStore::setLive(std::shared_ptr<const ModelGeneration> generation)
    {
        std::shared_ptr<const ModelGeneration> previous;
        {
            const std::scoped_lock lock{ _mutex };
            previous = std::exchange(_live, std::move(generation));
        }
        // previous generation released outside of the lock
    }

    std::size_t ModelStore::getNextGenerationId() const
    {
        const std::scoped_lock lock{ _mutex };
        return _live ? _live->getId() + 1 : 1;
    }
} // namespace shelf::recommendation
