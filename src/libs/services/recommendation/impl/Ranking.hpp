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
#include <vector>

#include "services/recommendation/Types.hpp"

namespace shelf::recommendation
{
    class Catalog;

    struct Candidate
    {
        std::size_t index; // in catalog
        double score;
    };

    // Decreasing score, then decreasing rating, then increasing id
    bool isRankedBefore(const Catalog& catalog, const Candidate& lhs, const Candidate& rhs);

    // Sorts the candidates and keeps the maxCount best ones
    void selectBestCandidates(const Catalog& catalog, std::vector<Candidate>& candidates, std::size_t maxCount);

    ResultContainer toResults(const Catalog& catalog, const std::vector<Candidate>& candidates, std::size_t maxCount);
} // namespace shelf::recommendation
