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


#include "Ranking.hpp"

#include <algorithm>

#include "Catalog.hpp"

namespace shelf::recommendation
{
    bool isRankedBefore(const Catalog& catalog, const Candidate& lhs, const Candidate& rhs)
    {
        if (lhs.score != rhs.score)
            return lhs.score > rhs.score;

        const double lhsRating{ catalog.get(lhs.index).getRatingOrDefault() };
        const double rhsRating{ catalog.get(rhs.index).getRatingOrDefault() };
        if (lhsRating != rhsRating)
            return lhsRating > rhsRating;

        // catalog is sorted by id
        return lhs.index < rhs.index;
    }

    void selectBestCandidates(const Catalog& catalog, std::vector<Candidate>& candidates, std::size_t maxCount)
    {
        const std::size_t count{ std::min(maxCount, candidates.size()) };
        auto comparator{ [&](const Candidate& lhs, const Candidate& rhs) { return isRankedBefore(catalog, lhs, rhs); } };

        std::partial_sort(std::begin(candidates), std::begin(candidates) + count, std::end(candidates), comparator);
        candidates.resize(count);
    }

    ResultContainer toResults(const Catalog& catalog, const std::vector<Candidate>& candidates, std::size_t maxCount)
    {
        ResultContainer res;

        const std::size_t count{ std::min(maxCount, candidates.size()) };
        res.reserve(count);
        for (std::size_t i{}; i < count; ++i)
            res.push_back(ScoredProduct{ catalog.get(candidates[i].index).id, candidates[i].score });

        return res;
    }
} // namespace shelf::recommendation
