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


#include "CoPurchaseModel.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "services/recommendation/Exception.hpp"

#include "Catalog.hpp"
#include "Ranking.hpp"

namespace shelf::recommendation
{
    CoPurchaseModel::CoPurchaseModel(std::shared_ptr<const Catalog> catalog, const std::vector<OrderBasket>& baskets, const ProgressCallback& progressCallback)
        : _catalog{ std::move(catalog) }
        , _supports(_catalog->size(), 0)
        , _coOccurrences(_catalog->size())
    {
        Progress progress{ baskets.size(), 0 };

        std::vector<std::size_t> indexes;
        for (const OrderBasket& basket : baskets)
        {
            indexes.clear();
            for (db::ProductId productId : basket.productIds)
            {
                if (const std::optional<std::size_t> index{ _catalog->findIndex(productId) })
                    indexes.push_back(*index);
            }
            std::sort(std::begin(indexes), std::end(indexes));
            indexes.erase(std::unique(std::begin(indexes), std::end(indexes)), std::end(indexes));

            SHELF_LOG_IF(RECOMMENDATION, DEBUG, indexes.empty(), "Skipping order " << basket.orderId.toString() << ": no catalog product");
            if (!indexes.empty())
            {
                _basketCount++;

                for (std::size_t index : indexes)
                    _supports[index]++;

                for (std::size_t i{}; i < indexes.size(); ++i)
                {
                    for (std::size_t j{ i + 1 }; j < indexes.size(); ++j)
                    {
                        _coOccurrences[indexes[i]][indexes[j]]++;
                        _coOccurrences[indexes[j]][indexes[i]]++;
                    }
                }
            }

            progress.processedElems++;
            if (progressCallback)
                progressCallback(progress);
        }

        if (_basketCount == 0)
            throw EmptyBasketSetException{};

        SHELF_LOG(RECOMMENDATION, DEBUG, "Co-purchases computed from " << _basketCount << " baskets, " << getPairCount() << " pairs");
    }

    CoPurchaseModel::CoPurchaseModel(std::shared_ptr<const Catalog> catalog, std::size_t basketCount, std::vector<std::size_t> supports, CoOccurrenceTable coOccurrences)
        : _catalog{ std::move(catalog) }
        , _basketCount{ basketCount }
        , _supports{ std::move(supports) }
        , _coOccurrences{ std::move(coOccurrences) }
    {
        if (_supports.size() != _catalog->size() || _coOccurrences.size() != _catalog->size())
            throw Exception{ "Co-purchase table size does not match catalog size" };
    }

    std::size_t CoPurchaseModel::getPairCount() const
    {
        std::size_t count{};
        for (const auto& entries : _coOccurrences)
            count += entries.size();

        return count;
    }

    ResultContainer CoPurchaseModel::getCoPurchased(db::ProductId productId, std::size_t maxCount) const
    {
        const std::optional<std::size_t> index{ _catalog->findIndex(productId) };
        if (!index)
            throw NotFoundException{ productId };

        const std::size_t support{ _supports[*index] };
        if (support == 0 || maxCount == 0)
            return {};

        std::vector<Candidate> candidates;
        candidates.reserve(_coOccurrences[*index].size());
        for (const auto& [otherIndex, count] : _coOccurrences[*index])
            candidates.push_back(Candidate{ otherIndex, static_cast<double>(count) / support });

        selectBestCandidates(*_catalog, candidates, maxCount);

        return toResults(*_catalog, candidates, maxCount);
    }
} // namespace shelf::recommendation
