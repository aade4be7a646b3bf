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


#include "services/recommendation/Types.hpp"

namespace shelf::recommendation
{
    const char* getTrainingStateName(TrainingState state)
    {
        switch (state)
        {
        case TrainingState::Idle:
            return "idle";
        case TrainingState::Syncing:
            return "syncing";
        case TrainingState::Vectorizing:
            return "vectorizing";
        case TrainingState::ComputingSimilarity:
            return "computing_similarity";
        case TrainingState::ComputingCoPurchase:
            return "computing_copurchase";
        case TrainingState::Persisting:
            return "persisting";
        case TrainingState::Ready:
            return "ready";
        case TrainingState::Failed:
            return "failed";
        }

        return "unknown";
    }

    unsigned TrainingStepProgress::progress() const
    {
        if (totalElems == 0)
            return 0;

        return static_cast<unsigned>((processedElems / static_cast<float>(totalElems)) * 100);
    }
} // namespace shelf::recommendation
