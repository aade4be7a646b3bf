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

#include "ISnapshotLoader.hpp"

namespace shelf::recommendation
{
    class DbSnapshotLoader : public ISnapshotLoader
    {
    public:
        DbSnapshotLoader(db::IDb& db);
        ~DbSnapshotLoader() override = default;
        DbSnapshotLoader(const DbSnapshotLoader&) = delete;
        DbSnapshotLoader& operator=(const DbSnapshotLoader&) = delete;

    private:
        Snapshot load() override;

        db::IDb& _db;
    };
} // namespace shelf::recommendation
