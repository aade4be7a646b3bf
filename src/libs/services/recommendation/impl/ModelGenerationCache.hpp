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
#include <filesystem>
#include <memory>
#include <optional>

namespace shelf::recommendation
{
    class ModelGeneration;

    // Persists the live generation in a single file of the cache directory
    class ModelGenerationCache
    {
    public:
        explicit ModelGenerationCache(const std::filesystem::path& directory);

        const std::filesystem::path& getFilePath() const { return _filePath; }

        // Replaces the previously written generation, if any
        bool write(const ModelGeneration& generation) const;

        // neighbourCount is the number of precomputed neighbours of the rebuilt similarity model
        std::unique_ptr<ModelGeneration> read(std::size_t neighbourCount) const;

        // Only reads the header of the written generation
        std::optional<std::size_t> readGenerationId() const;

    private:
        const std::filesystem::path _directory;
        const std::filesystem::path _filePath;
    };
} // namespace shelf::recommendation
