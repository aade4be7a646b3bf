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

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <Wt/Dbo/SqlConnectionPool.h>

#include "core/RecursiveSharedMutex.hpp"

#include "database/IDb.hpp"

namespace shelf::db
{
    enum class IntegrityCheck
    {
        None,
        Quick,
        Full,
    };

    struct DbSettings
    {
        bool showQueries{};
        IntegrityCheck integrityCheck{ IntegrityCheck::Quick };
    };

    class Db final : public IDb
    {
    public:
        Db(const std::filesystem::path& dbPath, std::size_t connectionCount, const DbSettings& settings);
        ~Db() override;
        Db(const Db&) = delete;
        Db& operator=(const Db&) = delete;

        // Not bound to any session, caller must hold the mutex if needed
        void executeSql(const std::string& sql);

    private:
        friend class Session;

        Session& getTLSSession() override;

        core::RecursiveSharedMutex& getMutex() { return _sharedMutex; }
        Wt::Dbo::SqlConnectionPool& getConnectionPool() { return *_connectionPool; }

        void checkIntegrity(IntegrityCheck check);

        const std::filesystem::path _path;
        const std::size_t _instanceId;
        core::RecursiveSharedMutex _sharedMutex;
        std::unique_ptr<Wt::Dbo::SqlConnectionPool> _connectionPool;

        std::mutex _tlsSessionsMutex;
        std::vector<std::unique_ptr<Session>> _tlsSessions;
    };
} // namespace shelf::db
