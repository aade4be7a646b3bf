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


#include "Db.hpp"

#include <atomic>
#include <chrono>
#include <cassert>
#include <optional>
#include <unordered_map>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace shelf::db
{
    namespace
    {
        // Sqlite3 connection with the WAL settings applied on each clone of the pool
        class WalConnection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            explicit WalConnection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                applyConnectionSettings();
            }

            WalConnection(const WalConnection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                applyConnectionSettings();
            }
            WalConnection& operator=(const WalConnection&) = delete;

        private:
            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<WalConnection>(*this);
            }

            void applyConnectionSettings()
            {
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
            }
        };

        // Borrows a connection from the pool for the lifetime of the object
        class PooledConnection
        {
        public:
            explicit PooledConnection(Wt::Dbo::SqlConnectionPool& pool)
                : _pool{ pool }
                , _connection{ pool.getConnection() }
            {
            }
            ~PooledConnection()
            {
                _pool.returnConnection(std::move(_connection));
            }
            PooledConnection(const PooledConnection&) = delete;
            PooledConnection& operator=(const PooledConnection&) = delete;

            Wt::Dbo::SqlConnection* operator->() const { return _connection.get(); }

        private:
            Wt::Dbo::SqlConnectionPool& _pool;
            std::unique_ptr<Wt::Dbo::SqlConnection> _connection;
        };

        IntegrityCheck parseIntegrityCheck(std::string_view str)
        {
            if (str == "none")
                return IntegrityCheck::None;
            if (str == "quick")
                return IntegrityCheck::Quick;
            if (str == "full")
                return IntegrityCheck::Full;

            throw Exception{ "Invalid 'db-integrity-check' value: '" + std::string{ str } + "'. Expected 'quick', 'full' or 'none'." };
        }

        DbSettings readSettings()
        {
            DbSettings settings;

            // no config in unit tests
            if (const core::IConfig* config{ core::Service<core::IConfig>::get() })
            {
                settings.showQueries = config->getBool("db-show-queries", false);
                settings.integrityCheck = parseIntegrityCheck(config->getString("db-integrity-check", "quick"));
            }

            return settings;
        }

        std::optional<int> getPageSize(PooledConnection& connection)
        {
            auto statement{ connection->prepareStatement("PRAGMA page_size") };
            statement->execute();

            int value{};
            if (statement->nextRow() && statement->getResult(0, &value))
                return value;

            return std::nullopt;
        }

        std::atomic<std::size_t> nextInstanceId{};
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount, readSettings());
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount, const DbSettings& settings)
        : _path{ dbPath }
        , _instanceId{ nextInstanceId++ }
    {
        SHELF_LOG(DB, INFO, "Opening " << _path << " using " << connectionCount << " connections");

        auto connection{ std::make_unique<WalConnection>(_path) };
        connection->setProperty("show-queries", settings.showQueries ? "true" : "false");

        _connectionPool = std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount));
        _connectionPool->setTimeout(std::chrono::seconds{ 10 });

        executeSql("PRAGMA temp_store=MEMORY");
        executeSql("PRAGMA cache_size=-8000");

        {
            PooledConnection connection{ *_connectionPool };
            if (const std::optional<int> pageSize{ getPageSize(connection) })
                SHELF_LOG(DB, DEBUG, "Page size of " << _path << " is " << *pageSize);
        }

        checkIntegrity(settings.integrityCheck);
    }

    Db::~Db() = default;

    void Db::executeSql(const std::string& sql)
    {
        PooledConnection connection{ *_connectionPool };
        connection->executeSql(sql);
    }

    Session& Db::getTLSSession()
    {
        // keyed by instance: a thread may use both the transactional and the analytics databases
        static thread_local std::unordered_map<std::size_t, Session*> tlsSessions;

        Session*& tlsSession{ tlsSessions[_instanceId] };
        if (!tlsSession)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            tlsSession = newSession.get();

            std::scoped_lock lock{ _tlsSessionsMutex };
            _tlsSessions.push_back(std::move(newSession));
        }

        assert(&tlsSession->getDb() == this);

        return *tlsSession;
    }

    void Db::checkIntegrity(IntegrityCheck check)
    {
        if (check == IntegrityCheck::None)
            return;

        const std::string_view checkName{ check == IntegrityCheck::Full ? "integrity" : "quick" };
        SHELF_LOG(DB, INFO, "Running " << checkName << " check on " << _path << "...");

        PooledConnection connection{ *_connectionPool };
        auto statement{ connection->prepareStatement(check == IntegrityCheck::Full ? "PRAGMA integrity_check" : "PRAGMA quick_check") };
        statement->execute();

        bool passed{};
        std::string result;
        result.reserve(32);
        while (statement->nextRow())
        {
            result.clear();
            statement->getResult(0, &result, static_cast<int>(result.capacity()));

            if (result == "ok")
            {
                passed = true;
                break;
            }

            SHELF_LOG(DB, ERROR, "Database " << checkName << " check error: " << result);
        }

        if (passed)
            SHELF_LOG(DB, INFO, "Database " << checkName << " check passed");
        else
            SHELF_LOG(DB, ERROR, "Database " << checkName << " check done with errors");
    }
} // namespace shelf::db
