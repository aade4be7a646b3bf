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

#include "core/IOContextRunner.hpp"

#include <cstdlib>

#include "core/ILogger.hpp"

namespace shelf::core
{
    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _ioContext{ ioContext }
        , _workGuard{ ioContext.get_executor() }
        , _name{ name }
    {
        SHELF_LOG(UTILS, DEBUG, "Starting " << threadCount << " thread(s) for '" << _name << "'");

        _threads.reserve(threadCount);
        for (std::size_t i{}; i < threadCount; ++i)
            _threads.emplace_back([this] { run(); });
    }

    IOContextRunner::~IOContextRunner()
    {
        SHELF_LOG(UTILS, DEBUG, "Stopping '" << _name << "'...");

        _workGuard.reset();
        _ioContext.stop();

        for (std::thread& thread : _threads)
            thread.join();

        SHELF_LOG(UTILS, DEBUG, "'" << _name << "' stopped");
    }

    void IOContextRunner::run()
    {
        try
        {
            _ioContext.run();
        }
        catch (const std::exception& e)
        {
            // handlers are expected to catch their own errors
            SHELF_LOG(UTILS, FATAL, "Uncaught exception in '" << _name << "': " << e.what());
            std::abort();
        }
    }
} // namespace shelf::core
