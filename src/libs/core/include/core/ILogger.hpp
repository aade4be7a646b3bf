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
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "core/Service.hpp"

namespace shelf::core::logging
{
    enum class Severity
    {
        FATAL,
        ERROR,
        WARNING,
        INFO,
        DEBUG,
    };

    enum class Module
    {
        DB,
        HTTP,
        MAIN,
        RECOMMENDATION,
        SERVICE,
        SYNC,
        UTILS,
        WT,
    };

    const char* getModuleName(Module mod);
    const char* getSeverityName(Severity sev);
    std::optional<Severity> parseSeverity(std::string_view str);

    class ILogger;
    class Log
    {
    public:
        Log(ILogger& logger, Module module, Severity severity);
        ~Log();

        Module getModule() const { return _module; }
        Severity getSeverity() const { return _severity; }
        std::string getMessage() const;

        std::ostringstream& getOstream() { return _oss; }

    private:
        Log(const Log&) = delete;
        Log& operator=(const Log&) = delete;

        ILogger& _logger;
        Module _module;
        Severity _severity;
        std::ostringstream _oss;
    };

    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        virtual bool isSeverityActive(Severity severity) const = 0;
        virtual void processLog(const Log& log) = 0;
        virtual void processLog(Module module, Severity severity, std::string_view message) = 0;
    };

    static constexpr Severity defaultMinSeverity{ Severity::INFO };
    std::unique_ptr<ILogger> createLogger(Severity minSeverity = defaultMinSeverity, const std::filesystem::path& logFilePath = {});
} // namespace shelf::core::logging

#define SHELF_LOG(module, severity, message)                                                                                                                                   \
    do                                                                                                                                                                         \
    {                                                                                                                                                                          \
        if (auto* logger_{ ::shelf::core::Service<::shelf::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::shelf::core::logging::Severity::severity)) \
            ::shelf::core::logging::Log{ *logger_, ::shelf::core::logging::Module::module, ::shelf::core::logging::Severity::severity }.getOstream() << message;               \
    } while (0)

#define SHELF_LOG_IF(module, severity, cond, message)                                                                                                                                  \
    do                                                                                                                                                                                 \
    {                                                                                                                                                                                  \
        if (auto* logger_{ ::shelf::core::Service<::shelf::core::logging::ILogger>::get() }; logger_ && logger_->isSeverityActive(::shelf::core::logging::Severity::severity) && cond) \
            ::shelf::core::logging::Log{ *logger_, ::shelf::core::logging::Module::module, ::shelf::core::logging::Severity::severity }.getOstream() << message;                       \
    } while (0)
