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


#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "api/RecommendationResource.hpp"
#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/sync/ISyncService.hpp"

namespace shelf
{
    namespace
    {
        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            // training requests block their thread for a while
            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        std::filesystem::path getWorkingDirectory()
        {
            return core::Service<core::IConfig>::get()->getPath("working-dir", "/var/shelf");
        }

        std::vector<std::string> generateWtConfig(std::string execPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            std::vector<std::string> args;

            const std::filesystem::path wtConfigPath{ getWorkingDirectory() / "wt_config.xml" };
            const std::filesystem::path docRootPath{ getWorkingDirectory() / "docroot" };
            const std::filesystem::path wtResourcesPath{ config.getPath("wt-resources", "") };

            std::filesystem::create_directories(docRootPath);

            args.push_back(execPath);
            args.push_back("--config=" + wtConfigPath.string());
            args.push_back("--docroot=" + docRootPath.string());
            args.push_back("--http-port=" + std::to_string(config.getULong("listen-port", 5090)));
            args.push_back("--http-address=" + std::string{ config.getString("listen-addr", "0.0.0.0") });
            if (!wtResourcesPath.empty())
                args.push_back("--resources-dir=" + wtResourcesPath.string());
            args.push_back("--threads=" + std::to_string(getThreadCount()));

            // Generate the wt_config.xml file
            boost::property_tree::ptree pt;
            pt.put("server.application-settings.<xmlattr>.location", "*");

            {
                std::ofstream oss{ wtConfigPath, std::ios::out };
                if (!oss)
                    throw core::ShelfException{ "Can't open '" + wtConfigPath.string() + "' for writing!" };

                boost::property_tree::xml_parser::write_xml(oss, pt);

                if (!oss)
                    throw core::ShelfException{ "Can't write in file '" + wtConfigPath.string() + "', no space left?" };
            }

            return args;
        }

        core::logging::Severity getLogMinSeverity()
        {
            const std::string minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(minSeverity) };
            if (!severity)
                throw core::ShelfException{ "Invalid config value '" + minSeverity + "' for 'log-min-severity'" };

            return *severity;
        }

        class ShelfLogSink : public Wt::WLogSink
        {
        public:
            ShelfLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                if (logging(type, scope))
                    _logger.processLog(core::logging::Module::WT, getSeverity(type, scope), message);
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                return _logger.isSeverityActive(getSeverity(type, scope));
            }

            static core::logging::Severity getSeverity(const std::string& type, std::string_view scope)
            {
                core::logging::Severity severity{ core::logging::Severity::INFO };
                if (type == "debug")
                    severity = core::logging::Severity::DEBUG;
                else if (type == "warning")
                    severity = core::logging::Severity::WARNING;
                else if (type == "error")
                    severity = core::logging::Severity::ERROR;
                else if (type == "fatal")
                    severity = core::logging::Severity::FATAL;

                // access logs
                if (severity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return severity;
            }

            core::logging::ILogger& _logger;
        };

        std::unique_ptr<db::IDb> openDatabase(const std::filesystem::path& path, std::size_t connectionCount)
        {
            SHELF_LOG(MAIN, INFO, "Opening database " << path);

            auto database{ db::createDb(path, connectionCount) };
            {
                db::Session session{ *database };
                session.prepareTablesIfNeeded();
                session.createIndexesIfNeeded();
            }

            return database;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ core::sysconfDirectory / "shelf.conf" };
        int res{ EXIT_FAILURE };

        assert(argc > 0);
        assert(argv[0] != NULL);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the Shelf configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            // Make sure the working directory exists
            const std::filesystem::path workingDirectory{ getWorkingDirectory() };
            std::filesystem::create_directories(workingDirectory / "cache");

            // Construct WT configuration and get the argc/argv back
            const std::vector<std::string> wtServerArgs{ generateWtConfig(argv[0]) };

            std::vector<const char*> wtArgv(wtServerArgs.size());
            for (std::size_t i = 0; i < wtServerArgs.size(); ++i)
                wtArgv[i] = wtServerArgs[i].c_str();

            ShelfLogSink shelfLogSink{ *logger };
            Wt::WServer server{ argv[0] };
            server.setCustomLogger(shelfLogSink);
            server.setServerConfiguration(wtServerArgs.size(), const_cast<char**>(&wtArgv[0]));

            boost::asio::io_context ioContext; // background tasks, out of the Wt event loop

            // every Wt thread and the background thread may hold a connection
            const std::size_t connectionCount{ getThreadCount() + 1 };
            auto transactionalDb{ openDatabase(config->getPath("transactional-db-path", workingDirectory / "shelf-transactional.db"), connectionCount) };
            auto analyticsDb{ openDatabase(config->getPath("analytics-db-path", workingDirectory / "shelf-analytics.db"), connectionCount) };

            // Service initialization order is important (reverse-order for deinit)
            core::Service<sync::ISyncService> syncService{ sync::createSyncService(*transactionalDb, *analyticsDb) };
            core::Service<recommendation::IRecommendationService> recommendationService{ recommendation::createRecommendationService(*analyticsDb,
                workingDirectory / "cache" / "recommendation",
                config->getULong("recommendation-precomputed-neighbour-count", 0)) };

            if (!recommendationService->load() && config->getBool("recommendation-train-at-startup", false))
            {
                boost::asio::post(ioContext, [&recommendationService] {
                    SHELF_LOG(MAIN, INFO, "No model available, training at startup...");
                    try
                    {
                        recommendationService->train();
                    }
                    catch (const std::exception& e)
                    {
                        SHELF_LOG(MAIN, ERROR, "Startup training failed: " << e.what());
                    }
                });
            }

            // joined before the services are destroyed
            core::IOContextRunner ioContextRunner{ ioContext, 1, "Training" };

            // bind API resource
            std::unique_ptr<Wt::WResource> recommendationResource{ api::createRecommendationResource(*transactionalDb, *analyticsDb, *syncService, *recommendationService) };
            server.addResource(recommendationResource.get(), std::string{ config->getString("api-deploy-path", "/api") });

            SHELF_LOG(MAIN, INFO, "Starting web server...");
            server.start();

            SHELF_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            SHELF_LOG(MAIN, INFO, "Stopping server...");
            server.stop();

            SHELF_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const Wt::WServer::Exception& e)
        {
            SHELF_LOG(MAIN, FATAL, "Caught WServer::Exception: " << e.what());
            std::cerr << "Caught a WServer::Exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            SHELF_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace shelf

int main(int argc, char* argv[])
{
    return shelf::main(argc, argv);
}
