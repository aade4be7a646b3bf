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


#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdlib.h>

#include <boost/program_options.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/sync/ISyncService.hpp"

namespace shelf
{
    namespace
    {
        std::string productToString(const recommendation::IRecommendationService& recommendationService, db::ProductId productId)
        {
            std::string res{ productId.toString() };

            if (const std::optional<recommendation::ProductRecord> product{ recommendationService.getProductInfo(productId) })
            {
                res += " '" + product->name + "'";
                if (product->category)
                    res += " {" + *product->category + "}";
                if (product->brand)
                    res += " [" + *product->brand + "]";
            }

            return res;
        }

        void dumpResults(const recommendation::IRecommendationService& recommendationService, std::string_view title, db::ProductId productId, const recommendation::ResultContainer& results)
        {
            std::cout << "*** " << title << " for product " << productToString(recommendationService, productId) << " (" << results.size() << ") ***" << std::endl;
            for (const recommendation::ScoredProduct& result : results)
                std::cout << "\t- " << std::fixed << std::setprecision(4) << result.score << "\t" << productToString(recommendationService, result.productId) << std::endl;
        }

        void dumpModelInfo(const recommendation::IRecommendationService& recommendationService)
        {
            const std::optional<recommendation::ModelInfo> info{ recommendationService.getModelInfo() };
            if (!info)
            {
                std::cout << "No model available" << std::endl;
                return;
            }

            std::cout << "Generation: " << info->generationId << std::endl;
            std::cout << "Created at: " << core::stringUtils::toISO8601String(info->createdAt) << std::endl;
            std::cout << "Cache file: " << info->cacheFile.string() << std::endl;
            std::cout << "Feature dimension: " << info->featureDimension << std::endl;
            std::cout << "Products: " << info->productCount << std::endl;
            std::cout << "Baskets: " << info->basketCount << std::endl;
            std::cout << "Similarity pairs: " << info->similarityPairCount << std::endl;
            std::cout << "Co-purchase pairs: " << info->coPurchasePairCount << std::endl;
        }
    } // namespace
} // namespace shelf

int main(int argc, char* argv[])
{
    try
    {
        using namespace shelf;
        namespace po = boost::program_options;

        // log to stdout
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger() };

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value(core::sysconfDirectory / "shelf.conf"), "Shelf config file")("sync", "Refresh the analytics database before anything else")("train", "Train a new model generation")("similar", po::value<db::IdType::ValueType>(), "Display similar products")("copurchase", po::value<db::IdType::ValueType>(), "Display products frequently bought together")("limit,l", po::value<std::size_t>()->default_value(recommendation::defaultResultCount), "Max result count")("dump", "Display information about the live model");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        const std::filesystem::path workingDirectory{ config->getPath("working-dir", "/var/shelf") };
        auto transactionalDb{ db::createDb(config->getPath("transactional-db-path", workingDirectory / "shelf-transactional.db")) };
        auto analyticsDb{ db::createDb(config->getPath("analytics-db-path", workingDirectory / "shelf-analytics.db")) };
        for (db::IDb* database : { transactionalDb.get(), analyticsDb.get() })
        {
            db::Session session{ *database };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        if (vm.count("sync"))
        {
            std::cout << "Syncing analytics database..." << std::endl;
            const sync::SyncStats stats{ sync::createSyncService(*transactionalDb, *analyticsDb)->sync() };
            std::cout << "Synced " << stats.productCount << " products, " << stats.orderCount << " orders, " << stats.orderItemCount << " order items" << std::endl;
        }

        const auto recommendationService{ recommendation::createRecommendationService(*analyticsDb, workingDirectory / "cache" / "recommendation", config->getULong("recommendation-precomputed-neighbour-count", 0)) };

        const bool loaded{ recommendationService->load() };
        if (vm.count("train"))
        {
            std::cout << "Training..." << std::endl;
            const recommendation::TrainResult result{ recommendationService->train() };
            std::cout << "Generation " << result.generationId << " trained in " << result.duration.count() << " ms (" << result.productCount << " products, " << result.basketCount << " baskets)" << std::endl;
        }
        else if (!loaded)
        {
            std::cerr << "No model available, use --train" << std::endl;
            return EXIT_FAILURE;
        }

        const std::size_t limit{ vm["limit"].as<std::size_t>() };

        if (vm.count("similar"))
        {
            const db::ProductId productId{ vm["similar"].as<db::IdType::ValueType>() };
            dumpResults(*recommendationService, "Similar products", productId, recommendationService->getSimilar(productId, limit));
        }

        if (vm.count("copurchase"))
        {
            const db::ProductId productId{ vm["copurchase"].as<db::IdType::ValueType>() };
            dumpResults(*recommendationService, "Frequently bought together", productId, recommendationService->getCoPurchased(productId, limit));
        }

        if (vm.count("dump"))
            dumpModelInfo(*recommendationService);
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
