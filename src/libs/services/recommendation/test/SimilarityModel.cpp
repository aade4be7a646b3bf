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


#include <memory>

#include <gtest/gtest.h>

#include "services/recommendation/Exception.hpp"

#include "Catalog.hpp"
#include "FeatureVectorizer.hpp"
#include "SimilarityModel.hpp"
#include "Common.hpp"

namespace shelf::recommendation::tests
{
    namespace
    {
        SimilarityModel createModel(std::shared_ptr<const Catalog> catalog, std::size_t neighbourCount = 0)
        {
            const FeatureVectorizer vectorizer{ FeatureVectorizer::computeEncoding(catalog->getProducts()) };

            std::vector<FeatureVector> vectors;
            for (const ProductRecord& product : catalog->getProducts())
                vectors.push_back(vectorizer.vectorize(product));

            return SimilarityModel{ catalog, std::move(vectors), neighbourCount };
        }

        std::vector<ProductRecord> makeLargerCatalog()
        {
            return {
                makeProduct(1, "Laptops", "Acme", 999, 4.5),
                makeProduct(2, "Laptops", "Acme", 1299, 4.7),
                makeProduct(3, "Laptops", "Globex", 899, 4.5),
                makeProduct(4, "Mice", "Acme", 25, 4.0),
                makeProduct(5, "Mice", "Globex", 19, 3.5),
                makeProduct(6, "Cables", std::nullopt, 5, std::nullopt),
                makeProduct(7, "Cables", std::nullopt, 5, std::nullopt),
                makeProduct(8, std::nullopt, "Initech", std::nullopt, 2.0),
                makeProduct(9, "Mice", "Acme", 25, 4.0),
            };
        }
    } // namespace

    TEST(SimilarityModel, rankingScenario)
    {
        auto catalog{ std::make_shared<const Catalog>(makeSmallCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        const ResultContainer results{ model.getSimilar(db::ProductId{ 1 }, 2) };
        ASSERT_EQ(results.size(), 2);
        EXPECT_EQ(results[0].productId, db::ProductId{ 2 });
        EXPECT_EQ(results[1].productId, db::ProductId{ 3 });
        EXPECT_GT(results[0].score, results[1].score);
        EXPECT_GT(results[0].score, 0.9);
        EXPECT_DOUBLE_EQ(results[1].score, 0);
    }

    TEST(SimilarityModel, noSelfRecommendation)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        for (const ProductRecord& product : catalog->getProducts())
        {
            const ResultContainer results{ model.getSimilar(product.id, maxResultCount) };
            EXPECT_EQ(results.size(), catalog->size() - 1);
            for (const ScoredProduct& result : results)
                EXPECT_NE(result.productId, product.id);
        }
    }

    TEST(SimilarityModel, symmetry)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        for (std::size_t i{}; i < catalog->size(); ++i)
        {
            for (std::size_t j{}; j < catalog->size(); ++j)
                EXPECT_NEAR(model.computeSimilarity(i, j), model.computeSimilarity(j, i), 1e-12) << "i = " << i << ", j = " << j;
        }
    }

    TEST(SimilarityModel, scoresAreOrdered)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        const ResultContainer results{ model.getSimilar(db::ProductId{ 4 }, 10) };
        ASSERT_FALSE(results.empty());
        // same attributes
        EXPECT_EQ(results.front().productId, db::ProductId{ 9 });
        EXPECT_NEAR(results.front().score, 1, 1e-9);

        for (std::size_t i{ 1 }; i < results.size(); ++i)
            EXPECT_GE(results[i - 1].score, results[i].score);
    }

    TEST(SimilarityModel, tieBreak)
    {
        // the query shares no attribute with the others, all scores are 0
        auto catalog{ std::make_shared<const Catalog>(std::vector<ProductRecord>{
            makeProduct(5, "Y", std::nullopt, 10, 4.0),
            makeProduct(1, "X", std::nullopt, 10, 3.0),
            makeProduct(3, "Y", std::nullopt, 10, 5.0),
            makeProduct(2, "Y", std::nullopt, 10, 4.0),
        }) };
        const SimilarityModel model{ createModel(catalog) };

        const ResultContainer results{ model.getSimilar(db::ProductId{ 1 }, 10) };
        ASSERT_EQ(results.size(), 3);
        for (const ScoredProduct& result : results)
            EXPECT_DOUBLE_EQ(result.score, 0);

        // higher rating first, then lower id
        EXPECT_EQ(results[0].productId, db::ProductId{ 3 });
        EXPECT_EQ(results[1].productId, db::ProductId{ 2 });
        EXPECT_EQ(results[2].productId, db::ProductId{ 5 });
    }

    TEST(SimilarityModel, limits)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        EXPECT_TRUE(model.getSimilar(db::ProductId{ 1 }, 0).empty());
        EXPECT_EQ(model.getSimilar(db::ProductId{ 1 }, 3).size(), 3);
        EXPECT_EQ(model.getSimilar(db::ProductId{ 1 }, 100).size(), catalog->size() - 1);
    }

    TEST(SimilarityModel, notFound)
    {
        auto catalog{ std::make_shared<const Catalog>(makeSmallCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        EXPECT_THROW(model.getSimilar(db::ProductId{ 42 }, 5), NotFoundException);
    }

    TEST(SimilarityModel, singleProduct)
    {
        auto catalog{ std::make_shared<const Catalog>(std::vector<ProductRecord>{ makeProduct(1, "X", "1", 10, 4) }) };
        const SimilarityModel model{ createModel(catalog, 5) };

        EXPECT_TRUE(model.getSimilar(db::ProductId{ 1 }, 5).empty());
        EXPECT_EQ(model.getPositivePairCount(), 0);
    }

    TEST(SimilarityModel, zeroNorm)
    {
        // no category, no brand, price and rating at their minimum
        auto catalog{ std::make_shared<const Catalog>(std::vector<ProductRecord>{
            makeProduct(1, std::nullopt, std::nullopt, 10, 3),
            makeProduct(2, "X", std::nullopt, 20, 4),
        }) };
        const SimilarityModel model{ createModel(catalog) };

        EXPECT_EQ(model.computeSimilarity(0, 1), 0);

        const ResultContainer results{ model.getSimilar(db::ProductId{ 1 }, 5) };
        ASSERT_EQ(results.size(), 1);
        EXPECT_EQ(results[0].score, 0);
    }

    TEST(SimilarityModel, positivePairCount)
    {
        auto catalog{ std::make_shared<const Catalog>(makeSmallCatalog()) };
        const SimilarityModel model{ createModel(catalog) };

        // A-B and B-C, in both directions
        EXPECT_EQ(model.getPositivePairCount(), 4);
    }

    TEST(SimilarityModel, precomputedNeighboursMatchScan)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const SimilarityModel scanModel{ createModel(catalog, 0) };
        const SimilarityModel cachedModel{ createModel(catalog, 4) };

        EXPECT_EQ(cachedModel.getNeighbourCount(), 4);
        EXPECT_EQ(cachedModel.getPositivePairCount(), scanModel.getPositivePairCount());

        for (const ProductRecord& product : catalog->getProducts())
        {
            for (std::size_t count{}; count <= catalog->size() + 1; ++count)
                EXPECT_EQ(cachedModel.getSimilar(product.id, count), scanModel.getSimilar(product.id, count)) << "product = " << product.id.toString() << ", count = " << count;
        }
    }

    TEST(SimilarityModel, progress)
    {
        auto catalog{ std::make_shared<const Catalog>(makeLargerCatalog()) };
        const FeatureVectorizer vectorizer{ FeatureVectorizer::computeEncoding(catalog->getProducts()) };

        std::vector<FeatureVector> vectors;
        for (const ProductRecord& product : catalog->getProducts())
            vectors.push_back(vectorizer.vectorize(product));

        std::size_t callCount{};
        Progress lastProgress;
        const SimilarityModel model{ catalog, std::move(vectors), 0, [&](const Progress& progress) {
                                        callCount++;
                                        lastProgress = progress;
                                    } };

        EXPECT_EQ(callCount, catalog->size());
        EXPECT_EQ(lastProgress.totalElems, catalog->size());
        EXPECT_EQ(lastProgress.processedElems, catalog->size());
    }
} // namespace shelf::recommendation::tests
