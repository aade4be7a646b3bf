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


#include "ModelGenerationCache.hpp"

#include <charconv>
#include <optional>
#include <system_error>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "services/recommendation/Exception.hpp"

#include "ModelGeneration.hpp"

namespace shelf::recommendation
{
    namespace
    {
        // shortest representation that reads back to the same value
        std::string doubleToString(double value)
        {
            char buffer[64];
            const auto [ptr, ec]{ std::to_chars(std::begin(buffer), std::end(buffer), value) };
            if (ec != std::errc{})
                throw Exception{ "Cannot convert value to string" };

            return std::string(buffer, ptr);
        }

        double stringToDouble(const std::string& str)
        {
            const std::optional<double> value{ core::stringUtils::readAs<double>(str) };
            if (!value)
                throw boost::property_tree::ptree_bad_data{ "Bad floating point value '" + str + "'", str };

            return *value;
        }

        double getDouble(const boost::property_tree::ptree& node, const std::string& path)
        {
            return stringToDouble(node.get<std::string>(path));
        }

        std::optional<double> getOptionalDouble(const boost::property_tree::ptree& node, const std::string& path)
        {
            if (!node.get_child_optional(path))
                return std::nullopt;

            return getDouble(node, path);
        }

        boost::property_tree::ptree encodingToTree(const FeatureEncoding& encoding)
        {
            boost::property_tree::ptree node;

            for (const std::string& category : encoding.categories)
                node.add("categories.category", category);
            for (const std::string& brand : encoding.brands)
                node.add("brands.brand", brand);

            node.put("price.min", doubleToString(encoding.minPrice));
            node.put("price.max", doubleToString(encoding.maxPrice));
            node.put("rating.min", doubleToString(encoding.minRating));
            node.put("rating.max", doubleToString(encoding.maxRating));

            return node;
        }

        FeatureEncoding encodingFromTree(const boost::property_tree::ptree& node)
        {
            FeatureEncoding encoding;

            if (const auto categories{ node.get_child_optional("categories") })
            {
                for (const auto& category : *categories)
                    encoding.categories.push_back(category.second.get_value<std::string>());
            }
            if (const auto brands{ node.get_child_optional("brands") })
            {
                for (const auto& brand : *brands)
                    encoding.brands.push_back(brand.second.get_value<std::string>());
            }

            encoding.minPrice = getDouble(node, "price.min");
            encoding.maxPrice = getDouble(node, "price.max");
            encoding.minRating = getDouble(node, "rating.min");
            encoding.maxRating = getDouble(node, "rating.max");

            return encoding;
        }

        boost::property_tree::ptree productToTree(const ProductRecord& product, const FeatureVector& vector, std::size_t support)
        {
            boost::property_tree::ptree node;

            node.put("id", product.id.getValue());
            node.put("name", product.name);
            if (product.category)
                node.put("category", *product.category);
            if (product.brand)
                node.put("brand", *product.brand);
            if (product.price)
                node.put("price", doubleToString(*product.price));
            if (product.rating)
                node.put("rating", doubleToString(*product.rating));
            node.put("picture", product.picture);
            node.put("stock", product.stock);
            node.put("support", support);

            for (double value : vector)
                node.add("vector.value", doubleToString(value));

            return node;
        }

        ProductRecord productFromTree(const boost::property_tree::ptree& node)
        {
            ProductRecord product;

            product.id = db::ProductId{ node.get<db::IdType::ValueType>("id") };
            product.name = node.get<std::string>("name");
            if (const auto category{ node.get_optional<std::string>("category") })
                product.category = *category;
            if (const auto brand{ node.get_optional<std::string>("brand") })
                product.brand = *brand;
            product.price = getOptionalDouble(node, "price");
            product.rating = getOptionalDouble(node, "rating");
            product.picture = node.get<std::string>("picture", "");
            product.stock = node.get<long long>("stock");

            return product;
        }
    } // namespace

    ModelGenerationCache::ModelGenerationCache(const std::filesystem::path& directory)
        : _directory{ directory }
        , _filePath{ directory / "generation.xml" }
    {
    }

    bool ModelGenerationCache::write(const ModelGeneration& generation) const
    {
        const std::filesystem::path tmpFilePath{ _directory / "generation.xml.tmp" };

        try
        {
            std::filesystem::create_directories(_directory);

            const Catalog& catalog{ generation.getCatalog() };
            const SimilarityModel& similarityModel{ generation.getSimilarityModel() };
            const CoPurchaseModel& coPurchaseModel{ generation.getCoPurchaseModel() };

            boost::property_tree::ptree root;

            root.put("generation.id", generation.getId());
            root.put("generation.created_at", core::stringUtils::toISO8601String(generation.getCreatedAt()));
            root.put("generation.feature_dimension", generation.getEncoding().getDimension());
            root.put("generation.basket_count", coPurchaseModel.getBasketCount());
            root.add_child("generation.encoding", encodingToTree(generation.getEncoding()));

            for (std::size_t i{}; i < catalog.size(); ++i)
                root.add_child("generation.products.product", productToTree(catalog.get(i), similarityModel.getVectors()[i], coPurchaseModel.getSupports()[i]));

            const CoPurchaseModel::CoOccurrenceTable& coOccurrences{ coPurchaseModel.getCoOccurrences() };
            for (std::size_t i{}; i < coOccurrences.size(); ++i)
            {
                for (const auto& [otherIndex, count] : coOccurrences[i])
                {
                    boost::property_tree::ptree node;
                    node.put("product", catalog.get(i).id.getValue());
                    node.put("other_product", catalog.get(otherIndex).id.getValue());
                    node.put("count", count);

                    root.add_child("generation.co_occurrences.pair", node);
                }
            }

            boost::property_tree::write_xml(tmpFilePath.string(), root);
            std::filesystem::rename(tmpFilePath, _filePath);

            SHELF_LOG(RECOMMENDATION, DEBUG, "Generation " << generation.getId() << " written to " << _filePath);
            return true;
        }
        catch (const boost::property_tree::ptree_error& error)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot write generation cache: " << error.what());
        }
        catch (const std::filesystem::filesystem_error& error)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot write generation cache: " << error.what());
        }

        std::error_code ec;
        std::filesystem::remove(tmpFilePath, ec);
        return false;
    }

    std::unique_ptr<ModelGeneration> ModelGenerationCache::read(std::size_t neighbourCount) const
    {
        if (!std::filesystem::exists(_filePath))
            return nullptr;

        try
        {
            SHELF_LOG(RECOMMENDATION, INFO, "Reading generation from cache...");

            boost::property_tree::ptree root;
            boost::property_tree::read_xml(_filePath.string(), root);

            const boost::property_tree::ptree& generationNode{ root.get_child("generation") };

            const std::size_t id{ generationNode.get<std::size_t>("id") };
            const Wt::WDateTime createdAt{ core::stringUtils::fromISO8601String(generationNode.get<std::string>("created_at")) };
            const std::size_t featureDimension{ generationNode.get<std::size_t>("feature_dimension") };
            const std::size_t basketCount{ generationNode.get<std::size_t>("basket_count") };

            FeatureEncoding encoding{ encodingFromTree(generationNode.get_child("encoding")) };
            if (encoding.getDimension() != featureDimension)
                throw Exception{ "Feature dimension mismatch" };

            std::vector<ProductRecord> products;
            std::vector<FeatureVector> vectors;
            std::vector<std::size_t> supports;
            if (const auto productsNode{ generationNode.get_child_optional("products") })
            {
                for (const auto& productNode : *productsNode)
                {
                    products.push_back(productFromTree(productNode.second));
                    supports.push_back(productNode.second.get<std::size_t>("support"));

                    FeatureVector vector;
                    if (const auto vectorNode{ productNode.second.get_child_optional("vector") })
                    {
                        for (const auto& value : *vectorNode)
                            vector.push_back(stringToDouble(value.second.get_value<std::string>()));
                    }
                    if (vector.size() != featureDimension)
                        throw Exception{ "Bad vector size for product " + products.back().id.toString() };

                    vectors.push_back(std::move(vector));
                }
            }

            std::vector<db::ProductId> productIds;
            productIds.reserve(products.size());
            for (const ProductRecord& product : products)
                productIds.push_back(product.id);

            auto catalog{ std::make_shared<const Catalog>(std::move(products)) };
            // vectors and supports are indexed like the catalog
            for (std::size_t i{}; i < productIds.size(); ++i)
            {
                if (catalog->get(i).id != productIds[i])
                    throw Exception{ "Products are not sorted by id" };
            }

            CoPurchaseModel::CoOccurrenceTable coOccurrences(catalog->size());
            if (const auto coOccurrencesNode{ generationNode.get_child_optional("co_occurrences") })
            {
                for (const auto& pairNode : *coOccurrencesNode)
                {
                    const std::optional<std::size_t> index{ catalog->findIndex(db::ProductId{ pairNode.second.get<db::IdType::ValueType>("product") }) };
                    const std::optional<std::size_t> otherIndex{ catalog->findIndex(db::ProductId{ pairNode.second.get<db::IdType::ValueType>("other_product") }) };
                    if (!index || !otherIndex)
                        throw Exception{ "Co-occurrence refers to an unknown product" };

                    coOccurrences[*index][*otherIndex] = pairNode.second.get<std::size_t>("count");
                }
            }

            SimilarityModel similarityModel{ catalog, std::move(vectors), neighbourCount };
            CoPurchaseModel coPurchaseModel{ catalog, basketCount, std::move(supports), std::move(coOccurrences) };

            auto generation{ std::make_unique<ModelGeneration>(id, createdAt, catalog, std::move(encoding), std::move(similarityModel), std::move(coPurchaseModel)) };

            SHELF_LOG(RECOMMENDATION, INFO, "Successfully read generation " << id << " from cache");

            return generation;
        }
        catch (const boost::property_tree::ptree_error& error)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot read generation cache: " << error.what());
        }
        catch (const Exception& error)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot read generation cache: " << error.what());
        }

        return nullptr;
    }

    std::optional<std::size_t> ModelGenerationCache::readGenerationId() const
    {
        if (!std::filesystem::exists(_filePath))
            return std::nullopt;

        try
        {
            boost::property_tree::ptree root;
            boost::property_tree::read_xml(_filePath.string(), root);

            return root.get<std::size_t>("generation.id");
        }
        catch (const boost::property_tree::ptree_error& error)
        {
            SHELF_LOG(RECOMMENDATION, ERROR, "Cannot read generation id from cache: " << error.what());
        }

        return std::nullopt;
    }
} // namespace shelf::recommendation
