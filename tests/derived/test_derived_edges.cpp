/**
 * @file test_derived_edges.cpp
 * @brief Tests for signature-usage and container-unwrap edge inference
 */

#include "hexarch/derived_edges.hpp"

#include "support/facts_fixture.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hexarch::derived::test {

namespace {

using graph::EdgeKind;
using graph::NodeId;
using hexarch::test::array_ref;
using hexarch::test::field;
using hexarch::test::method;
using hexarch::test::ref;
using hexarch::test::type_fact;

nlohmann::json catalog_types()
{
    auto product = type_fact("com.shop.catalog.Product");
    product["fields"] = nlohmann::json::array(
        {field("id", ref("com.shop.catalog.ProductId")),
         field("tags", ref("java.util.Set", nlohmann::json::array({ref("com.shop.catalog.Tag")}))),
         field("prices", ref("java.util.Map", nlohmann::json::array({ref("java.lang.String"), ref("com.shop.catalog.Price")}))),
         field("discount", ref("java.util.Optional", nlohmann::json::array({ref("com.shop.catalog.Discount")}))),
         field("images", array_ref("com.shop.catalog.Image")),
         field("nested", ref("java.util.List",
                             nlohmann::json::array({ref("java.util.List", nlohmann::json::array({ref("com.shop.catalog.Variant")}))}))),
         field("names", ref("java.util.List", nlohmann::json::array({ref("java.lang.String")})))});
    product["methods"] = nlohmann::json::array({method("price", ref("com.shop.catalog.Price"))});

    auto catalog = type_fact("com.shop.catalog.Catalog", "interface");
    catalog["methods"] = nlohmann::json::array(
        {method("find", ref("java.util.Optional", nlohmann::json::array({ref("com.shop.catalog.Product")})),
                nlohmann::json::array({ref("com.shop.catalog.ProductId")})),
         method("count", ref("long"))});

    auto wrapper = type_fact("com.shop.catalog.Shelf");
    wrapper["fields"] = nlohmann::json::array(
        {field("box", ref("com.shop.catalog.Box", nlohmann::json::array({ref("com.shop.catalog.Product")})))});

    nlohmann::json types = nlohmann::json::array({product, catalog, wrapper});
    for (const auto* name : {"com.shop.catalog.ProductId", "com.shop.catalog.Tag", "com.shop.catalog.Price",
                             "com.shop.catalog.Discount", "com.shop.catalog.Image", "com.shop.catalog.Variant",
                             "com.shop.catalog.Box"}) {
        types.push_back(type_fact(name));
    }
    return types;
}

graph::ApplicationGraph build_raw()
{
    auto graph = hexarch::test::build_from_types(catalog_types(), {.compute_derived = false, .detect_style = false});
    EXPECT_TRUE(graph.has_value()) << graph.error().message;
    return graph ? std::move(*graph) : graph::ApplicationGraph{};
}

const graph::Edge* find_edge(const graph::ApplicationGraph& graph,
                             const std::string& from,
                             const std::string& to,
                             EdgeKind kind)
{
    for (const auto* edge : graph.edges(kind)) {
        if (edge->from == NodeId::type(from) && edge->to == NodeId::type(to)) {
            return edge;
        }
    }
    return nullptr;
}

}  // namespace

TEST(DerivedEdgesTest, WrapperNames)
{
    EXPECT_TRUE(is_collection_wrapper("java.util.List"));
    EXPECT_TRUE(is_collection_wrapper("Stream"));
    EXPECT_TRUE(is_optional_wrapper("java.util.Optional"));
    EXPECT_TRUE(is_map_wrapper("java.util.HashMap"));
    EXPECT_FALSE(is_collection_wrapper("java.util.Optional"));
    EXPECT_FALSE(is_optional_wrapper("com.shop.Box"));
}

TEST(DerivedEdgesTest, SignatureEdgesOnlyFromInterfaces)
{
    auto graph = build_raw();
    auto stats = compute_derived_edges(graph);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    const auto* product = find_edge(graph, "com.shop.catalog.Catalog", "com.shop.catalog.Product",
                                    EdgeKind::kUsesInSignature);
    ASSERT_NE(product, nullptr);
    ASSERT_TRUE(product->proof.has_value());
    EXPECT_EQ(product->proof->via, "return");
    EXPECT_EQ(product->proof->rule, kRuleSignatureUsage);
    EXPECT_EQ(product->proof->source_member,
              NodeId::method("com.shop.catalog.Catalog", "find", {"com.shop.catalog.ProductId"}));

    const auto* id = find_edge(graph, "com.shop.catalog.Catalog", "com.shop.catalog.ProductId",
                               EdgeKind::kUsesInSignature);
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->proof->via, "param:0");

    // Product is a class: its method signatures produce no signature edges
    EXPECT_EQ(find_edge(graph, "com.shop.catalog.Product", "com.shop.catalog.Price", EdgeKind::kUsesInSignature),
              nullptr);
    EXPECT_EQ(stats->signature_edges, 2U);
}

TEST(DerivedEdgesTest, CollectionAndOptionalUnwrapping)
{
    auto graph = build_raw();
    auto stats = compute_derived_edges(graph);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    const std::string product = "com.shop.catalog.Product";
    const auto* tag = find_edge(graph, product, "com.shop.catalog.Tag", EdgeKind::kUsesAsCollectionElement);
    ASSERT_NE(tag, nullptr);
    EXPECT_EQ(tag->proof->rule, kRuleCollectionUnwrap);
    EXPECT_EQ(tag->proof->source_member, NodeId::field(product, "tags"));

    EXPECT_NE(find_edge(graph, product, "com.shop.catalog.Price", EdgeKind::kUsesAsCollectionElement), nullptr);
    EXPECT_NE(find_edge(graph, product, "com.shop.catalog.Image", EdgeKind::kUsesAsCollectionElement), nullptr);
    EXPECT_NE(find_edge(graph, product, "com.shop.catalog.Variant", EdgeKind::kUsesAsCollectionElement), nullptr);

    const auto* discount =
        find_edge(graph, product, "com.shop.catalog.Discount", EdgeKind::kUsesAsOptionalElement);
    ASSERT_NE(discount, nullptr);
    EXPECT_EQ(discount->proof->rule, kRuleOptionalUnwrap);

    EXPECT_EQ(stats->collection_edges, 4U);
    EXPECT_EQ(stats->optional_edges, 1U);
}

TEST(DerivedEdgesTest, InCodebaseWrapperIsNotUnwrapped)
{
    auto graph = build_raw();
    ASSERT_TRUE(compute_derived_edges(graph).has_value());
    EXPECT_EQ(find_edge(graph, "com.shop.catalog.Shelf", "com.shop.catalog.Product",
                        EdgeKind::kUsesAsCollectionElement),
              nullptr);
    EXPECT_EQ(find_edge(graph, "com.shop.catalog.Shelf", "com.shop.catalog.Product",
                        EdgeKind::kUsesAsOptionalElement),
              nullptr);
}

TEST(DerivedEdgesTest, SecondRunAddsNothing)
{
    auto graph = build_raw();
    auto first = compute_derived_edges(graph);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first->added(), 7U);
    const auto edge_count = graph.edge_count();

    auto second = compute_derived_edges(graph);
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_EQ(second->added(), 0U);
    EXPECT_EQ(second->skipped_existing, first->added());
    EXPECT_EQ(graph.edge_count(), edge_count);
}

TEST(DerivedEdgesTest, EveryDerivedEdgeCarriesAProof)
{
    auto graph = build_raw();
    ASSERT_TRUE(compute_derived_edges(graph).has_value());
    for (const auto* edge : graph.derived_edges()) {
        EXPECT_TRUE(graph::is_derived_kind(edge->kind));
        ASSERT_TRUE(edge->proof.has_value());
        EXPECT_TRUE(graph.contains_node(edge->proof->source_member));
    }
    for (const auto* edge : graph.raw_edges()) {
        EXPECT_FALSE(edge->proof.has_value());
    }
}

}  // namespace hexarch::derived::test
