/**
 * @file test_graph_builder.cpp
 * @brief Tests for building the application graph from facts
 */

#include "hexarch/graph_builder.hpp"
#include "hexarch/graph_query.hpp"
#include "hexarch/report.hpp"

#include "support/facts_fixture.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hexarch::facts::test {

namespace {

using graph::EdgeKind;
using graph::NodeId;
using hexarch::test::field;
using hexarch::test::method;
using hexarch::test::ref;
using hexarch::test::type_fact;

nlohmann::json shop_types()
{
    auto order = type_fact("com.shop.order.Order");
    order["interfaces"] = nlohmann::json::array({ref("com.shop.shared.Auditable")});
    order["supertype"] = ref("com.shop.shared.BaseEntity");
    order["annotations"] = nlohmann::json::array({"com.shop.shared.AggregateRoot", "Deprecated"});
    order["fields"] = nlohmann::json::array(
        {field("id", ref("com.shop.order.OrderId")),
         field("lines", ref("java.util.List", nlohmann::json::array({ref("com.shop.order.OrderLine")}))),
         field("count", ref("int"))});
    order["methods"] = nlohmann::json::array(
        {method("addLine", ref("void"), nlohmann::json::array({ref("com.shop.order.OrderLine"), ref("int")}))});

    auto repository = type_fact("com.shop.order.OrderRepository", "interface");
    repository["methods"] = nlohmann::json::array(
        {method("save", ref("void"), nlohmann::json::array({ref("com.shop.order.Order")}))});

    return nlohmann::json::array({order,
                                  repository,
                                  type_fact("com.shop.order.OrderId", "record"),
                                  type_fact("com.shop.order.OrderLine"),
                                  type_fact("com.shop.shared.Auditable", "interface"),
                                  type_fact("com.shop.shared.BaseEntity"),
                                  type_fact("com.shop.shared.AggregateRoot", "annotation")});
}

std::vector<std::string> edge_lines(const graph::ApplicationGraph& graph)
{
    std::vector<std::string> lines;
    for (const auto& edge : graph.edges()) {
        lines.push_back(edge.from.value() + " " + std::string(graph::to_string(edge.kind)) + " "
                        + edge.to.value());
    }
    return lines;
}

}  // namespace

TEST(GraphBuilderTest, CreatesNodesForTypesAndMembers)
{
    auto graph = hexarch::test::build_from_types(shop_types());
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    EXPECT_EQ(graph->type_nodes().size(), 7U);
    EXPECT_NE(graph->field_node(NodeId::field("com.shop.order.Order", "lines")), nullptr);
    EXPECT_NE(graph->method_node(NodeId::method("com.shop.order.Order", "addLine",
                                                {"com.shop.order.OrderLine", "int"})),
              nullptr);
    EXPECT_EQ(graph->indexes().members_of(NodeId::type("com.shop.order.Order")).size(), 4U);
}

TEST(GraphBuilderTest, CreatesStructuralEdges)
{
    auto graph = hexarch::test::build_from_types(shop_types());
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const auto order = NodeId::type("com.shop.order.Order");
    const auto lines = NodeId::field("com.shop.order.Order", "lines");
    EXPECT_TRUE(graph->contains_edge(order, NodeId::type("com.shop.shared.BaseEntity"), EdgeKind::kExtends));
    EXPECT_TRUE(graph->contains_edge(order, NodeId::type("com.shop.shared.Auditable"), EdgeKind::kImplements));
    EXPECT_TRUE(
        graph->contains_edge(order, NodeId::type("com.shop.shared.AggregateRoot"), EdgeKind::kAnnotatedBy));
    EXPECT_TRUE(graph->contains_edge(order, lines, EdgeKind::kDeclares));
    EXPECT_TRUE(
        graph->contains_edge(lines, NodeId::type("com.shop.order.OrderLine"), EdgeKind::kTypeArgument));
    EXPECT_TRUE(graph->contains_edge(NodeId::field("com.shop.order.Order", "id"),
                                     NodeId::type("com.shop.order.OrderId"),
                                     EdgeKind::kFieldType));
}

TEST(GraphBuilderTest, ExternalAndPrimitiveTypesProduceNoEdges)
{
    auto graph = hexarch::test::build_from_types(shop_types());
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    for (const auto& edge : graph->edges()) {
        EXPECT_TRUE(graph->contains_node(edge.to)) << edge.to.value();
        EXPECT_NE(edge.to.value(), "type:java.util.List");
        EXPECT_NE(edge.to.value(), "type:int");
        EXPECT_NE(edge.to.value(), "type:Deprecated");
    }
    EXPECT_TRUE(graph->edges_from(NodeId::field("com.shop.order.Order", "count")).empty());
}

TEST(GraphBuilderTest, ReferencesAreTypeLevelAndDistinct)
{
    auto graph = hexarch::test::build_from_types(shop_types());
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    std::vector<std::string> targets;
    for (const auto* edge : graph->edges_from(NodeId::type("com.shop.order.Order"))) {
        if (edge->kind == EdgeKind::kReferences) {
            EXPECT_FALSE(edge->is_derived());
            targets.emplace_back(edge->to.owner());
        }
    }
    const std::vector<std::string> expected = {"com.shop.order.OrderId",
                                               "com.shop.order.OrderLine",
                                               "com.shop.shared.Auditable",
                                               "com.shop.shared.BaseEntity"};
    EXPECT_EQ(targets, expected);

    const auto repository_refs = graph->edges_from(NodeId::type("com.shop.order.OrderRepository"));
    EXPECT_EQ(std::ranges::count_if(repository_refs,
                                    [](const graph::Edge* e) { return e->kind == EdgeKind::kReferences; }),
              1);
}

TEST(GraphBuilderTest, ExplicitReferencesAreResolvedAndSelfIsDropped)
{
    auto types = nlohmann::json::array(
        {hexarch::test::referencing("com.shop.a.Alpha", {"com.shop.a.Alpha", "com.shop.b.Beta", "org.lib.Gone"}),
         type_fact("com.shop.b.Beta")});
    auto graph = hexarch::test::build_from_types(types);
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const auto references = graph->edges(EdgeKind::kReferences);
    ASSERT_EQ(references.size(), 1U);
    EXPECT_EQ(references[0]->from, NodeId::type("com.shop.a.Alpha"));
    EXPECT_EQ(references[0]->to, NodeId::type("com.shop.b.Beta"));
}

TEST(GraphBuilderTest, RecordComponentsBecomeFinalFields)
{
    auto id = type_fact("com.shop.order.OrderId", "record");
    const nlohmann::json component = {
        {"name", "value"         },
        {"type", ref("java.util.UUID")}
    };
    id["record_components"] = nlohmann::json::array({component});
    auto graph = hexarch::test::build_from_types(nlohmann::json::array({id}));
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const auto* value = graph->field_node(NodeId::field("com.shop.order.OrderId", "value"));
    ASSERT_NE(value, nullptr);
    EXPECT_TRUE(value->modifiers.has(graph::Modifier::kPrivate));
    EXPECT_TRUE(value->modifiers.has(graph::Modifier::kFinal));
    EXPECT_TRUE(graph->query().is_immutable(*graph->type_node("com.shop.order.OrderId")));
}

TEST(GraphBuilderTest, DuplicateTypeFactsFail)
{
    auto types = nlohmann::json::array({type_fact("com.shop.Order"), type_fact("com.shop.Order")});
    auto graph = hexarch::test::build_from_types(types);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, "DuplicateNodeId");
}

TEST(GraphBuilderTest, FactOrderDoesNotChangeTheGraph)
{
    auto types = shop_types();
    auto reference = hexarch::test::build_from_types(types);
    ASSERT_TRUE(reference.has_value()) << reference.error().message;
    const auto expected_edges = edge_lines(*reference);
    const auto expected_summary = report::graph_summary(*reference).dump();

    std::mt19937 rng(42);
    for (int round = 0; round < 5; ++round) {
        auto shuffled = types;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        auto graph = hexarch::test::build_from_types(shuffled);
        ASSERT_TRUE(graph.has_value()) << graph.error().message;
        EXPECT_EQ(edge_lines(*graph), expected_edges);
        EXPECT_EQ(report::graph_summary(*graph).dump(), expected_summary);
    }
}

TEST(GraphBuilderTest, DerivedEdgesCanBeSkipped)
{
    auto raw_only = hexarch::test::build_from_types(shop_types(), {.compute_derived = false, .detect_style = true});
    ASSERT_TRUE(raw_only.has_value()) << raw_only.error().message;
    EXPECT_TRUE(raw_only->derived_edges().empty());

    auto enriched = hexarch::test::build_from_types(shop_types());
    ASSERT_TRUE(enriched.has_value()) << enriched.error().message;
    EXPECT_FALSE(enriched->derived_edges().empty());
    EXPECT_EQ(enriched->raw_edges().size(), raw_only->raw_edges().size());
}

}  // namespace hexarch::facts::test
