/**
 * @file test_application_graph.cpp
 * @brief Tests for graph insertion checks and indexes
 */

#include "hexarch/graph.hpp"
#include "hexarch/graph_query.hpp"

#include <string>

#include <gtest/gtest.h>

namespace hexarch::graph::test {

namespace {

TypeNode make_type(const std::string& qualified_name, TypeForm form = TypeForm::kClass)
{
    return TypeNode{.id = NodeId::type(qualified_name),
                    .qualified_name = qualified_name,
                    .form = form,
                    .modifiers = {},
                    .annotations = {},
                    .supertype = std::nullopt,
                    .interfaces = {},
                    .record_components = {}};
}

FieldNode make_field(const std::string& owner, const std::string& name, const std::string& type)
{
    Modifiers modifiers;
    modifiers.add(Modifier::kPrivate);
    return FieldNode{.id = NodeId::field(owner, name),
                     .declaring_type = NodeId::type(owner),
                     .name = name,
                     .modifiers = modifiers,
                     .annotations = {},
                     .type = TypeRef{.name = type, .arguments = {}, .array = false}};
}

Proof make_proof(const NodeId& member)
{
    return Proof{.source_member = member, .via = "field", .rule = "collection-unwrap"};
}

class ApplicationGraphTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_graph.add_node(make_type("com.shop.order.Order")).has_value());
        ASSERT_TRUE(m_graph.add_node(make_type("com.shop.order.OrderLine")).has_value());
        ASSERT_TRUE(
            m_graph.add_node(make_type("com.shop.order.OrderRepository", TypeForm::kInterface))
                .has_value());
        ASSERT_TRUE(m_graph.add_node(make_field("com.shop.order.Order", "lines", "java.util.List"))
                        .has_value());
    }

    ApplicationGraph m_graph;
};

}  // namespace

TEST_F(ApplicationGraphTest, DuplicateNodeIsRejected)
{
    auto result = m_graph.add_node(make_type("com.shop.order.Order"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "DuplicateNodeId");
    EXPECT_NE(result.error().message.find("type:com.shop.order.Order"), std::string::npos);
    EXPECT_EQ(m_graph.node_count(), 4U);
}

TEST_F(ApplicationGraphTest, DanglingEndpointsAreRejected)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto missing = NodeId::type("com.shop.billing.Invoice");

    auto to_missing = m_graph.add_edge(Edge::raw(order, missing, EdgeKind::kReferences));
    ASSERT_FALSE(to_missing.has_value());
    EXPECT_EQ(to_missing.error().code, "DanglingEdgeEndpoint");
    EXPECT_NE(to_missing.error().message.find("type:com.shop.billing.Invoice"), std::string::npos);

    auto from_missing = m_graph.add_edge(Edge::raw(missing, order, EdgeKind::kReferences));
    ASSERT_FALSE(from_missing.has_value());
    EXPECT_EQ(from_missing.error().code, "DanglingEdgeEndpoint");
    EXPECT_EQ(m_graph.edge_count(), 0U);
}

TEST_F(ApplicationGraphTest, DuplicateEdgeIsRejected)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto line = NodeId::type("com.shop.order.OrderLine");

    ASSERT_TRUE(m_graph.add_edge(Edge::raw(order, line, EdgeKind::kReferences)).has_value());
    auto again = m_graph.add_edge(Edge::raw(order, line, EdgeKind::kReferences));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, "DuplicateEdge");
    EXPECT_EQ(m_graph.edge_count(), 1U);
    EXPECT_EQ(m_graph.edges_from(order).size(), 1U);

    // Same endpoints under another kind is a distinct edge
    EXPECT_TRUE(m_graph.add_edge(Edge::raw(order, line, EdgeKind::kExtends)).has_value());
}

TEST_F(ApplicationGraphTest, DerivedEdgeRequiresProof)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto line = NodeId::type("com.shop.order.OrderLine");

    Edge unproven = Edge::derived(order, line, EdgeKind::kUsesAsCollectionElement, make_proof(order));
    unproven.proof.reset();
    auto result = m_graph.add_edge(unproven);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "ProofRequired");

    auto proven = m_graph.add_edge(Edge::derived(
        order, line, EdgeKind::kUsesAsCollectionElement,
        make_proof(NodeId::field("com.shop.order.Order", "lines"))));
    ASSERT_TRUE(proven.has_value()) << proven.error().message;
    EXPECT_EQ(m_graph.derived_edges().size(), 1U);
    EXPECT_TRUE(m_graph.contains_edge(order, line, EdgeKind::kUsesAsCollectionElement));
}

TEST_F(ApplicationGraphTest, RawEdgeMustNotCarryProof)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto line = NodeId::type("com.shop.order.OrderLine");

    Edge edge = Edge::raw(order, line, EdgeKind::kReferences);
    edge.proof = make_proof(order);
    auto result = m_graph.add_edge(edge);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "ProofNotAllowed");
    EXPECT_TRUE(m_graph.edges().empty());
}

TEST_F(ApplicationGraphTest, EdgesAreIndexedByEndpoint)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto line = NodeId::type("com.shop.order.OrderLine");
    const auto lines = NodeId::field("com.shop.order.Order", "lines");

    ASSERT_TRUE(m_graph.add_edge(Edge::raw(order, lines, EdgeKind::kDeclares)).has_value());
    ASSERT_TRUE(m_graph.add_edge(Edge::raw(order, line, EdgeKind::kReferences)).has_value());

    EXPECT_EQ(m_graph.edges_from(order).size(), 2U);
    EXPECT_EQ(m_graph.edges_to(line).size(), 1U);
    EXPECT_EQ(m_graph.edges(EdgeKind::kReferences).size(), 1U);
    EXPECT_EQ(m_graph.raw_edges().size(), 2U);
    EXPECT_TRUE(m_graph.edges_from(line).empty());
}

TEST_F(ApplicationGraphTest, NodeLookupsByKind)
{
    const auto* order = m_graph.type_node("com.shop.order.Order");
    ASSERT_NE(order, nullptr);
    EXPECT_EQ(order->simple_name(), "Order");
    EXPECT_EQ(order->package_name(), "com.shop.order");

    EXPECT_NE(m_graph.field_node(NodeId::field("com.shop.order.Order", "lines")), nullptr);
    EXPECT_EQ(m_graph.type_node(NodeId::field("com.shop.order.Order", "lines")), nullptr);
    EXPECT_EQ(m_graph.type_node("com.shop.order.Missing"), nullptr);
}

TEST_F(ApplicationGraphTest, TypeNodesAreSortedByQualifiedName)
{
    ASSERT_TRUE(m_graph.add_node(make_type("com.shop.billing.Invoice")).has_value());
    const auto types = m_graph.type_nodes();
    ASSERT_EQ(types.size(), 4U);
    EXPECT_EQ(types[0]->qualified_name, "com.shop.billing.Invoice");
    EXPECT_EQ(types[1]->qualified_name, "com.shop.order.Order");
    EXPECT_EQ(types[2]->qualified_name, "com.shop.order.OrderLine");
    EXPECT_EQ(types[3]->qualified_name, "com.shop.order.OrderRepository");
}

TEST_F(ApplicationGraphTest, IndexesTrackPackagesFormsAndMembers)
{
    const auto& indexes = m_graph.indexes();
    EXPECT_EQ(indexes.types_in_package("com.shop.order").size(), 3U);
    EXPECT_TRUE(indexes.types_in_package("com.shop.unknown").empty());
    EXPECT_EQ(indexes.types_with_form(TypeForm::kInterface).size(), 1U);
    EXPECT_EQ(indexes.packages(), std::vector<std::string>{"com.shop.order"});

    const auto order = NodeId::type("com.shop.order.Order");
    const auto lines = NodeId::field("com.shop.order.Order", "lines");
    EXPECT_TRUE(indexes.members_of(order).empty());
    ASSERT_TRUE(m_graph.add_edge(Edge::raw(order, lines, EdgeKind::kDeclares)).has_value());
    EXPECT_EQ(indexes.members_of(order).size(), 1U);
    EXPECT_EQ(indexes.declaring_type_of(lines), order);
}

TEST_F(ApplicationGraphTest, HierarchyIndexesFollowEdges)
{
    const auto order = NodeId::type("com.shop.order.Order");
    const auto line = NodeId::type("com.shop.order.OrderLine");
    const auto repository = NodeId::type("com.shop.order.OrderRepository");

    ASSERT_TRUE(m_graph.add_edge(Edge::raw(line, order, EdgeKind::kExtends)).has_value());
    ASSERT_TRUE(m_graph.add_edge(Edge::raw(order, repository, EdgeKind::kImplements)).has_value());

    const auto& indexes = m_graph.indexes();
    EXPECT_EQ(indexes.supertype_of(line), order);
    EXPECT_TRUE(indexes.has_subtypes(order));
    EXPECT_TRUE(indexes.has_implementors(repository));
    EXPECT_TRUE(indexes.interfaces_of(order).contains(repository));

    const auto query = m_graph.query();
    const auto* order_node = m_graph.type_node(order);
    ASSERT_NE(order_node, nullptr);
    ASSERT_EQ(query.subtypes_of(*order_node).size(), 1U);
    EXPECT_EQ(query.subtypes_of(*order_node).front()->qualified_name, "com.shop.order.OrderLine");
}

}  // namespace hexarch::graph::test
