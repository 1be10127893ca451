/**
 * @file test_node_id.cpp
 * @brief Tests for NodeId encoding, parsing and ordering
 */

#include "hexarch/graph.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace hexarch::graph::test {

TEST(NodeIdTest, TextualForms)
{
    EXPECT_EQ(NodeId::type("com.shop.Order").value(), "type:com.shop.Order");
    EXPECT_EQ(NodeId::field("com.shop.Order", "id").value(), "field:com.shop.Order#id");
    EXPECT_EQ(NodeId::method("com.shop.Order", "addLine", {"com.shop.Product", "int"}).value(),
              "method:com.shop.Order#addLine(com.shop.Product,int)");
    EXPECT_EQ(NodeId::constructor("com.shop.Order", {}).value(), "ctor:com.shop.Order#()");
}

TEST(NodeIdTest, KindAndOwner)
{
    const auto type = NodeId::type("com.shop.Order");
    const auto field = NodeId::field("com.shop.Order", "lines");
    const auto method = NodeId::method("com.shop.Order", "total", {});

    EXPECT_TRUE(type.is_type());
    EXPECT_FALSE(type.is_member());
    EXPECT_EQ(field.kind(), NodeKind::kField);
    EXPECT_EQ(method.kind(), NodeKind::kMethod);

    EXPECT_EQ(type.owner(), "com.shop.Order");
    EXPECT_EQ(field.owner(), "com.shop.Order");
    EXPECT_EQ(method.owner(), "com.shop.Order");
}

TEST(NodeIdTest, ParseRoundTripsEveryKind)
{
    const std::vector<NodeId> ids = {
        NodeId::type("com.shop.Order"),
        NodeId::field("com.shop.Order", "id"),
        NodeId::method("com.shop.Order", "cancel", {"java.lang.String"}),
        NodeId::constructor("com.shop.Order", {"com.shop.OrderId"}),
    };
    for (const auto& id : ids) {
        auto parsed = NodeId::parse(id.value());
        ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
        EXPECT_EQ(*parsed, id);
        EXPECT_EQ(parsed->kind(), id.kind());
    }
}

TEST(NodeIdTest, ParseRejectsMalformedIds)
{
    for (const auto* text : {"", "type:", "order:com.shop.Order", "field:com.shop.Order",
                             "field:com.shop.Order#id()", "method:com.shop.Order#cancel",
                             "ctor:com.shop.Order#init()", "type:com.shop.Order#id"}) {
        auto parsed = NodeId::parse(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, "InvalidNodeId");
    }
}

TEST(NodeIdTest, TypeIdsOrderByQualifiedName)
{
    std::vector<NodeId> ids = {NodeId::type("com.shop.b.Invoice"),
                               NodeId::type("com.shop.a.Order"),
                               NodeId::type("com.shop.a.OrderLine")};
    std::ranges::sort(ids);
    EXPECT_EQ(ids[0].owner(), "com.shop.a.Order");
    EXPECT_EQ(ids[1].owner(), "com.shop.a.OrderLine");
    EXPECT_EQ(ids[2].owner(), "com.shop.b.Invoice");
    EXPECT_LT(NodeId::field("com.shop.Order", "a"), NodeId::field("com.shop.Order", "b"));
}

TEST(TypeRefTest, DisplayAndPrimitives)
{
    const TypeRef list{.name = "java.util.List",
                       .arguments = {TypeRef{.name = "com.shop.Order", .arguments = {}, .array = false}},
                       .array = false};
    EXPECT_EQ(list.display(), "java.util.List<com.shop.Order>");
    EXPECT_EQ(list.simple_name(), "List");

    const TypeRef ints{.name = "int", .arguments = {}, .array = true};
    EXPECT_EQ(ints.display(), "int[]");
    EXPECT_FALSE(ints.is_primitive());
    EXPECT_TRUE((TypeRef{.name = "long", .arguments = {}, .array = false}.is_primitive()));
    EXPECT_TRUE((TypeRef{.name = "void", .arguments = {}, .array = false}.is_void()));
}

TEST(ModifiersTest, AddAndQuery)
{
    Modifiers modifiers;
    modifiers.add(Modifier::kPrivate);
    modifiers.add(Modifier::kFinal);
    EXPECT_TRUE(modifiers.has(Modifier::kPrivate));
    EXPECT_TRUE(modifiers.has(Modifier::kFinal));
    EXPECT_FALSE(modifiers.has(Modifier::kStatic));
    EXPECT_EQ(parse_modifier("abstract"), Modifier::kAbstract);
    EXPECT_FALSE(parse_modifier("volatile").has_value());
}

}  // namespace hexarch::graph::test
