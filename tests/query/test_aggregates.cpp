/**
 * @file test_aggregates.cpp
 * @brief Tests for aggregate discovery, cohesion and repository lookup
 */

#include "hexarch/architecture_query.hpp"

#include "support/facts_fixture.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hexarch::query::test {

namespace {

using hexarch::test::field;
using hexarch::test::method;
using hexarch::test::ref;
using hexarch::test::type_fact;

nlohmann::json component(const std::string& name, const std::string& type)
{
    return nlohmann::json{
        {"name", name     },
        {"type", ref(type)}
    };
}

nlohmann::json repository(const std::string& qualified_name, const std::string& managed)
{
    auto type = type_fact(qualified_name, "interface");
    type["methods"] = nlohmann::json::array(
        {method("save", ref("void"), nlohmann::json::array({ref(managed)}))});
    return type;
}

nlohmann::json shop_types()
{
    auto order = type_fact("com.shop.order.Order");
    order["fields"] = nlohmann::json::array(
        {field("id", ref("com.shop.order.OrderId")),
         field("lines", ref("java.util.List", nlohmann::json::array({ref("com.shop.order.OrderLine")}))),
         field("total", ref("com.shop.order.Money"))});

    auto line = type_fact("com.shop.order.OrderLine");
    line["fields"] = nlohmann::json::array({field("id", ref("java.lang.String"))});

    auto money = type_fact("com.shop.order.Money");
    money["fields"] = nlohmann::json::array({field("amount", ref("java.math.BigDecimal"))});

    auto order_id = type_fact("com.shop.order.OrderId", "record");
    order_id["record_components"] = nlohmann::json::array({component("value", "java.util.UUID")});

    auto customer = type_fact("com.shop.customer.Customer");
    customer["fields"] = nlohmann::json::array(
        {field("id", ref("java.lang.String")), field("address", ref("com.shop.customer.Address"))});

    auto address = type_fact("com.shop.customer.Address", "record");
    address["record_components"] = nlohmann::json::array(
        {component("street", "java.lang.String"), component("city", "java.lang.String")});

    auto invoice = type_fact("com.shop.billing.Invoice");
    invoice["annotations"] = nlohmann::json::array({"AggregateRoot"});
    invoice["fields"] = nlohmann::json::array({field("id", ref("java.lang.String"))});

    return nlohmann::json::array({order,
                                  line,
                                  money,
                                  order_id,
                                  repository("com.shop.order.OrderRepository", "com.shop.order.Order"),
                                  customer,
                                  address,
                                  repository("com.shop.customer.CustomerRepository", "com.shop.customer.Customer"),
                                  invoice});
}

class AggregatesTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto graph = hexarch::test::build_from_types(shop_types());
        ASSERT_TRUE(graph.has_value()) << graph.error().message;
        m_graph = std::move(*graph);
        m_classifications = classification::classify_all(m_graph);
    }

    graph::ApplicationGraph m_graph;
    classification::ClassificationSet m_classifications;
};

}  // namespace

TEST_F(AggregatesTest, RootsFromRepositoryNamingWithoutClassifications)
{
    const ArchitectureQuery query(m_graph);
    const auto aggregates = query.find_aggregates();
    ASSERT_EQ(aggregates.size(), 2U);
    EXPECT_EQ(aggregates[0].root, "com.shop.customer.Customer");
    EXPECT_EQ(aggregates[1].root, "com.shop.order.Order");

    EXPECT_EQ(aggregates[1].entities, std::vector<std::string>{"com.shop.order.OrderLine"});
    const std::vector<std::string> value_objects = {"com.shop.order.Money", "com.shop.order.OrderId"};
    EXPECT_EQ(aggregates[1].value_objects, value_objects);
    EXPECT_EQ(aggregates[0].value_objects, std::vector<std::string>{"com.shop.customer.Address"});
}

TEST_F(AggregatesTest, ClassifiedRootsIncludeExplicitAggregates)
{
    const ArchitectureQuery query(m_graph, &m_classifications);
    const auto aggregates = query.find_aggregates();
    ASSERT_EQ(aggregates.size(), 3U);
    EXPECT_EQ(aggregates[0].root, "com.shop.billing.Invoice");
    EXPECT_TRUE(aggregates[0].entities.empty());
    EXPECT_TRUE(aggregates[0].value_objects.empty());
}

TEST_F(AggregatesTest, Cohesion)
{
    const ArchitectureQuery query(m_graph, &m_classifications);
    EXPECT_EQ(query.aggregate_cohesion("com.shop.order.Order"), 1.0);
    // A root without members is trivially cohesive
    EXPECT_EQ(query.aggregate_cohesion("com.shop.billing.Invoice"), 1.0);
    EXPECT_FALSE(query.aggregate_cohesion("com.shop.order.Money").has_value());
}

TEST_F(AggregatesTest, ContainingAggregateAndMembership)
{
    const ArchitectureQuery query(m_graph);
    const auto containing = query.find_containing_aggregate("com.shop.order.Money");
    ASSERT_TRUE(containing.has_value());
    EXPECT_EQ(containing->root, "com.shop.order.Order");
    EXPECT_TRUE(containing->contains("com.shop.order.Order"));
    EXPECT_FALSE(query.find_containing_aggregate("com.shop.billing.Invoice").has_value());

    const auto membership = query.aggregate_membership();
    ASSERT_EQ(membership.size(), 2U);
    const std::vector<std::string> order_members = {
        "com.shop.order.OrderLine", "com.shop.order.Money", "com.shop.order.OrderId"};
    EXPECT_EQ(membership.at("com.shop.order.Order"), order_members);
}

TEST_F(AggregatesTest, RepositoryLookup)
{
    const ArchitectureQuery by_name(m_graph);
    EXPECT_EQ(by_name.find_repository_for_aggregate("com.shop.order.Order"), "com.shop.order.OrderRepository");
    EXPECT_FALSE(by_name.find_repository_for_aggregate("com.shop.billing.Invoice").has_value());

    const ArchitectureQuery by_managed_type(m_graph, &m_classifications);
    EXPECT_EQ(by_managed_type.find_repository_for_aggregate("com.shop.customer.Customer"),
              "com.shop.customer.CustomerRepository");
}

TEST(RepositoryLookupTest, NameFallbackMatchesPrefixOnly)
{
    auto graph = hexarch::test::build_from_types(nlohmann::json::array(
        {repository("com.shop.archive.PurchaseOrderLineRepository", "com.shop.order.Order"),
         repository("com.shop.order.OrderRepository", "com.shop.order.Order"),
         type_fact("com.shop.order.Order")}));
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const ArchitectureQuery query(*graph);
    EXPECT_EQ(query.find_repository_for_aggregate("com.shop.order.Order"), "com.shop.order.OrderRepository");
    EXPECT_FALSE(query.find_repository_for_aggregate("com.shop.order.Line").has_value());
}

TEST_F(AggregatesTest, PortDirectionNeedsClassifications)
{
    const ArchitectureQuery without(m_graph);
    EXPECT_FALSE(without.find_port_direction("com.shop.order.OrderRepository").has_value());

    const ArchitectureQuery with(m_graph, &m_classifications);
    EXPECT_EQ(with.find_port_direction("com.shop.order.OrderRepository"),
              classification::PortDirection::kDriven);
    EXPECT_FALSE(with.find_port_direction("com.shop.order.Order").has_value());
}

}  // namespace hexarch::query::test
