/**
 * @file test_classifier.cpp
 * @brief Tests for whole-graph classification
 */

#include "hexarch/classification/classifier.hpp"

#include "support/facts_fixture.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hexarch::classification::test {

namespace {

using graph::NodeId;
using hexarch::test::field;
using hexarch::test::method;
using hexarch::test::ref;
using hexarch::test::type_fact;

nlohmann::json order_module()
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

    auto id = type_fact("com.shop.order.OrderId", "record");
    const nlohmann::json component = {
        {"name", "value"         },
        {"type", ref("java.util.UUID")}
    };
    id["record_components"] = nlohmann::json::array({component});

    auto repository = type_fact("com.shop.order.OrderRepository", "interface");
    repository["methods"] = nlohmann::json::array(
        {method("save", ref("void"), nlohmann::json::array({ref("com.shop.order.Order")})),
         method("findById",
                ref("java.util.Optional", nlohmann::json::array({ref("com.shop.order.Order")})),
                nlohmann::json::array({ref("com.shop.order.OrderId")}))});

    auto service = type_fact("com.shop.order.OrderService");
    service["fields"] = nlohmann::json::array({field("orders", ref("com.shop.order.OrderRepository"))});

    return nlohmann::json::array(
        {order, line, money, id, repository, service, type_fact("com.shop.order.Audited", "annotation")});
}

graph::ApplicationGraph build(const nlohmann::json& types)
{
    auto graph = hexarch::test::build_from_types(types);
    EXPECT_TRUE(graph.has_value()) << graph.error().message;
    return graph ? std::move(*graph) : graph::ApplicationGraph{};
}

/// Event-named record that is also referenced, so two medium criteria compete
nlohmann::json event_module()
{
    auto event = type_fact("com.shop.order.OrderPlacedEvent", "record");
    const nlohmann::json order_id = {
        {"name", "orderId"},
        {"type", ref("java.lang.String")}
    };
    const nlohmann::json at = {
        {"name", "at"},
        {"type", ref("java.time.Instant")}
    };
    event["record_components"] = nlohmann::json::array({order_id, at});
    return nlohmann::json::array(
        {event, hexarch::test::referencing("com.shop.order.OrderPublisher", {"com.shop.order.OrderPlacedEvent"})});
}

ClassifierOptions tied_options(DecisionPolicyKind policy)
{
    ClassifierOptions options;
    options.decision_policy = policy;
    options.profile.set_priority("domain.domain-event-naming", 65);
    return options;
}

}  // namespace

TEST(ClassifierTest, ClassifiesEveryRole)
{
    const auto graph = build(order_module());
    const auto results = classify_all(graph);

    EXPECT_EQ(results.domain_role(NodeId::type("com.shop.order.Order")), DomainRole::kAggregateRoot);
    EXPECT_EQ(results.domain_role(NodeId::type("com.shop.order.OrderLine")), DomainRole::kEntity);
    EXPECT_EQ(results.domain_role(NodeId::type("com.shop.order.Money")), DomainRole::kValueObject);
    EXPECT_EQ(results.domain_role(NodeId::type("com.shop.order.OrderId")), DomainRole::kIdentifier);
    EXPECT_EQ(results.domain_role(NodeId::type("com.shop.order.OrderService")),
              DomainRole::kApplicationService);

    const auto repository = NodeId::type("com.shop.order.OrderRepository");
    EXPECT_EQ(results.port_kind(repository), PortKind::kRepository);
    EXPECT_EQ(results.port_direction(repository), PortDirection::kDriven);
    EXPECT_FALSE(results.domain_role(repository).has_value());
    EXPECT_FALSE(results.port_kind(NodeId::type("com.shop.order.Order")).has_value());
}

TEST(ClassifierTest, AnnotationTypesAreNotClassified)
{
    const auto graph = build(order_module());
    const auto results = classify_all(graph);
    const auto audited = NodeId::type("com.shop.order.Audited");
    EXPECT_EQ(results.domain(audited), nullptr);
    EXPECT_EQ(results.port(audited), nullptr);
}

TEST(ClassifierTest, IdentifierKeepsCompetingRolesAsErrors)
{
    const auto graph = build(order_module());
    const auto results = classify_all(graph);
    const auto* id = results.domain(NodeId::type("com.shop.order.OrderId"));
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->criterion, "record-single-id");
    EXPECT_TRUE(id->has_error_conflict());
}

TEST(ClassifierTest, SummaryCountsRoles)
{
    const auto graph = build(order_module());
    const auto summary = classify_all(graph).summary();

    EXPECT_EQ(summary.total, 6U);
    EXPECT_EQ(summary.classified, 6U);
    EXPECT_EQ(summary.unclassified, 0U);
    EXPECT_EQ(summary.conflicts, 0U);
    EXPECT_EQ(summary.by_role.at("AGGREGATE_ROOT"), 1U);
    EXPECT_EQ(summary.by_role.at("REPOSITORY"), 1U);
    EXPECT_EQ(summary.by_role.at("IDENTIFIER"), 1U);
    EXPECT_EQ(summary.by_role.size(), 6U);
}

TEST(ClassifierTest, PortWinsOverDomainRoleOnInterfaces)
{
    auto repository = type_fact("com.shop.audit.AuditRepository", "interface");
    repository["annotations"] = nlohmann::json::array({"Entity"});
    repository["methods"] = nlohmann::json::array({method("append", ref("void"))});
    const auto graph = build(nlohmann::json::array({repository}));

    const auto results = classify_all(graph);
    const auto id = NodeId::type("com.shop.audit.AuditRepository");
    ASSERT_NE(results.port(id), nullptr);
    EXPECT_EQ(results.port_kind(id), PortKind::kRepository);
    EXPECT_EQ(results.domain(id), nullptr);

    const auto& conflicts = results.port(id)->conflicts;
    ASSERT_EQ(conflicts.size(), 1U);
    EXPECT_EQ(conflicts[0].competing_role, "ENTITY");
    EXPECT_EQ(conflicts[0].competing_criterion, "explicit-entity");
    EXPECT_EQ(conflicts[0].severity, ConflictSeverity::kError);
    EXPECT_EQ(results.summary().classified, 1U);
}

TEST(ClassifierTest, DefaultPolicyResolvesTieByName)
{
    const auto graph = build(event_module());
    const auto results = classify_all(graph, tied_options(DecisionPolicyKind::kDefault));

    const auto* event = results.domain(NodeId::type("com.shop.order.OrderPlacedEvent"));
    ASSERT_NE(event, nullptr);
    ASSERT_TRUE(event->is_classified());
    EXPECT_EQ(event->role, DomainRole::kDomainEvent);
    EXPECT_TRUE(event->has_error_conflict());
}

TEST(ClassifierTest, StrictPolicyReportsTie)
{
    const auto graph = build(event_module());
    const auto results = classify_all(graph, tied_options(DecisionPolicyKind::kStrict));

    const auto* event = results.domain(NodeId::type("com.shop.order.OrderPlacedEvent"));
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->status, ClassificationStatus::kConflict);
    EXPECT_EQ(event->justification,
              "DOMAIN_EVENT (domain-event-naming) and VALUE_OBJECT (domain-record-value-object) tie at "
              "priority 65");

    const auto summary = results.summary();
    EXPECT_EQ(summary.conflicts, 1U);
    EXPECT_EQ(summary.classified, 0U);
    EXPECT_EQ(summary.unclassified, 1U);
}

}  // namespace hexarch::classification::test
