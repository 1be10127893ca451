/**
 * @file aggregates.cpp
 * @brief Aggregate discovery, membership, cohesion and repository lookup
 */

#include "hexarch/architecture_query.hpp"

#include "hexarch/graph_query.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace hexarch::query {

namespace {

using classification::DomainRole;
using graph::EdgeKind;

constexpr std::string_view kRepositorySuffix = "Repository";

[[nodiscard]] bool is_member_structural(EdgeKind kind)
{
    return kind == EdgeKind::kFieldType || kind == EdgeKind::kTypeArgument
           || kind == EdgeKind::kReturnType || kind == EdgeKind::kParameterType;
}

[[nodiscard]] bool is_element_edge(EdgeKind kind)
{
    return kind == EdgeKind::kUsesAsCollectionElement || kind == EdgeKind::kUsesAsOptionalElement;
}

/// Types one structural edge away from @p type, through its members or element edges
[[nodiscard]] std::set<graph::NodeId> structural_targets(const graph::ApplicationGraph& graph,
                                                         const graph::TypeNode& type,
                                                         bool fields_only)
{
    std::set<graph::NodeId> targets;
    for (const auto* edge : graph.edges_from(type.id)) {
        if (is_element_edge(edge->kind)) {
            targets.insert(edge->to);
        }
    }
    for (const auto& member : graph.indexes().members_of(type.id)) {
        if (fields_only && member.kind() != graph::NodeKind::kField) {
            continue;
        }
        for (const auto* edge : graph.edges_from(member)) {
            const bool wanted = fields_only ? (edge->kind == EdgeKind::kFieldType
                                               || edge->kind == EdgeKind::kTypeArgument)
                                            : is_member_structural(edge->kind);
            if (wanted && edge->to.is_type()) {
                targets.insert(edge->to);
            }
        }
    }
    targets.erase(type.id);
    return targets;
}

[[nodiscard]] std::vector<std::string> sorted_names(std::set<std::string> names)
{
    return {std::make_move_iterator(names.begin()), std::make_move_iterator(names.end())};
}

}  // namespace

bool AggregateInfo::contains(std::string_view qualified_name) const
{
    return root == qualified_name || std::ranges::find(entities, qualified_name) != entities.end()
           || std::ranges::find(value_objects, qualified_name) != value_objects.end();
}

std::vector<const graph::TypeNode*> ArchitectureQuery::repository_ports() const
{
    std::vector<const graph::TypeNode*> ports;
    const auto query = m_graph->query();
    for (const auto* type : query.interfaces()) {
        if (m_classifications != nullptr) {
            if (m_classifications->port_kind(type->id) == classification::PortKind::kRepository) {
                ports.push_back(type);
            }
        } else if (type->simple_name().ends_with(kRepositorySuffix)) {
            ports.push_back(type);
        }
    }
    return ports;
}

std::vector<const graph::TypeNode*> ArchitectureQuery::aggregate_roots() const
{
    const auto query = m_graph->query();
    std::set<graph::NodeId> roots;
    for (const auto* port : repository_ports()) {
        if (m_classifications != nullptr) {
            const auto* result = m_classifications->port(port->id);
            auto managed = result->metadata_value(classification::kManagedTypeKey);
            const auto* type = managed ? m_graph->type_node(*managed) : nullptr;
            if (type != nullptr && query.has_identity(*type)) {
                roots.insert(type->id);
            }
            continue;
        }
        for (const auto* type : query.signature_types_of(*port)) {
            if (!type->is_interface() && query.has_identity(*type)) {
                roots.insert(type->id);
            }
        }
    }
    if (m_classifications != nullptr) {
        for (const auto& [id, _] : m_classifications->domain_results()) {
            if (m_classifications->domain_role(id) == DomainRole::kAggregateRoot) {
                roots.insert(id);
            }
        }
    }

    std::vector<const graph::TypeNode*> result;
    for (const auto& id : roots) {
        if (const auto* type = m_graph->type_node(id)) {
            result.push_back(type);
        }
    }
    return result;
}

AggregateInfo ArchitectureQuery::aggregate_of(const graph::TypeNode& root,
                                              const std::set<graph::NodeId>& roots) const
{
    const auto query = m_graph->query();

    std::set<std::string> entities;
    std::set<std::string> value_objects;
    for (const auto& target : structural_targets(*m_graph, root, true)) {
        const auto* type = m_graph->type_node(target);
        if (type == nullptr || type->is_interface() || roots.contains(target)) {
            continue;
        }
        std::optional<DomainRole> role;
        if (m_classifications != nullptr) {
            role = m_classifications->domain_role(target);
        }
        if (role == DomainRole::kEntity || query.has_identity(*type)) {
            entities.insert(type->qualified_name);
        } else if (role == DomainRole::kValueObject || role == DomainRole::kIdentifier
                   || query.is_immutable(*type)) {
            value_objects.insert(type->qualified_name);
        }
    }
    return AggregateInfo{.root = root.qualified_name,
                         .entities = sorted_names(std::move(entities)),
                         .value_objects = sorted_names(std::move(value_objects))};
}

std::vector<AggregateInfo> ArchitectureQuery::find_aggregates() const
{
    const auto roots = aggregate_roots();
    std::set<graph::NodeId> root_ids;
    for (const auto* root : roots) {
        root_ids.insert(root->id);
    }
    std::vector<AggregateInfo> aggregates;
    for (const auto* root : roots) {
        aggregates.push_back(aggregate_of(*root, root_ids));
    }
    return aggregates;
}

std::optional<double> ArchitectureQuery::aggregate_cohesion(std::string_view root) const
{
    const auto aggregates = find_aggregates();
    auto it = std::ranges::find(aggregates, root, &AggregateInfo::root);
    if (it == aggregates.end()) {
        return std::nullopt;
    }

    std::set<graph::NodeId> members{graph::NodeId::type(it->root)};
    for (const auto& name : it->entities) {
        members.insert(graph::NodeId::type(name));
    }
    for (const auto& name : it->value_objects) {
        members.insert(graph::NodeId::type(name));
    }
    if (members.size() <= 1) {
        return 1.0;
    }

    // Each ordered pair of distinct members counts once
    std::size_t internal_edges = 0;
    for (const auto& member : members) {
        const auto* type = m_graph->type_node(member);
        if (type == nullptr) {
            continue;
        }
        for (const auto& target : structural_targets(*m_graph, *type, false)) {
            if (members.contains(target)) {
                ++internal_edges;
            }
        }
    }
    const auto expected = static_cast<double>(members.size() - 1);
    const auto cohesion = std::min(1.0, static_cast<double>(internal_edges) / expected);
    return std::round(cohesion * 100.0) / 100.0;
}

std::optional<AggregateInfo> ArchitectureQuery::find_containing_aggregate(
    std::string_view qualified_name) const
{
    for (auto& aggregate : find_aggregates()) {
        if (aggregate.contains(qualified_name)) {
            return std::move(aggregate);
        }
    }
    return std::nullopt;
}

std::map<std::string, std::vector<std::string>> ArchitectureQuery::aggregate_membership() const
{
    std::map<std::string, std::vector<std::string>> membership;
    for (const auto& aggregate : find_aggregates()) {
        std::vector<std::string> members = aggregate.entities;
        members.insert(members.end(), aggregate.value_objects.begin(), aggregate.value_objects.end());
        if (!members.empty()) {
            membership.emplace(aggregate.root, std::move(members));
        }
    }
    return membership;
}

std::optional<std::string> ArchitectureQuery::find_repository_for_aggregate(std::string_view root) const
{
    const auto ports = repository_ports();
    if (m_classifications != nullptr) {
        for (const auto* port : ports) {
            const auto managed =
                m_classifications->port(port->id)->metadata_value(classification::kManagedTypeKey);
            if (managed && *managed == root) {
                return port->qualified_name;
            }
        }
    }
    const auto simple = common::simple_name(root);
    for (const auto* port : ports) {
        if (port->simple_name().starts_with(simple)) {
            return port->qualified_name;
        }
    }
    return std::nullopt;
}

std::optional<classification::PortDirection> ArchitectureQuery::find_port_direction(
    std::string_view qualified_name) const
{
    if (m_classifications == nullptr) {
        return std::nullopt;
    }
    return m_classifications->port_direction(graph::NodeId::type(qualified_name));
}

}  // namespace hexarch::query
