/**
 * @file classifier.cpp
 * @brief Whole-graph classification pipeline
 */

#include "hexarch/classification/classifier.hpp"

#include "hexarch/graph_query.hpp"

#include <format>
#include <set>

namespace hexarch::classification {

void ClassificationSet::set_domain(const graph::NodeId& type, DomainClassification result)
{
    m_domain.insert_or_assign(type, std::move(result));
}

void ClassificationSet::set_port(const graph::NodeId& type, PortClassification result)
{
    m_port.insert_or_assign(type, std::move(result));
}

const DomainClassification* ClassificationSet::domain(const graph::NodeId& type) const
{
    auto it = m_domain.find(type);
    return it == m_domain.end() ? nullptr : &it->second;
}

const PortClassification* ClassificationSet::port(const graph::NodeId& type) const
{
    auto it = m_port.find(type);
    return it == m_port.end() ? nullptr : &it->second;
}

std::optional<DomainRole> ClassificationSet::domain_role(const graph::NodeId& type) const
{
    const auto* result = domain(type);
    if (result == nullptr || !result->is_classified()) {
        return std::nullopt;
    }
    return result->role;
}

std::optional<PortKind> ClassificationSet::port_kind(const graph::NodeId& type) const
{
    const auto* result = port(type);
    if (result == nullptr || !result->is_classified()) {
        return std::nullopt;
    }
    return result->role;
}

std::optional<PortDirection> ClassificationSet::port_direction(const graph::NodeId& type) const
{
    const auto* result = port(type);
    if (result == nullptr || !result->is_classified()) {
        return std::nullopt;
    }
    auto direction = result->metadata_value(kDirectionKey);
    if (!direction) {
        return std::nullopt;
    }
    return parse_port_direction(*direction);
}

ClassificationSummary ClassificationSet::summary() const
{
    std::set<graph::NodeId> types;
    for (const auto& [id, _] : m_domain) {
        types.insert(id);
    }
    for (const auto& [id, _] : m_port) {
        types.insert(id);
    }

    ClassificationSummary summary;
    summary.total = types.size();
    for (const auto& id : types) {
        if (auto kind = port_kind(id)) {
            ++summary.classified;
            ++summary.by_role[std::string(to_string(*kind))];
            continue;
        }
        if (auto role = domain_role(id)) {
            ++summary.classified;
            ++summary.by_role[std::string(to_string(*role))];
            continue;
        }
        const auto* d = domain(id);
        const auto* p = port(id);
        if ((d != nullptr && d->status == ClassificationStatus::kConflict)
            || (p != nullptr && p->status == ClassificationStatus::kConflict)) {
            ++summary.conflicts;
        } else {
            ++summary.unclassified;
        }
    }
    return summary;
}

ClassificationSet classify_all(const graph::ApplicationGraph& graph, const ClassifierOptions& options)
{
    const auto query = graph.query();
    const auto port_engine = make_port_engine(options.decision_policy, options.profile);
    const auto domain_engine = make_domain_engine(options.decision_policy, options.profile);

    ClassificationSet results;
    for (const auto* type : graph.type_nodes()) {
        if (type->form == graph::TypeForm::kAnnotation) {
            continue;
        }
        if (is_port_candidate(*type, query)) {
            results.set_port(type->id, port_engine.classify(*type, query));
        }
        auto domain_result = domain_engine.classify(*type, query);

        const auto* port_result = results.port(type->id);
        if (port_result != nullptr && port_result->is_classified() && domain_result.is_classified()) {
            auto merged = *port_result;
            const auto role = to_string(*domain_result.role);
            merged.conflicts.push_back(Conflict{
                .competing_role = std::string(role),
                .competing_criterion = domain_result.criterion,
                .competing_confidence = domain_result.confidence,
                .competing_priority = domain_result.priority,
                .justification = std::format("Also matched as {} by {}", role, domain_result.criterion),
                .severity = ConflictSeverity::kError});
            results.set_port(type->id, std::move(merged));
            continue;
        }
        results.set_domain(type->id, std::move(domain_result));
    }
    return results;
}

}  // namespace hexarch::classification
