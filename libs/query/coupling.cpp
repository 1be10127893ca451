/**
 * @file coupling.cpp
 * @brief Package coupling metrics and main-sequence zones
 */

#include "hexarch/architecture_query.hpp"

#include "hexarch/graph_query.hpp"

#include <algorithm>
#include <cmath>

namespace hexarch::query {

std::string_view to_string(Zone zone)
{
    switch (zone) {
        case Zone::kZoneOfPain:
            return "ZONE_OF_PAIN";
        case Zone::kZoneOfUselessness:
            return "ZONE_OF_USELESSNESS";
        case Zone::kMainSequence:
            return "MAIN_SEQUENCE";
        case Zone::kNearMainSequence:
            return "NEAR_MAIN_SEQUENCE";
        case Zone::kOffMainSequence:
            return "OFF_MAIN_SEQUENCE";
    }
    return "OFF_MAIN_SEQUENCE";
}

Zone classify_zone(double a, double i)
{
    if (i < 0.3 && a < 0.3) {
        return Zone::kZoneOfPain;
    }
    if (i > 0.7 && a > 0.7) {
        return Zone::kZoneOfUselessness;
    }
    const auto d = std::abs(a + i - 1.0);
    if (d < 0.1) {
        return Zone::kMainSequence;
    }
    if (d < 0.3) {
        return Zone::kNearMainSequence;
    }
    return Zone::kOffMainSequence;
}

double CouplingMetrics::distance() const
{
    return std::abs(abstractness + instability() - 1.0);
}

CouplingMetrics ArchitectureQuery::coupling_metrics(std::string_view package) const
{
    CouplingMetrics metrics{.package = std::string(package)};
    const auto& members = m_graph->indexes().types_in_package(package);
    if (members.empty()) {
        return metrics;
    }

    std::set<graph::NodeId> incoming;
    std::set<graph::NodeId> outgoing;
    for (const auto* edge : m_graph->edges(graph::EdgeKind::kReferences)) {
        if (!edge->from.is_type() || !edge->to.is_type()) {
            continue;
        }
        const bool from_inside = members.contains(edge->from);
        const bool to_inside = members.contains(edge->to);
        if (!from_inside && to_inside) {
            incoming.insert(edge->from);
        } else if (from_inside && !to_inside) {
            outgoing.insert(edge->to);
        }
    }
    metrics.afferent = incoming.size();
    metrics.efferent = outgoing.size();

    const auto types = m_graph->query().types_in_package(package);
    const auto abstract_count =
        std::ranges::count_if(types, [](const graph::TypeNode* type) { return type->is_abstract(); });
    metrics.abstractness = static_cast<double>(abstract_count) / static_cast<double>(types.size());
    return metrics;
}

std::vector<CouplingMetrics> ArchitectureQuery::all_coupling_metrics() const
{
    std::vector<CouplingMetrics> result;
    for (const auto& package : m_graph->indexes().packages()) {
        result.push_back(coupling_metrics(package));
    }
    return result;
}

}  // namespace hexarch::query
