/**
 * @file lakos.cpp
 * @brief Lakos dependency metrics (CCD, ACD, NCCD, RACD)
 */

#include "hexarch/architecture_query.hpp"

#include "hexarch/graph_query.hpp"

#include <cmath>

namespace hexarch::query {

namespace {

[[nodiscard]] std::size_t closure_size(const graph::ApplicationGraph& graph, const graph::NodeId& start)
{
    std::set<graph::NodeId> visited{start};
    std::vector<graph::NodeId> pending{start};
    while (!pending.empty()) {
        const auto current = std::move(pending.back());
        pending.pop_back();
        for (const auto* edge : graph.edges_from(current)) {
            if (edge->kind != graph::EdgeKind::kReferences || !edge->to.is_type()) {
                continue;
            }
            if (visited.insert(edge->to).second) {
                pending.push_back(edge->to);
            }
        }
    }
    return visited.size();
}

}  // namespace

std::size_t ArchitectureQuery::depends_on(std::string_view qualified_name) const
{
    const auto* type = m_graph->type_node(qualified_name);
    if (type == nullptr) {
        return 0;
    }
    return closure_size(*m_graph, type->id) - 1;
}

LakosMetrics ArchitectureQuery::lakos_for(const std::vector<const graph::TypeNode*>& types) const
{
    LakosMetrics metrics;
    metrics.component_count = types.size();
    if (types.size() <= 1) {
        return metrics;
    }

    for (const auto* type : types) {
        metrics.ccd += closure_size(*m_graph, type->id) - 1;
    }
    const auto n = static_cast<double>(types.size());
    const auto log_n = std::log2(n);
    metrics.acd = static_cast<double>(metrics.ccd) / n;
    metrics.nccd = static_cast<double>(metrics.ccd) / (n * log_n);
    metrics.racd = metrics.acd / log_n;
    return metrics;
}

LakosMetrics ArchitectureQuery::lakos_metrics() const
{
    return lakos_for(m_graph->type_nodes());
}

LakosMetrics ArchitectureQuery::lakos_metrics(std::string_view package) const
{
    return lakos_for(m_graph->query().types_in_package(package));
}

LakosMetrics ArchitectureQuery::lakos_metrics(const std::set<std::string>& qualified_names) const
{
    std::vector<const graph::TypeNode*> types;
    for (const auto& name : qualified_names) {
        if (const auto* type = m_graph->type_node(name)) {
            types.push_back(type);
        }
    }
    return lakos_for(types);
}

}  // namespace hexarch::query
