/**
 * @file violations.cpp
 * @brief Layer and stability violations over REFERENCES edges
 */

#include "hexarch/architecture_query.hpp"

#include <algorithm>
#include <array>

namespace hexarch::query {

namespace {

struct LayerKeywords
{
    Layer layer;
    std::array<std::string_view, 3> keywords;
};

// Checked in order; the first matching keyword decides
constexpr std::array kLayerKeywords{
    LayerKeywords{Layer::kDomain, {"domain", "", ""}},
    LayerKeywords{Layer::kApplication, {"application", "usecase", ""}},
    LayerKeywords{Layer::kInfrastructure, {"infrastructure", "adapter", ""}},
    LayerKeywords{Layer::kPresentation, {"presentation", "controller", "api"}},
};

}  // namespace

std::string_view to_string(Layer layer)
{
    switch (layer) {
        case Layer::kUnknown:
            return "unknown";
        case Layer::kDomain:
            return "domain";
        case Layer::kApplication:
            return "application";
        case Layer::kInfrastructure:
            return "infrastructure";
        case Layer::kPresentation:
            return "presentation";
    }
    return "unknown";
}

Layer layer_of(std::string_view package)
{
    const auto lowered = common::to_lower(package);
    for (const auto& entry : kLayerKeywords) {
        const bool matches = std::ranges::any_of(entry.keywords, [&](std::string_view keyword) {
            return !keyword.empty() && lowered.contains(keyword);
        });
        if (matches) {
            return entry.layer;
        }
    }
    return Layer::kUnknown;
}

bool is_layer_violation(Layer from, Layer to)
{
    if (from == Layer::kDomain) {
        return to == Layer::kApplication || to == Layer::kInfrastructure
               || to == Layer::kPresentation;
    }
    return from == Layer::kApplication && to == Layer::kPresentation;
}

std::vector<LayerViolation> ArchitectureQuery::find_layer_violations() const
{
    std::vector<LayerViolation> violations;
    for (const auto* edge : m_graph->edges(graph::EdgeKind::kReferences)) {
        const auto* from = m_graph->type_node(edge->from);
        const auto* to = m_graph->type_node(edge->to);
        if (from == nullptr || to == nullptr) {
            continue;
        }
        const auto from_layer = layer_of(from->package_name());
        const auto to_layer = layer_of(to->package_name());
        if (is_layer_violation(from_layer, to_layer)) {
            violations.push_back(LayerViolation{.from_type = from->qualified_name,
                                                .to_type = to->qualified_name,
                                                .from_layer = from_layer,
                                                .to_layer = to_layer});
        }
    }
    return violations;
}

double ArchitectureQuery::type_instability(const graph::NodeId& type) const
{
    std::set<graph::NodeId> outgoing;
    std::set<graph::NodeId> incoming;
    for (const auto* edge : m_graph->edges_from(type)) {
        if (edge->kind == graph::EdgeKind::kReferences && edge->to.is_type()) {
            outgoing.insert(edge->to);
        }
    }
    for (const auto* edge : m_graph->edges_to(type)) {
        if (edge->kind == graph::EdgeKind::kReferences && edge->from.is_type()) {
            incoming.insert(edge->from);
        }
    }
    const auto total = outgoing.size() + incoming.size();
    return total == 0 ? 0.0 : static_cast<double>(outgoing.size()) / static_cast<double>(total);
}

std::vector<StabilityViolation> ArchitectureQuery::find_stability_violations() const
{
    std::map<graph::NodeId, double> cache;
    const auto instability = [&](const graph::NodeId& id) {
        auto it = cache.find(id);
        if (it == cache.end()) {
            it = cache.emplace(id, type_instability(id)).first;
        }
        return it->second;
    };

    std::vector<StabilityViolation> violations;
    for (const auto* edge : m_graph->edges(graph::EdgeKind::kReferences)) {
        const auto* from = m_graph->type_node(edge->from);
        const auto* to = m_graph->type_node(edge->to);
        if (from == nullptr || to == nullptr) {
            continue;
        }
        const auto from_instability = instability(from->id);
        const auto to_instability = instability(to->id);
        if (from_instability > to_instability) {
            violations.push_back(StabilityViolation{.from_type = from->qualified_name,
                                                    .to_type = to->qualified_name,
                                                    .from_instability = from_instability,
                                                    .to_instability = to_instability});
        }
    }
    return violations;
}

}  // namespace hexarch::query
