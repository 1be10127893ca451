/**
 * @file derived_edges.cpp
 * @brief Derived-edge computation (signature usage, container unwrapping)
 */

#include "hexarch/derived_edges.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <variant>
#include <vector>

namespace hexarch::derived {

namespace {

using graph::ApplicationGraph;
using graph::Edge;
using graph::EdgeKind;
using graph::NodeId;
using graph::TypeRef;

constexpr std::array<std::string_view, 16> kCollectionWrappers = {
    "Collection", "Iterable", "List",      "ArrayList",    "LinkedList", "Set",
    "HashSet",    "LinkedHashSet", "TreeSet", "SortedSet", "NavigableSet", "Queue",
    "Deque",      "ArrayDeque", "Stream",  "Flux"};

constexpr std::array<std::string_view, 3> kOptionalWrappers = {"Optional", "Maybe", "Mono"};

constexpr std::array<std::string_view, 6> kMapWrappers = {
    "Map", "HashMap", "LinkedHashMap", "TreeMap", "SortedMap", "ConcurrentHashMap"};

template <std::size_t N>
[[nodiscard]] bool simple_name_in(std::string_view type_name,
                                  const std::array<std::string_view, N>& names)
{
    return std::ranges::find(names, common::simple_name(type_name)) != names.end();
}

/**
 * @brief Edge planned from one member, inserted once the scan is complete
 */
struct PlannedEdge
{
    NodeId from;
    NodeId to;
    EdgeKind kind;
    graph::Proof proof;
};

class Planner
{
public:
    explicit Planner(const ApplicationGraph& graph)
        : m_graph(graph)
    {}

    [[nodiscard]] std::vector<PlannedEdge> take() { return std::move(m_planned); }

    void plan_method(const graph::MethodNode& method)
    {
        const auto* owner = m_graph.type_node(method.declaring_type);
        if (owner == nullptr || !owner->is_interface()) {
            return;
        }
        if (!method.return_type.is_void()) {
            for_each_known(method.return_type, [&](const NodeId& target) {
                add_signature_edge(owner->id, target, method.id, "return");
            });
        }
        for (std::size_t i = 0; i < method.parameters.size(); ++i) {
            const auto via = std::format("param:{}", i);
            for_each_known(method.parameters[i], [&](const NodeId& target) {
                add_signature_edge(owner->id, target, method.id, via);
            });
        }
    }

    void plan_field(const graph::FieldNode& field)
    {
        if (!m_graph.contains_node(field.declaring_type)) {
            return;
        }
        unwrap(field.declaring_type, field.id, field.type);
    }

private:
    [[nodiscard]] bool is_known(const TypeRef& ref) const
    {
        return !ref.is_primitive() && !ref.is_void()
               && m_graph.type_node(ref.name) != nullptr;
    }

    template <typename Fn>
    void for_each_known(const TypeRef& ref, Fn&& fn) const
    {
        if (is_known(ref)) {
            fn(NodeId::type(ref.name));
        }
        for (const auto& argument : ref.arguments) {
            for_each_known(argument, fn);
        }
    }

    void add_signature_edge(const NodeId& from,
                            const NodeId& to,
                            const NodeId& member,
                            std::string via)
    {
        m_planned.push_back(PlannedEdge{
            .from = from,
            .to = to,
            .kind = EdgeKind::kUsesInSignature,
            .proof = graph::Proof{.source_member = member,
                                  .via = std::move(via),
                                  .rule = std::string(kRuleSignatureUsage)}});
    }

    void add_unwrap_edge(const NodeId& owner,
                         const NodeId& field,
                         const TypeRef& element,
                         EdgeKind kind)
    {
        if (!is_known(element)) {
            return;
        }
        const auto rule =
            kind == EdgeKind::kUsesAsOptionalElement ? kRuleOptionalUnwrap : kRuleCollectionUnwrap;
        m_planned.push_back(
            PlannedEdge{.from = owner,
                        .to = NodeId::type(element.name),
                        .kind = kind,
                        .proof = graph::Proof{.source_member = field,
                                              .via = "field",
                                              .rule = std::string(rule)}});
    }

    // A wrapper that is itself an in-codebase type is not unwrapped.
    void unwrap(const NodeId& owner, const NodeId& field, const TypeRef& type)
    {
        if (type.array) {
            TypeRef element = type;
            element.array = false;
            add_unwrap_edge(owner, field, element, EdgeKind::kUsesAsCollectionElement);
            return;
        }
        if (type.arguments.empty() || m_graph.type_node(type.name) != nullptr) {
            return;
        }

        const TypeRef* element = nullptr;
        EdgeKind kind = EdgeKind::kUsesAsCollectionElement;
        if (is_collection_wrapper(type.name)) {
            element = &type.arguments.front();
        } else if (is_map_wrapper(type.name) && type.arguments.size() >= 2) {
            element = &type.arguments[1];
        } else if (is_optional_wrapper(type.name)) {
            element = &type.arguments.front();
            kind = EdgeKind::kUsesAsOptionalElement;
        }
        if (element == nullptr) {
            return;
        }
        if (!element->arguments.empty() && !is_known(*element)) {
            unwrap(owner, field, *element);
            return;
        }
        add_unwrap_edge(owner, field, *element, kind);
    }

    const ApplicationGraph& m_graph;
    std::vector<PlannedEdge> m_planned;
};

}  // namespace

bool is_collection_wrapper(std::string_view type_name)
{
    return simple_name_in(type_name, kCollectionWrappers);
}

bool is_optional_wrapper(std::string_view type_name)
{
    return simple_name_in(type_name, kOptionalWrappers);
}

bool is_map_wrapper(std::string_view type_name)
{
    return simple_name_in(type_name, kMapWrappers);
}

hexarch::Result<DerivedEdgeStats> compute_derived_edges(graph::ApplicationGraph& graph)
{
    Planner planner(graph);
    for (const auto* member : graph.member_nodes()) {
        if (const auto* method = std::get_if<graph::MethodNode>(member)) {
            planner.plan_method(*method);
        } else if (const auto* field = std::get_if<graph::FieldNode>(member)) {
            planner.plan_field(*field);
        }
    }

    DerivedEdgeStats stats;
    for (auto& planned : planner.take()) {
        if (graph.contains_edge(planned.from, planned.to, planned.kind)) {
            ++stats.skipped_existing;
            continue;
        }
        const auto kind = planned.kind;
        auto inserted = graph.add_edge(Edge::derived(std::move(planned.from),
                                                     std::move(planned.to),
                                                     kind,
                                                     std::move(planned.proof)));
        if (!inserted) {
            return std::unexpected(inserted.error());
        }
        switch (kind) {
            case EdgeKind::kUsesInSignature:
                ++stats.signature_edges;
                break;
            case EdgeKind::kUsesAsOptionalElement:
                ++stats.optional_edges;
                break;
            default:
                ++stats.collection_edges;
                break;
        }
    }
    return stats;
}

}  // namespace hexarch::derived
