/**
 * @file application_graph.cpp
 * @brief Graph store with insertion-time invariant checks
 */

#include "hexarch/graph.hpp"
#include "hexarch/graph_query.hpp"

#include <format>
#include <ranges>

namespace hexarch::graph {

namespace {

[[nodiscard]] std::string describe(const Edge& edge)
{
    return std::format("{} -[{}]-> {}", edge.from.value(), to_string(edge.kind), edge.to.value());
}

template <typename T>
[[nodiscard]] const T* node_as(const std::map<NodeId, Node>& nodes, const NodeId& id)
{
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

}  // namespace

hexarch::VoidResult ApplicationGraph::add_node(Node node)
{
    const NodeId& id = node_id(node);
    if (m_nodes.contains(id)) {
        return std::unexpected(
            Error::make("DuplicateNodeId", std::format("Node already exists: {}", id.value())));
    }
    m_indexes.index_node(node);
    NodeId key = id;
    m_nodes.emplace(std::move(key), std::move(node));
    return {};
}

hexarch::VoidResult ApplicationGraph::add_edge(Edge edge)
{
    if (!m_nodes.contains(edge.from)) {
        return std::unexpected(Error::make(
            "DanglingEdgeEndpoint",
            std::format("Edge source does not exist: {} ({})", edge.from.value(), describe(edge))));
    }
    if (!m_nodes.contains(edge.to)) {
        return std::unexpected(Error::make(
            "DanglingEdgeEndpoint",
            std::format("Edge target does not exist: {} ({})", edge.to.value(), describe(edge))));
    }
    if (edge.is_derived() && !edge.proof) {
        return std::unexpected(Error::make(
            "ProofRequired", std::format("Derived edge without proof: {}", describe(edge))));
    }
    if (!edge.is_derived() && edge.proof) {
        return std::unexpected(Error::make(
            "ProofNotAllowed", std::format("Raw edge carries a proof: {}", describe(edge))));
    }
    if (contains_edge(edge.from, edge.to, edge.kind)) {
        return std::unexpected(
            Error::make("DuplicateEdge", std::format("Edge already present: {}", describe(edge))));
    }

    const std::size_t index = m_edges.size();
    m_edge_keys.emplace(edge.from, edge.to, edge.kind);
    m_outgoing[edge.from].push_back(index);
    m_incoming[edge.to].push_back(index);
    m_indexes.index_edge(edge);
    m_edges.push_back(std::move(edge));
    return {};
}

const Node* ApplicationGraph::node(const NodeId& id) const
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const TypeNode* ApplicationGraph::type_node(const NodeId& id) const
{
    return node_as<TypeNode>(m_nodes, id);
}

const TypeNode* ApplicationGraph::type_node(std::string_view qualified_name) const
{
    return node_as<TypeNode>(m_nodes, NodeId::type(qualified_name));
}

const FieldNode* ApplicationGraph::field_node(const NodeId& id) const
{
    return node_as<FieldNode>(m_nodes, id);
}

const MethodNode* ApplicationGraph::method_node(const NodeId& id) const
{
    return node_as<MethodNode>(m_nodes, id);
}

const ConstructorNode* ApplicationGraph::constructor_node(const NodeId& id) const
{
    return node_as<ConstructorNode>(m_nodes, id);
}

std::vector<const TypeNode*> ApplicationGraph::type_nodes() const
{
    // "type:" ids sort by qualified name, so map order is already the contract
    std::vector<const TypeNode*> result;
    for (const auto& id : m_indexes.all_types()) {
        result.push_back(type_node(id));
    }
    return result;
}

std::vector<const Node*> ApplicationGraph::member_nodes() const
{
    std::vector<const Node*> result;
    for (const auto& id : m_indexes.all_members()) {
        result.push_back(node(id));
    }
    return result;
}

std::vector<const Edge*> ApplicationGraph::edges(EdgeKind kind) const
{
    std::vector<const Edge*> result;
    for (const auto& edge : m_edges) {
        if (edge.kind == kind) {
            result.push_back(&edge);
        }
    }
    return result;
}

std::vector<const Edge*> ApplicationGraph::edges_from(const NodeId& id) const
{
    std::vector<const Edge*> result;
    if (auto it = m_outgoing.find(id); it != m_outgoing.end()) {
        for (auto index : it->second) {
            result.push_back(&m_edges[index]);
        }
    }
    return result;
}

std::vector<const Edge*> ApplicationGraph::edges_to(const NodeId& id) const
{
    std::vector<const Edge*> result;
    if (auto it = m_incoming.find(id); it != m_incoming.end()) {
        for (auto index : it->second) {
            result.push_back(&m_edges[index]);
        }
    }
    return result;
}

std::vector<const Edge*> ApplicationGraph::raw_edges() const
{
    std::vector<const Edge*> result;
    for (const auto& edge : m_edges | std::views::filter([](const Edge& e) {
                                return !e.is_derived();
                            })) {
        result.push_back(&edge);
    }
    return result;
}

std::vector<const Edge*> ApplicationGraph::derived_edges() const
{
    std::vector<const Edge*> result;
    for (const auto& edge :
         m_edges | std::views::filter([](const Edge& e) { return e.is_derived(); })) {
        result.push_back(&edge);
    }
    return result;
}

bool ApplicationGraph::contains_edge(const NodeId& from, const NodeId& to, EdgeKind kind) const
{
    return m_edge_keys.contains(EdgeKey{from, to, kind});
}

GraphQuery ApplicationGraph::query() const
{
    return GraphQuery(*this);
}

}  // namespace hexarch::graph
