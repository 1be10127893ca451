/**
 * @file graph_indexes.cpp
 * @brief Node and edge secondary indexes
 */

#include "hexarch/graph.hpp"

#include <type_traits>

namespace hexarch::graph {

namespace {

const GraphIndexes::IdSet kEmpty{};

}  // namespace

const GraphIndexes::IdSet& GraphIndexes::lookup(const IdIndex& index, const NodeId& key)
{
    auto it = index.find(key);
    return it == index.end() ? kEmpty : it->second;
}

const GraphIndexes::IdSet& GraphIndexes::lookup(const StringIndex& index, std::string_view key)
{
    auto it = index.find(key);
    return it == index.end() ? kEmpty : it->second;
}

void GraphIndexes::index_node(const Node& node)
{
    std::visit(
        [this](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TypeNode>) {
                m_all_types.insert(n.id);
                m_by_package[std::string(n.package_name())].insert(n.id);
                m_by_form[n.form].insert(n.id);
                for (const auto& annotation : n.annotations) {
                    m_by_annotation[annotation].insert(n.id);
                }
            } else {
                m_all_members.insert(n.id);
            }
        },
        node);
}

void GraphIndexes::index_edge(const Edge& edge)
{
    switch (edge.kind) {
        case EdgeKind::kDeclares:
            m_declared_members[edge.from].insert(edge.to);
            m_declaring_type.insert_or_assign(edge.to, edge.from);
            break;
        case EdgeKind::kExtends:
            m_subtypes[edge.to].insert(edge.from);
            m_supertype.insert_or_assign(edge.from, edge.to);
            break;
        case EdgeKind::kImplements:
            m_implementors[edge.to].insert(edge.from);
            m_implemented[edge.from].insert(edge.to);
            break;
        case EdgeKind::kUsesInSignature:
            m_used_in_signature_of[edge.to].insert(edge.from);
            break;
        case EdgeKind::kFieldType:
            m_fields_by_type[edge.to].insert(edge.from);
            break;
        case EdgeKind::kReturnType:
            m_methods_by_return_type[edge.to].insert(edge.from);
            break;
        case EdgeKind::kParameterType:
            if (edge.from.kind() == NodeKind::kMethod) {
                m_methods_by_parameter_type[edge.to].insert(edge.from);
            }
            break;
        default:
            break;
    }
}

const GraphIndexes::IdSet& GraphIndexes::types_in_package(std::string_view package) const
{
    return lookup(m_by_package, package);
}

const GraphIndexes::IdSet& GraphIndexes::types_with_form(TypeForm form) const
{
    auto it = m_by_form.find(form);
    return it == m_by_form.end() ? kEmpty : it->second;
}

const GraphIndexes::IdSet& GraphIndexes::types_annotated_with(std::string_view annotation) const
{
    return lookup(m_by_annotation, annotation);
}

std::vector<std::string> GraphIndexes::packages() const
{
    std::vector<std::string> result;
    result.reserve(m_by_package.size());
    for (const auto& [package, _] : m_by_package) {
        result.push_back(package);
    }
    return result;
}

const GraphIndexes::IdSet& GraphIndexes::members_of(const NodeId& type) const
{
    return lookup(m_declared_members, type);
}

std::optional<NodeId> GraphIndexes::declaring_type_of(const NodeId& member) const
{
    auto it = m_declaring_type.find(member);
    if (it == m_declaring_type.end()) {
        return std::nullopt;
    }
    return it->second;
}

const GraphIndexes::IdSet& GraphIndexes::subtypes_of(const NodeId& type) const
{
    return lookup(m_subtypes, type);
}

std::optional<NodeId> GraphIndexes::supertype_of(const NodeId& type) const
{
    auto it = m_supertype.find(type);
    if (it == m_supertype.end()) {
        return std::nullopt;
    }
    return it->second;
}

const GraphIndexes::IdSet& GraphIndexes::implementors_of(const NodeId& interface_id) const
{
    return lookup(m_implementors, interface_id);
}

const GraphIndexes::IdSet& GraphIndexes::interfaces_of(const NodeId& type) const
{
    return lookup(m_implemented, type);
}

const GraphIndexes::IdSet& GraphIndexes::used_in_signature_of(const NodeId& type) const
{
    return lookup(m_used_in_signature_of, type);
}

const GraphIndexes::IdSet& GraphIndexes::fields_of_type(const NodeId& type) const
{
    return lookup(m_fields_by_type, type);
}

const GraphIndexes::IdSet& GraphIndexes::methods_returning(const NodeId& type) const
{
    return lookup(m_methods_by_return_type, type);
}

const GraphIndexes::IdSet& GraphIndexes::methods_taking(const NodeId& type) const
{
    return lookup(m_methods_by_parameter_type, type);
}

}  // namespace hexarch::graph
