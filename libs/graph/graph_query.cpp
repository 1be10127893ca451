/**
 * @file graph_query.cpp
 * @brief Index-backed graph queries
 */

#include "hexarch/graph_query.hpp"

#include <algorithm>
#include <set>

namespace hexarch::graph {

namespace {

[[nodiscard]] std::vector<const TypeNode*> to_sorted_unique(std::set<NodeId> ids,
                                                            const ApplicationGraph& graph)
{
    std::vector<const TypeNode*> result;
    for (const auto& id : ids) {
        if (const auto* type = graph.type_node(id)) {
            result.push_back(type);
        }
    }
    return result;
}

}  // namespace

std::vector<const TypeNode*> GraphQuery::resolve(const GraphIndexes::IdSet& ids) const
{
    std::vector<const TypeNode*> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (const auto* type = m_graph->type_node(id)) {
            result.push_back(type);
        }
    }
    return result;
}

std::vector<const TypeNode*> GraphQuery::types_in_package(std::string_view package) const
{
    return resolve(m_graph->indexes().types_in_package(package));
}

std::vector<const TypeNode*> GraphQuery::interfaces() const
{
    return resolve(m_graph->indexes().types_with_form(TypeForm::kInterface));
}

std::vector<const TypeNode*> GraphQuery::classes() const
{
    return resolve(m_graph->indexes().types_with_form(TypeForm::kClass));
}

std::vector<const TypeNode*> GraphQuery::records() const
{
    return resolve(m_graph->indexes().types_with_form(TypeForm::kRecord));
}

std::vector<const TypeNode*> GraphQuery::enums() const
{
    return resolve(m_graph->indexes().types_with_form(TypeForm::kEnum));
}

std::vector<const FieldNode*> GraphQuery::fields_of(const TypeNode& type) const
{
    std::vector<const FieldNode*> result;
    for (const auto& id : m_graph->indexes().members_of(type.id)) {
        if (const auto* field = m_graph->field_node(id)) {
            result.push_back(field);
        }
    }
    return result;
}

std::vector<const MethodNode*> GraphQuery::methods_of(const TypeNode& type) const
{
    std::vector<const MethodNode*> result;
    for (const auto& id : m_graph->indexes().members_of(type.id)) {
        if (const auto* method = m_graph->method_node(id)) {
            result.push_back(method);
        }
    }
    return result;
}

std::vector<const ConstructorNode*> GraphQuery::constructors_of(const TypeNode& type) const
{
    std::vector<const ConstructorNode*> result;
    for (const auto& id : m_graph->indexes().members_of(type.id)) {
        if (const auto* ctor = m_graph->constructor_node(id)) {
            result.push_back(ctor);
        }
    }
    return result;
}

const TypeNode* GraphQuery::supertype_of(const TypeNode& type) const
{
    auto parent = m_graph->indexes().supertype_of(type.id);
    return parent ? m_graph->type_node(*parent) : nullptr;
}

std::vector<const TypeNode*> GraphQuery::interfaces_of(const TypeNode& type) const
{
    return resolve(m_graph->indexes().interfaces_of(type.id));
}

std::vector<const TypeNode*> GraphQuery::implementors_of(const TypeNode& type) const
{
    return resolve(m_graph->indexes().implementors_of(type.id));
}

std::vector<const TypeNode*> GraphQuery::subtypes_of(const TypeNode& type) const
{
    return resolve(m_graph->indexes().subtypes_of(type.id));
}

std::vector<const TypeNode*> GraphQuery::interfaces_using_in_signature(const TypeNode& type) const
{
    return resolve(m_graph->indexes().used_in_signature_of(type.id));
}

std::vector<const TypeNode*> GraphQuery::signature_types_of(const TypeNode& type) const
{
    std::set<NodeId> ids;
    for (const auto* edge : m_graph->edges_from(type.id)) {
        if (edge->kind == EdgeKind::kUsesInSignature) {
            ids.insert(edge->to);
        }
    }
    return to_sorted_unique(std::move(ids), *m_graph);
}

std::vector<const TypeNode*> GraphQuery::field_holders_of(const TypeNode& type) const
{
    std::set<NodeId> ids;
    for (const auto& field_id : m_graph->indexes().fields_of_type(type.id)) {
        if (auto owner = m_graph->indexes().declaring_type_of(field_id)) {
            ids.insert(*owner);
        }
    }
    return to_sorted_unique(std::move(ids), *m_graph);
}

std::vector<const TypeNode*> GraphQuery::collection_holders_of(const TypeNode& type) const
{
    std::set<NodeId> ids;
    for (const auto* edge : m_graph->edges_to(type.id)) {
        if (edge->kind == EdgeKind::kUsesAsCollectionElement
            || edge->kind == EdgeKind::kUsesAsOptionalElement) {
            ids.insert(edge->from);
        }
    }
    return to_sorted_unique(std::move(ids), *m_graph);
}

std::vector<const TypeNode*> GraphQuery::referrers_of(const TypeNode& type) const
{
    std::set<NodeId> ids;
    for (const auto* edge : m_graph->edges_to(type.id)) {
        if (edge->kind == EdgeKind::kReferences && edge->from != type.id) {
            ids.insert(edge->from);
        }
    }
    return to_sorted_unique(std::move(ids), *m_graph);
}

const FieldNode* GraphQuery::identity_field_of(const TypeNode& type) const
{
    const auto fields = fields_of(type);
    const std::string conventional = common::lower_camel(type.simple_name()) + "Id";
    for (const auto* field : fields) {
        if (field->modifiers.has(Modifier::kStatic)) {
            continue;
        }
        if (field->name == "id" || field->name == conventional || field->has_annotation("Id")
            || field->has_annotation("Identity") || field->has_annotation("EmbeddedId")) {
            return field;
        }
    }
    return nullptr;
}

bool GraphQuery::is_immutable(const TypeNode& type) const
{
    if (type.is_record() || type.is_enum()) {
        return true;
    }
    if (type.is_interface()) {
        return false;
    }
    const auto fields = fields_of(type);
    return std::ranges::all_of(fields, [](const FieldNode* field) {
        return field->modifiers.has(Modifier::kStatic) || field->modifiers.has(Modifier::kFinal);
    });
}

}  // namespace hexarch::graph
