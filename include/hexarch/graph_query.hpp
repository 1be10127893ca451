#pragma once

/**
 * @file graph_query.hpp
 * @brief Read-only query facade over the application graph
 *
 * Classification criteria see the graph only through this facade.
 */

#include "hexarch/graph.hpp"

#include <string_view>
#include <vector>

namespace hexarch::graph {

class GraphQuery
{
public:
    explicit GraphQuery(const ApplicationGraph& graph)
        : m_graph(&graph)
    {}

    [[nodiscard]] const ApplicationGraph& graph() const noexcept { return *m_graph; }

    [[nodiscard]] const TypeNode* type(const NodeId& id) const { return m_graph->type_node(id); }
    [[nodiscard]] const TypeNode* type(std::string_view qualified_name) const
    {
        return m_graph->type_node(qualified_name);
    }

    // Type sets (sorted by qualified name)
    [[nodiscard]] std::vector<const TypeNode*> types_in_package(std::string_view package) const;
    [[nodiscard]] std::vector<const TypeNode*> interfaces() const;
    [[nodiscard]] std::vector<const TypeNode*> classes() const;
    [[nodiscard]] std::vector<const TypeNode*> records() const;
    [[nodiscard]] std::vector<const TypeNode*> enums() const;

    // Members
    [[nodiscard]] std::vector<const FieldNode*> fields_of(const TypeNode& type) const;
    [[nodiscard]] std::vector<const MethodNode*> methods_of(const TypeNode& type) const;
    [[nodiscard]] std::vector<const ConstructorNode*> constructors_of(const TypeNode& type) const;

    // Hierarchy (in-codebase types only)
    [[nodiscard]] const TypeNode* supertype_of(const TypeNode& type) const;
    [[nodiscard]] std::vector<const TypeNode*> interfaces_of(const TypeNode& type) const;
    [[nodiscard]] std::vector<const TypeNode*> implementors_of(const TypeNode& type) const;
    [[nodiscard]] std::vector<const TypeNode*> subtypes_of(const TypeNode& type) const;

    [[nodiscard]] bool has_annotation(const TypeNode& type, std::string_view annotation) const
    {
        return type.has_annotation(annotation);
    }

    // Usage
    /// Interfaces that mention @p type in a method signature
    [[nodiscard]] std::vector<const TypeNode*> interfaces_using_in_signature(
        const TypeNode& type) const;
    /// Types mentioned in the signatures of interface @p type
    [[nodiscard]] std::vector<const TypeNode*> signature_types_of(const TypeNode& type) const;
    /// Types declaring a field whose declared type is @p type
    [[nodiscard]] std::vector<const TypeNode*> field_holders_of(const TypeNode& type) const;
    /// Types holding @p type as a collection or optional element
    [[nodiscard]] std::vector<const TypeNode*> collection_holders_of(const TypeNode& type) const;
    /// Types with a REFERENCES edge into @p type
    [[nodiscard]] std::vector<const TypeNode*> referrers_of(const TypeNode& type) const;

    // Structure
    /**
     * Identity-like field: named "id" or "<lowerCamel(simpleName)>Id", or
     * annotated @Id / @Identity / @EmbeddedId.
     */
    [[nodiscard]] const FieldNode* identity_field_of(const TypeNode& type) const;
    [[nodiscard]] bool has_identity(const TypeNode& type) const
    {
        return identity_field_of(type) != nullptr;
    }
    /// Records and enums, or classes whose instance fields are all final
    [[nodiscard]] bool is_immutable(const TypeNode& type) const;

private:
    [[nodiscard]] std::vector<const TypeNode*> resolve(const GraphIndexes::IdSet& ids) const;

    const ApplicationGraph* m_graph;
};

}  // namespace hexarch::graph
