/**
 * @file graph_builder.cpp
 * @brief Facts -> ApplicationGraph (nodes, RAW edges, metadata)
 */

#include "hexarch/graph_builder.hpp"

#include "hexarch/derived_edges.hpp"
#include "hexarch/style.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace hexarch::facts {

namespace {

using graph::ApplicationGraph;
using graph::Edge;
using graph::EdgeKind;
using graph::NodeId;
using graph::TypeRef;

[[nodiscard]] std::vector<std::string> parameter_names(const std::vector<TypeRef>& parameters)
{
    std::vector<std::string> names;
    names.reserve(parameters.size());
    for (const auto& parameter : parameters) {
        names.push_back(parameter.display());
    }
    return names;
}

[[nodiscard]] std::string common_package_prefix(const std::vector<const TypeFact*>& types)
{
    std::vector<std::string> prefix;
    bool first = true;
    for (const auto* type : types) {
        auto segments = common::split_segments(common::package_name(type->qualified_name));
        if (first) {
            prefix = std::move(segments);
            first = false;
            continue;
        }
        std::size_t shared = 0;
        while (shared < prefix.size() && shared < segments.size()
               && prefix[shared] == segments[shared]) {
            ++shared;
        }
        prefix.resize(shared);
    }
    std::string joined;
    for (const auto& segment : prefix) {
        if (!joined.empty()) {
            joined += '.';
        }
        joined += segment;
    }
    return joined;
}

/**
 * @brief Collects the nodes and RAW edges of one type in insertion order
 */
class TypeEmitter
{
public:
    TypeEmitter(ApplicationGraph& graph, const TypeFact& fact)
        : m_graph(graph)
        , m_fact(fact)
        , m_type_id(NodeId::type(fact.qualified_name))
    {}

    [[nodiscard]] hexarch::VoidResult add_type_node()
    {
        graph::TypeNode node{.id = m_type_id,
                             .qualified_name = m_fact.qualified_name,
                             .form = m_fact.form,
                             .modifiers = m_fact.modifiers,
                             .annotations = m_fact.annotations,
                             .supertype = m_fact.supertype,
                             .interfaces = m_fact.interfaces,
                             .record_components = m_fact.record_components};
        return m_graph.add_node(std::move(node));
    }

    // Record components become private final fields unless declared explicitly.
    [[nodiscard]] hexarch::VoidResult add_member_nodes()
    {
        std::vector<graph::Node> members;
        std::set<std::string> field_names;
        for (const auto& field : m_fact.fields) {
            field_names.insert(field.name);
            members.emplace_back(graph::FieldNode{.id = NodeId::field(m_fact.qualified_name, field.name),
                                                  .declaring_type = m_type_id,
                                                  .name = field.name,
                                                  .modifiers = field.modifiers,
                                                  .annotations = field.annotations,
                                                  .type = field.type});
        }
        for (const auto& component : m_fact.record_components) {
            if (field_names.contains(component.name)) {
                continue;
            }
            graph::Modifiers modifiers;
            modifiers.add(graph::Modifier::kPrivate);
            modifiers.add(graph::Modifier::kFinal);
            members.emplace_back(
                graph::FieldNode{.id = NodeId::field(m_fact.qualified_name, component.name),
                                 .declaring_type = m_type_id,
                                 .name = component.name,
                                 .modifiers = modifiers,
                                 .annotations = {},
                                 .type = component.type});
        }
        for (const auto& method : m_fact.methods) {
            members.emplace_back(graph::MethodNode{
                .id = NodeId::method(m_fact.qualified_name, method.name, parameter_names(method.parameters)),
                .declaring_type = m_type_id,
                .name = method.name,
                .modifiers = method.modifiers,
                .annotations = method.annotations,
                .return_type = method.return_type,
                .parameters = method.parameters});
        }
        for (const auto& ctor : m_fact.constructors) {
            members.emplace_back(graph::ConstructorNode{
                .id = NodeId::constructor(m_fact.qualified_name, parameter_names(ctor.parameters)),
                .declaring_type = m_type_id,
                .modifiers = ctor.modifiers,
                .parameters = ctor.parameters});
        }

        std::ranges::sort(members, {}, [](const graph::Node& n) { return graph::node_id(n); });
        for (auto& member : members) {
            m_member_ids.push_back(graph::node_id(member));
            if (auto added = m_graph.add_node(std::move(member)); !added) {
                return std::unexpected(added.error());
            }
        }
        return {};
    }

    [[nodiscard]] hexarch::VoidResult add_structural_edges()
    {
        for (const auto& member : m_member_ids) {
            if (auto r = add_raw(m_type_id, member, EdgeKind::kDeclares); !r) {
                return r;
            }
        }
        if (m_fact.supertype) {
            if (auto r = add_raw_to_type(m_type_id, *m_fact.supertype, EdgeKind::kExtends); !r) {
                return r;
            }
        }
        for (const auto& interface_ref : m_fact.interfaces) {
            if (auto r = add_raw_to_type(m_type_id, interface_ref, EdgeKind::kImplements); !r) {
                return r;
            }
        }
        if (auto r = add_annotation_edges(m_type_id, m_fact.annotations); !r) {
            return r;
        }

        for (const auto& member_id : m_member_ids) {
            const auto* node = m_graph.node(member_id);
            if (node == nullptr) {
                continue;
            }
            if (const auto* field = std::get_if<graph::FieldNode>(node)) {
                if (auto r = add_annotation_edges(member_id, field->annotations); !r) {
                    return r;
                }
                if (auto r = add_type_use(member_id, field->type, EdgeKind::kFieldType); !r) {
                    return r;
                }
            } else if (const auto* method = std::get_if<graph::MethodNode>(node)) {
                if (auto r = add_annotation_edges(member_id, method->annotations); !r) {
                    return r;
                }
                if (auto r = add_type_use(member_id, method->return_type, EdgeKind::kReturnType); !r) {
                    return r;
                }
                for (const auto& parameter : method->parameters) {
                    if (auto r = add_type_use(member_id, parameter, EdgeKind::kParameterType); !r) {
                        return r;
                    }
                }
            } else if (const auto* ctor = std::get_if<graph::ConstructorNode>(node)) {
                for (const auto& parameter : ctor->parameters) {
                    if (auto r = add_type_use(member_id, parameter, EdgeKind::kParameterType); !r) {
                        return r;
                    }
                }
            }
        }
        return {};
    }

    /// One REFERENCES edge per distinct in-codebase dependency, self excluded
    [[nodiscard]] hexarch::VoidResult add_reference_edges()
    {
        std::set<std::string> targets;
        const auto collect = [&](const TypeRef& ref) { collect_names(ref, targets); };
        if (m_fact.supertype) {
            collect(*m_fact.supertype);
        }
        std::ranges::for_each(m_fact.interfaces, collect);
        for (const auto& field : m_fact.fields) {
            collect(field.type);
        }
        for (const auto& component : m_fact.record_components) {
            collect(component.type);
        }
        for (const auto& method : m_fact.methods) {
            collect(method.return_type);
            std::ranges::for_each(method.parameters, collect);
        }
        for (const auto& ctor : m_fact.constructors) {
            std::ranges::for_each(ctor.parameters, collect);
        }
        targets.insert(m_fact.references.begin(), m_fact.references.end());
        targets.erase(m_fact.qualified_name);

        for (const auto& target : targets) {
            if (m_graph.type_node(target) == nullptr) {
                continue;
            }
            if (auto r = add_raw(m_type_id, NodeId::type(target), EdgeKind::kReferences); !r) {
                return r;
            }
        }
        return {};
    }

private:
    static void collect_names(const TypeRef& ref, std::set<std::string>& names)
    {
        if (!ref.is_void() && !ref.is_primitive()) {
            names.insert(ref.name);
        }
        for (const auto& argument : ref.arguments) {
            collect_names(argument, names);
        }
    }

    [[nodiscard]] hexarch::VoidResult add_raw(const NodeId& from, const NodeId& to, EdgeKind kind)
    {
        if (m_graph.contains_edge(from, to, kind)) {
            return {};
        }
        return m_graph.add_edge(Edge::raw(from, to, kind));
    }

    [[nodiscard]] hexarch::VoidResult add_raw_to_type(const NodeId& from,
                                                      const TypeRef& ref,
                                                      EdgeKind kind)
    {
        if (ref.is_void() || ref.is_primitive() || m_graph.type_node(ref.name) == nullptr) {
            return {};
        }
        return add_raw(from, NodeId::type(ref.name), kind);
    }

    [[nodiscard]] hexarch::VoidResult add_annotation_edges(const NodeId& from,
                                                           const std::vector<std::string>& annotations)
    {
        for (const auto& annotation : annotations) {
            if (m_graph.type_node(annotation) == nullptr) {
                continue;
            }
            if (auto r = add_raw(from, NodeId::type(annotation), EdgeKind::kAnnotatedBy); !r) {
                return r;
            }
        }
        return {};
    }

    /// @p kind for the outer type, TYPE_ARGUMENT for every nested argument
    [[nodiscard]] hexarch::VoidResult add_type_use(const NodeId& member,
                                                   const TypeRef& ref,
                                                   EdgeKind kind)
    {
        if (auto r = add_raw_to_type(member, ref, kind); !r) {
            return r;
        }
        for (const auto& argument : ref.arguments) {
            if (auto r = add_type_use(member, argument, EdgeKind::kTypeArgument); !r) {
                return r;
            }
        }
        return {};
    }

    ApplicationGraph& m_graph;
    const TypeFact& m_fact;
    NodeId m_type_id;
    std::vector<NodeId> m_member_ids;
};

}  // namespace

hexarch::Result<graph::ApplicationGraph> build_graph(const SemanticFacts& facts,
                                                     const BuildOptions& options)
{
    std::vector<const TypeFact*> types;
    types.reserve(facts.types.size());
    for (const auto& type : facts.types) {
        types.push_back(&type);
    }
    std::ranges::sort(types, {}, &TypeFact::qualified_name);

    graph::GraphMetadata metadata{
        .base_namespace = facts.base_namespace.empty() ? common_package_prefix(types)
                                                       : facts.base_namespace,
        .language_version = facts.language_version,
        .source_unit_count = facts.source_unit_count,
        .style = {}};
    ApplicationGraph graph(std::move(metadata));

    std::vector<TypeEmitter> emitters;
    emitters.reserve(types.size());
    for (const auto* type : types) {
        emitters.emplace_back(graph, *type);
    }

    // All type nodes first so that edges may point at types declared later.
    for (auto& emitter : emitters) {
        if (auto r = emitter.add_type_node(); !r) {
            return std::unexpected(r.error());
        }
    }
    for (auto& emitter : emitters) {
        if (auto r = emitter.add_member_nodes(); !r) {
            return std::unexpected(r.error());
        }
    }
    for (auto& emitter : emitters) {
        if (auto r = emitter.add_structural_edges(); !r) {
            return std::unexpected(r.error());
        }
    }
    for (auto& emitter : emitters) {
        if (auto r = emitter.add_reference_edges(); !r) {
            return std::unexpected(r.error());
        }
    }

    if (options.detect_style) {
        auto updated = graph.metadata();
        updated.style = graph::detect_style(graph);
        graph.set_metadata(std::move(updated));
    }
    if (options.compute_derived) {
        auto stats = derived::compute_derived_edges(graph);
        if (!stats) {
            return std::unexpected(stats.error());
        }
    }
    return graph;
}

}  // namespace hexarch::facts
