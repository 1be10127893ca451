#pragma once

/**
 * @file graph.hpp
 * @brief Application graph: node ids, nodes, edges, indexes and metadata
 *
 * The graph is built once from frontend facts, enriched once with derived
 * edges, and is read-only afterwards. Insertion enforces:
 * - edge endpoints exist when the edge is inserted
 * - node ids are unique
 * - DERIVED edges carry a proof, RAW edges never do
 */

#include "hexarch/common.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace hexarch::graph {

class GraphQuery;

// ============================================================================
// Node identity
// ============================================================================

enum class NodeKind : std::uint8_t {
    kType,
    kField,
    kMethod,
    kConstructor
};

/**
 * @brief Stable, totally ordered node key.
 *
 * Textual forms:
 *   type:com.example.Order
 *   field:com.example.Order#id
 *   method:com.example.Order#addLine(com.example.Product,int)
 *   ctor:com.example.Order#(com.example.OrderId)
 */
class NodeId
{
public:
    [[nodiscard]] static NodeId type(std::string_view qualified_name);
    [[nodiscard]] static NodeId field(std::string_view owner, std::string_view name);
    [[nodiscard]] static NodeId method(std::string_view owner,
                                       std::string_view name,
                                       const std::vector<std::string>& parameter_types);
    [[nodiscard]] static NodeId constructor(std::string_view owner,
                                            const std::vector<std::string>& parameter_types);

    /// Parse the textual form back into an id
    [[nodiscard]] static hexarch::Result<NodeId> parse(std::string_view text);

    [[nodiscard]] NodeKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& value() const noexcept { return m_value; }
    [[nodiscard]] bool is_type() const noexcept { return m_kind == NodeKind::kType; }
    [[nodiscard]] bool is_member() const noexcept { return m_kind != NodeKind::kType; }

    /// Qualified name of the type (for type ids) or of the declaring type
    [[nodiscard]] std::string_view owner() const;

    friend bool operator==(const NodeId& a, const NodeId& b) noexcept
    {
        return a.m_value == b.m_value;
    }
    friend std::strong_ordering operator<=>(const NodeId& a, const NodeId& b) noexcept
    {
        return a.m_value <=> b.m_value;
    }

private:
    NodeId(NodeKind kind, std::string value)
        : m_kind(kind)
        , m_value(std::move(value))
    {}

    NodeKind m_kind;
    std::string m_value;
};

// ============================================================================
// Type references and modifiers
// ============================================================================

/**
 * @brief Reference to a type as written in a declaration.
 *
 * `name` is a qualified name, a primitive keyword or "void".
 */
struct TypeRef
{
    std::string name;
    std::vector<TypeRef> arguments;
    bool array = false;

    [[nodiscard]] bool is_void() const { return name == "void"; }
    [[nodiscard]] bool is_primitive() const;
    [[nodiscard]] std::string_view simple_name() const { return common::simple_name(name); }

    /// "java.util.List<com.example.Order>", "int[]"
    [[nodiscard]] std::string display() const;
};

enum class Modifier : std::uint8_t {
    kPublic,
    kProtected,
    kPrivate,
    kStatic,
    kFinal,
    kAbstract
};

[[nodiscard]] std::string_view to_string(Modifier modifier);
[[nodiscard]] std::optional<Modifier> parse_modifier(std::string_view text);

struct Modifiers
{
    std::uint8_t bits = 0;

    [[nodiscard]] bool has(Modifier m) const noexcept
    {
        return (bits & (1U << static_cast<unsigned>(m))) != 0;
    }
    void add(Modifier m) noexcept
    {
        bits = static_cast<std::uint8_t>(bits | (1U << static_cast<unsigned>(m)));
    }
    [[nodiscard]] std::vector<std::string_view> names() const;
};

enum class TypeForm : std::uint8_t {
    kClass,
    kInterface,
    kRecord,
    kEnum,
    kAnnotation
};

[[nodiscard]] std::string_view to_string(TypeForm form);
[[nodiscard]] std::optional<TypeForm> parse_type_form(std::string_view text);

/// True if @p annotations contains @p name, compared by qualified or simple name
[[nodiscard]] bool annotations_contain(const std::vector<std::string>& annotations,
                                       std::string_view name);

// ============================================================================
// Nodes
// ============================================================================

struct RecordComponent
{
    std::string name;
    TypeRef type;
};

struct TypeNode
{
    NodeId id;
    std::string qualified_name;
    TypeForm form = TypeForm::kClass;
    Modifiers modifiers;
    std::vector<std::string> annotations;
    std::optional<TypeRef> supertype;
    std::vector<TypeRef> interfaces;
    std::vector<RecordComponent> record_components;

    [[nodiscard]] std::string_view simple_name() const
    {
        return common::simple_name(qualified_name);
    }
    [[nodiscard]] std::string_view package_name() const
    {
        return common::package_name(qualified_name);
    }
    [[nodiscard]] bool is_interface() const { return form == TypeForm::kInterface; }
    [[nodiscard]] bool is_record() const { return form == TypeForm::kRecord; }
    [[nodiscard]] bool is_enum() const { return form == TypeForm::kEnum; }
    [[nodiscard]] bool is_class() const { return form == TypeForm::kClass; }
    [[nodiscard]] bool is_abstract() const
    {
        return form == TypeForm::kInterface || modifiers.has(Modifier::kAbstract);
    }
    [[nodiscard]] bool has_annotation(std::string_view name) const
    {
        return annotations_contain(annotations, name);
    }
    /// True if an implemented interface (known or external) has this simple name
    [[nodiscard]] bool implements_named(std::string_view simple) const;
};

struct FieldNode
{
    NodeId id;
    NodeId declaring_type;
    std::string name;
    Modifiers modifiers;
    std::vector<std::string> annotations;
    TypeRef type;

    [[nodiscard]] bool has_annotation(std::string_view annotation) const
    {
        return annotations_contain(annotations, annotation);
    }
};

struct MethodNode
{
    NodeId id;
    NodeId declaring_type;
    std::string name;
    Modifiers modifiers;
    std::vector<std::string> annotations;
    TypeRef return_type;
    std::vector<TypeRef> parameters;
};

struct ConstructorNode
{
    NodeId id;
    NodeId declaring_type;
    Modifiers modifiers;
    std::vector<TypeRef> parameters;
};

using Node = std::variant<TypeNode, FieldNode, MethodNode, ConstructorNode>;

[[nodiscard]] const NodeId& node_id(const Node& node);

// ============================================================================
// Edges
// ============================================================================

enum class EdgeKind : std::uint8_t {
    kExtends,
    kImplements,
    kDeclares,
    kFieldType,
    kReturnType,
    kParameterType,
    kTypeArgument,
    kAnnotatedBy,
    kReferences,
    kUsesInSignature,
    kUsesAsCollectionElement,
    kUsesAsOptionalElement
};

[[nodiscard]] std::string_view to_string(EdgeKind kind);

/// Kinds produced by the derived-edge computer
[[nodiscard]] bool is_derived_kind(EdgeKind kind);

enum class EdgeOrigin : std::uint8_t {
    kRaw,
    kDerived
};

[[nodiscard]] std::string_view to_string(EdgeOrigin origin);

/**
 * @brief Justification of a derived edge
 */
struct Proof
{
    NodeId source_member;  ///< Member the edge was inferred from
    std::string via;       ///< "param:0", "return", "field", ...
    std::string rule;      ///< Derivation rule name
};

struct Edge
{
    NodeId from;
    NodeId to;
    EdgeKind kind;
    EdgeOrigin origin = EdgeOrigin::kRaw;
    std::optional<Proof> proof;

    [[nodiscard]] static Edge raw(NodeId from, NodeId to, EdgeKind kind)
    {
        return Edge{.from = std::move(from),
                    .to = std::move(to),
                    .kind = kind,
                    .origin = EdgeOrigin::kRaw,
                    .proof = std::nullopt};
    }
    [[nodiscard]] static Edge derived(NodeId from, NodeId to, EdgeKind kind, Proof proof)
    {
        return Edge{.from = std::move(from),
                    .to = std::move(to),
                    .kind = kind,
                    .origin = EdgeOrigin::kDerived,
                    .proof = std::move(proof)};
    }

    [[nodiscard]] bool is_derived() const noexcept { return origin == EdgeOrigin::kDerived; }
};

// ============================================================================
// Metadata
// ============================================================================

enum class ArchitectureStyle : std::uint8_t {
    kUnknown,
    kHexagonal,
    kOnion,
    kLayered,
    kClean,
    kModularMonolith
};

[[nodiscard]] std::string_view to_string(ArchitectureStyle style);

struct DetectedStyle
{
    ArchitectureStyle style = ArchitectureStyle::kUnknown;
    double confidence = 0.0;
    std::string description;
    std::vector<std::string> markers;
};

struct GraphMetadata
{
    std::string base_namespace;
    std::string language_version;
    int source_unit_count = 0;
    DetectedStyle style;
};

// ============================================================================
// Indexes
// ============================================================================

/**
 * @brief Secondary lookup tables, maintained on every insertion.
 *
 * All sets are ordered so iteration is deterministic.
 */
class GraphIndexes
{
public:
    using IdSet = std::set<NodeId>;

    void index_node(const Node& node);
    void index_edge(const Edge& edge);

    [[nodiscard]] const IdSet& types_in_package(std::string_view package) const;
    [[nodiscard]] const IdSet& types_with_form(TypeForm form) const;
    [[nodiscard]] const IdSet& types_annotated_with(std::string_view annotation) const;
    [[nodiscard]] const IdSet& all_types() const noexcept { return m_all_types; }
    [[nodiscard]] const IdSet& all_members() const noexcept { return m_all_members; }
    [[nodiscard]] std::vector<std::string> packages() const;

    [[nodiscard]] const IdSet& members_of(const NodeId& type) const;
    [[nodiscard]] std::optional<NodeId> declaring_type_of(const NodeId& member) const;
    [[nodiscard]] const IdSet& subtypes_of(const NodeId& type) const;
    [[nodiscard]] std::optional<NodeId> supertype_of(const NodeId& type) const;
    [[nodiscard]] const IdSet& implementors_of(const NodeId& interface_id) const;
    [[nodiscard]] const IdSet& interfaces_of(const NodeId& type) const;
    [[nodiscard]] const IdSet& used_in_signature_of(const NodeId& type) const;
    [[nodiscard]] const IdSet& fields_of_type(const NodeId& type) const;
    [[nodiscard]] const IdSet& methods_returning(const NodeId& type) const;
    [[nodiscard]] const IdSet& methods_taking(const NodeId& type) const;

    [[nodiscard]] bool has_subtypes(const NodeId& type) const
    {
        return !subtypes_of(type).empty();
    }
    [[nodiscard]] bool has_implementors(const NodeId& interface_id) const
    {
        return !implementors_of(interface_id).empty();
    }

private:
    using StringIndex = std::map<std::string, IdSet, std::less<>>;
    using IdIndex = std::map<NodeId, IdSet>;

    [[nodiscard]] static const IdSet& lookup(const IdIndex& index, const NodeId& key);
    [[nodiscard]] static const IdSet& lookup(const StringIndex& index, std::string_view key);

    StringIndex m_by_package;
    std::map<TypeForm, IdSet> m_by_form;
    StringIndex m_by_annotation;
    IdSet m_all_types;
    IdSet m_all_members;

    IdIndex m_declared_members;
    std::map<NodeId, NodeId> m_declaring_type;
    IdIndex m_subtypes;
    std::map<NodeId, NodeId> m_supertype;
    IdIndex m_implementors;
    IdIndex m_implemented;
    IdIndex m_used_in_signature_of;
    IdIndex m_fields_by_type;
    IdIndex m_methods_by_return_type;
    IdIndex m_methods_by_parameter_type;
};

// ============================================================================
// Graph store
// ============================================================================

/**
 * @brief Owner of all nodes and edges.
 *
 * Nodes iterate in NodeId order. Edges iterate in insertion order; the graph
 * builder inserts them from sorted declarations so identical facts give
 * identical graphs.
 */
class ApplicationGraph
{
public:
    ApplicationGraph() = default;
    explicit ApplicationGraph(GraphMetadata metadata)
        : m_metadata(std::move(metadata))
    {}

    /// Fails with DuplicateNodeId if the id is already present
    [[nodiscard]] hexarch::VoidResult add_node(Node node);

    /**
     * Insert an edge.
     * Fails with DanglingEdgeEndpoint, ProofRequired, ProofNotAllowed or
     * DuplicateEdge (same from, to and kind); the graph is unchanged on failure.
     */
    [[nodiscard]] hexarch::VoidResult add_edge(Edge edge);

    [[nodiscard]] const Node* node(const NodeId& id) const;
    [[nodiscard]] const TypeNode* type_node(const NodeId& id) const;
    [[nodiscard]] const TypeNode* type_node(std::string_view qualified_name) const;
    [[nodiscard]] const FieldNode* field_node(const NodeId& id) const;
    [[nodiscard]] const MethodNode* method_node(const NodeId& id) const;
    [[nodiscard]] const ConstructorNode* constructor_node(const NodeId& id) const;
    [[nodiscard]] bool contains_node(const NodeId& id) const { return m_nodes.contains(id); }

    [[nodiscard]] const std::map<NodeId, Node>& nodes() const noexcept { return m_nodes; }
    /// Type nodes sorted by qualified name
    [[nodiscard]] std::vector<const TypeNode*> type_nodes() const;
    [[nodiscard]] std::vector<const Node*> member_nodes() const;

    [[nodiscard]] const std::vector<Edge>& edges() const noexcept { return m_edges; }
    [[nodiscard]] std::vector<const Edge*> edges(EdgeKind kind) const;
    [[nodiscard]] std::vector<const Edge*> edges_from(const NodeId& id) const;
    [[nodiscard]] std::vector<const Edge*> edges_to(const NodeId& id) const;
    [[nodiscard]] std::vector<const Edge*> raw_edges() const;
    [[nodiscard]] std::vector<const Edge*> derived_edges() const;
    [[nodiscard]] bool contains_edge(const NodeId& from, const NodeId& to, EdgeKind kind) const;

    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edges.size(); }

    [[nodiscard]] const GraphMetadata& metadata() const noexcept { return m_metadata; }
    void set_metadata(GraphMetadata metadata) { m_metadata = std::move(metadata); }

    [[nodiscard]] const GraphIndexes& indexes() const noexcept { return m_indexes; }
    [[nodiscard]] GraphQuery query() const;

private:
    using EdgeKey = std::tuple<NodeId, NodeId, EdgeKind>;

    std::map<NodeId, Node> m_nodes;
    std::vector<Edge> m_edges;
    std::map<NodeId, std::vector<std::size_t>> m_outgoing;
    std::map<NodeId, std::vector<std::size_t>> m_incoming;
    std::set<EdgeKey> m_edge_keys;
    GraphIndexes m_indexes;
    GraphMetadata m_metadata;
};

}  // namespace hexarch::graph

template <>
struct std::hash<hexarch::graph::NodeId>
{
    std::size_t operator()(const hexarch::graph::NodeId& id) const noexcept
    {
        return std::hash<std::string>{}(id.value());
    }
};
