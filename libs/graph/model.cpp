/**
 * @file model.cpp
 * @brief NodeId encoding and graph model helpers
 */

#include "hexarch/graph.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace hexarch::graph {

namespace {

constexpr std::string_view kTypePrefix = "type:";
constexpr std::string_view kFieldPrefix = "field:";
constexpr std::string_view kMethodPrefix = "method:";
constexpr std::string_view kCtorPrefix = "ctor:";

constexpr std::array<std::string_view, 9> kPrimitives = {
    "boolean", "byte", "char", "short", "int", "long", "float", "double", "void"};

[[nodiscard]] std::string join_parameters(const std::vector<std::string>& parameter_types)
{
    std::string joined;
    for (const auto& type : parameter_types) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += type;
    }
    return joined;
}

}  // namespace

// ============================================================================
// NodeId
// ============================================================================

NodeId NodeId::type(std::string_view qualified_name)
{
    return NodeId(NodeKind::kType, std::format("{}{}", kTypePrefix, qualified_name));
}

NodeId NodeId::field(std::string_view owner, std::string_view name)
{
    return NodeId(NodeKind::kField, std::format("{}{}#{}", kFieldPrefix, owner, name));
}

NodeId NodeId::method(std::string_view owner,
                      std::string_view name,
                      const std::vector<std::string>& parameter_types)
{
    return NodeId(
        NodeKind::kMethod,
        std::format("{}{}#{}({})", kMethodPrefix, owner, name, join_parameters(parameter_types)));
}

NodeId NodeId::constructor(std::string_view owner, const std::vector<std::string>& parameter_types)
{
    return NodeId(NodeKind::kConstructor,
                  std::format("{}{}#({})", kCtorPrefix, owner, join_parameters(parameter_types)));
}

hexarch::Result<NodeId> NodeId::parse(std::string_view text)
{
    const auto invalid = [text]() {
        return std::unexpected(
            Error::make("InvalidNodeId", std::format("Malformed node id: '{}'", text)));
    };
    if (text.starts_with(kTypePrefix)) {
        if (text.size() == kTypePrefix.size() || text.contains('#')) {
            return invalid();
        }
        return NodeId(NodeKind::kType, std::string(text));
    }

    NodeKind kind{};
    std::string_view rest;
    if (text.starts_with(kFieldPrefix)) {
        kind = NodeKind::kField;
        rest = text.substr(kFieldPrefix.size());
    } else if (text.starts_with(kMethodPrefix)) {
        kind = NodeKind::kMethod;
        rest = text.substr(kMethodPrefix.size());
    } else if (text.starts_with(kCtorPrefix)) {
        kind = NodeKind::kConstructor;
        rest = text.substr(kCtorPrefix.size());
    } else {
        return invalid();
    }

    const auto hash = rest.find('#');
    if (hash == std::string_view::npos || hash == 0) {
        return invalid();
    }
    const auto signature = rest.substr(hash + 1);
    const bool has_parens = signature.contains('(') && signature.ends_with(')');
    if (kind == NodeKind::kField && (signature.empty() || has_parens)) {
        return invalid();
    }
    if (kind != NodeKind::kField && !has_parens) {
        return invalid();
    }
    if (kind == NodeKind::kConstructor && !signature.starts_with('(')) {
        return invalid();
    }
    return NodeId(kind, std::string(text));
}

std::string_view NodeId::owner() const
{
    std::string_view view(m_value);
    const auto colon = view.find(':');
    view.remove_prefix(colon + 1);
    if (m_kind == NodeKind::kType) {
        return view;
    }
    return view.substr(0, view.find('#'));
}

// ============================================================================
// Type references, modifiers, forms
// ============================================================================

bool TypeRef::is_primitive() const
{
    return !array && std::ranges::find(kPrimitives, name) != kPrimitives.end();
}

std::string TypeRef::display() const
{
    std::string text = name;
    if (!arguments.empty()) {
        text += '<';
        for (std::size_t i = 0; i < arguments.size(); ++i) {
            if (i > 0) {
                text += ',';
            }
            text += arguments[i].display();
        }
        text += '>';
    }
    if (array) {
        text += "[]";
    }
    return text;
}

std::string_view to_string(Modifier modifier)
{
    switch (modifier) {
        case Modifier::kPublic:
            return "public";
        case Modifier::kProtected:
            return "protected";
        case Modifier::kPrivate:
            return "private";
        case Modifier::kStatic:
            return "static";
        case Modifier::kFinal:
            return "final";
        case Modifier::kAbstract:
            return "abstract";
    }
    return "unknown";
}

std::optional<Modifier> parse_modifier(std::string_view text)
{
    for (auto m : {Modifier::kPublic,
                   Modifier::kProtected,
                   Modifier::kPrivate,
                   Modifier::kStatic,
                   Modifier::kFinal,
                   Modifier::kAbstract}) {
        if (to_string(m) == text) {
            return m;
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> Modifiers::names() const
{
    std::vector<std::string_view> result;
    for (auto m : {Modifier::kPublic,
                   Modifier::kProtected,
                   Modifier::kPrivate,
                   Modifier::kStatic,
                   Modifier::kFinal,
                   Modifier::kAbstract}) {
        if (has(m)) {
            result.push_back(to_string(m));
        }
    }
    return result;
}

std::string_view to_string(TypeForm form)
{
    switch (form) {
        case TypeForm::kClass:
            return "class";
        case TypeForm::kInterface:
            return "interface";
        case TypeForm::kRecord:
            return "record";
        case TypeForm::kEnum:
            return "enum";
        case TypeForm::kAnnotation:
            return "annotation";
    }
    return "unknown";
}

std::optional<TypeForm> parse_type_form(std::string_view text)
{
    for (auto form : {TypeForm::kClass,
                      TypeForm::kInterface,
                      TypeForm::kRecord,
                      TypeForm::kEnum,
                      TypeForm::kAnnotation}) {
        if (to_string(form) == text) {
            return form;
        }
    }
    return std::nullopt;
}

bool annotations_contain(const std::vector<std::string>& annotations, std::string_view name)
{
    return std::ranges::any_of(annotations, [name](const std::string& annotation) {
        return annotation == name || common::simple_name(annotation) == name;
    });
}

bool TypeNode::implements_named(std::string_view simple) const
{
    return std::ranges::any_of(interfaces,
                               [simple](const TypeRef& ref) { return ref.simple_name() == simple; });
}

const NodeId& node_id(const Node& node)
{
    return std::visit([](const auto& n) -> const NodeId& { return n.id; }, node);
}

// ============================================================================
// Edge kinds and styles
// ============================================================================

std::string_view to_string(EdgeKind kind)
{
    switch (kind) {
        case EdgeKind::kExtends:
            return "EXTENDS";
        case EdgeKind::kImplements:
            return "IMPLEMENTS";
        case EdgeKind::kDeclares:
            return "DECLARES";
        case EdgeKind::kFieldType:
            return "FIELD_TYPE";
        case EdgeKind::kReturnType:
            return "RETURN_TYPE";
        case EdgeKind::kParameterType:
            return "PARAMETER_TYPE";
        case EdgeKind::kTypeArgument:
            return "TYPE_ARGUMENT";
        case EdgeKind::kAnnotatedBy:
            return "ANNOTATED_BY";
        case EdgeKind::kReferences:
            return "REFERENCES";
        case EdgeKind::kUsesInSignature:
            return "USES_IN_SIGNATURE";
        case EdgeKind::kUsesAsCollectionElement:
            return "USES_AS_COLLECTION_ELEMENT";
        case EdgeKind::kUsesAsOptionalElement:
            return "USES_AS_OPTIONAL_ELEMENT";
    }
    return "UNKNOWN";
}

bool is_derived_kind(EdgeKind kind)
{
    return kind == EdgeKind::kUsesInSignature || kind == EdgeKind::kUsesAsCollectionElement
           || kind == EdgeKind::kUsesAsOptionalElement;
}

std::string_view to_string(EdgeOrigin origin)
{
    return origin == EdgeOrigin::kDerived ? "DERIVED" : "RAW";
}

std::string_view to_string(ArchitectureStyle style)
{
    switch (style) {
        case ArchitectureStyle::kUnknown:
            return "UNKNOWN";
        case ArchitectureStyle::kHexagonal:
            return "HEXAGONAL";
        case ArchitectureStyle::kOnion:
            return "ONION";
        case ArchitectureStyle::kLayered:
            return "LAYERED";
        case ArchitectureStyle::kClean:
            return "CLEAN";
        case ArchitectureStyle::kModularMonolith:
            return "MODULAR_MONOLITH";
    }
    return "UNKNOWN";
}

}  // namespace hexarch::graph
