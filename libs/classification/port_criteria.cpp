/**
 * @file port_criteria.cpp
 * @brief Built-in port criteria
 */

#include "hexarch/classification/port.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>

namespace hexarch::classification {

namespace {

using graph::GraphQuery;
using graph::NodeId;
using graph::TypeNode;

constexpr std::array<std::string_view, 9> kCommandVerbs = {
    "create", "update", "delete", "place", "cancel", "register", "submit", "execute", "handle"};

constexpr std::array<std::string_view, 7> kQueryVerbs = {
    "find", "get", "list", "search", "count", "exists", "query"};

constexpr std::array<std::string_view, 3> kInboundSegments = {"in", "inbound", "driving"};
constexpr std::array<std::string_view, 4> kOutboundSegments = {"out", "outbound", "driven", "spi"};

template <std::size_t N>
[[nodiscard]] bool starts_with_any(std::string_view name, const std::array<std::string_view, N>& prefixes)
{
    return std::ranges::any_of(prefixes, [name](std::string_view p) { return name.starts_with(p); });
}

template <std::size_t N>
[[nodiscard]] std::optional<std::string_view> package_segment_in(
    std::string_view package,
    const std::array<std::string_view, N>& segments)
{
    for (const auto segment : segments) {
        if (common::has_package_segment(package, segment)) {
            return segment;
        }
    }
    return std::nullopt;
}

/**
 * Aggregate managed by a repository: the signature type named like the
 * repository without its suffix, else the first signature type with identity.
 */
[[nodiscard]] const TypeNode* managed_type_of(const TypeNode& repository, const GraphQuery& query)
{
    std::string_view base = repository.simple_name();
    for (const std::string_view suffix : {std::string_view("Repositories"), std::string_view("Repository")}) {
        if (base.ends_with(suffix)) {
            base.remove_suffix(suffix.size());
            break;
        }
    }
    const auto candidates = query.signature_types_of(repository);
    for (const auto* candidate : candidates) {
        if (candidate->simple_name() == base && !candidate->is_interface()) {
            return candidate;
        }
    }
    for (const auto* candidate : candidates) {
        if (!candidate->is_interface() && query.has_identity(*candidate)) {
            return candidate;
        }
    }
    return nullptr;
}

/**
 * @brief Interface-only criterion that stamps its direction into the match
 */
class PortCriterionBase : public PortCriterion
{
public:
    PortCriterionBase(std::string_view name, PortKind kind, PortDirection direction)
        : m_name(name)
        , m_id(std::format("port.{}", name))
        , m_kind(kind)
        , m_direction(direction)
    {}

    [[nodiscard]] std::string_view name() const override { return m_name; }
    [[nodiscard]] std::string_view id() const override { return m_id; }
    [[nodiscard]] PortKind target_role() const override { return m_kind; }
    [[nodiscard]] PortDirection direction() const noexcept { return m_direction; }

    [[nodiscard]] bool applies_to(const TypeNode& type) const override { return type.is_interface(); }

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const final
    {
        if (!is_port_candidate(type, query)) {
            return std::nullopt;
        }
        auto match = match_port(type, query);
        if (!match) {
            return std::nullopt;
        }
        match->metadata.insert_or_assign(std::string(kDirectionKey), std::string(to_string(m_direction)));
        if (m_kind == PortKind::kRepository) {
            if (const auto* managed = managed_type_of(type, query)) {
                match->metadata.insert_or_assign(std::string(kManagedTypeKey), managed->qualified_name);
            }
        }
        return match;
    }

protected:
    [[nodiscard]] virtual MatchResult match_port(const TypeNode& type, const GraphQuery& query) const = 0;

private:
    std::string m_name;
    std::string m_id;
    PortKind m_kind;
    PortDirection m_direction;
};

// ============================================================================
// Explicit
// ============================================================================

class ExplicitPortCriterion final : public PortCriterionBase
{
public:
    ExplicitPortCriterion(std::string_view name,
                          PortKind kind,
                          PortDirection direction,
                          std::string_view marker,
                          bool interface_marker_allowed)
        : PortCriterionBase(name, kind, direction)
        , m_marker(marker)
        , m_interface_marker_allowed(interface_marker_allowed)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& /*query*/) const override
    {
        if (type.has_annotation(m_marker)) {
            return Match{.confidence = ConfidenceLevel::kExplicit,
                         .justification = std::format("Annotated with @{}", m_marker),
                         .evidence = {Evidence::annotation(std::format("@{}", m_marker))},
                         .metadata = {}};
        }
        if (m_interface_marker_allowed && type.implements_named(m_marker)) {
            return Match{.confidence = ConfidenceLevel::kExplicit,
                         .justification = std::format("Extends marker interface {}", m_marker),
                         .evidence = {Evidence::structural(std::format("Extends {}", m_marker), {type.id})},
                         .metadata = {}};
        }
        return std::nullopt;
    }

private:
    std::string_view m_marker;
    bool m_interface_marker_allowed;
};

// ============================================================================
// Naming
// ============================================================================

class NamingPortCriterion final : public PortCriterionBase
{
public:
    NamingPortCriterion(std::string_view name,
                        PortKind kind,
                        PortDirection direction,
                        std::vector<std::string_view> suffixes)
        : PortCriterionBase(name, kind, direction)
        , m_suffixes(std::move(suffixes))
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& /*query*/) const override
    {
        const auto simple = type.simple_name();
        for (const auto suffix : m_suffixes) {
            if (simple.ends_with(suffix)) {
                return Match{
                    .confidence = ConfidenceLevel::kHigh,
                    .justification = std::format("Interface name '{}' ends with '{}'", simple, suffix),
                    .evidence = {Evidence::naming(std::format("*{} naming convention", suffix))},
                    .metadata = {}};
            }
        }
        return std::nullopt;
    }

private:
    std::vector<std::string_view> m_suffixes;
};

// ============================================================================
// Method patterns
// ============================================================================

class CommandPatternCriterion final : public PortCriterionBase
{
public:
    CommandPatternCriterion()
        : PortCriterionBase("command-pattern", PortKind::kCommand, PortDirection::kDriving)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& query) const override
    {
        const auto simple = type.simple_name();
        if (simple.ends_with("CommandHandler") || simple.ends_with("Commands")) {
            return Match{.confidence = ConfidenceLevel::kMedium,
                         .justification = std::format("Interface name '{}' denotes commands", simple),
                         .evidence = {Evidence::naming("Command naming convention")},
                         .metadata = {}};
        }
        const auto methods = query.methods_of(type);
        const bool all_commands = std::ranges::all_of(methods, [](const graph::MethodNode* method) {
            return starts_with_any(method->name, kCommandVerbs);
        });
        if (!all_commands) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("All {} method(s) are state-changing commands", methods.size()),
                     .evidence = {Evidence::structural("Command verbs on every method", {type.id})},
                     .metadata = {}};
    }
};

class QueryPatternCriterion final : public PortCriterionBase
{
public:
    QueryPatternCriterion()
        : PortCriterionBase("query-pattern", PortKind::kQuery, PortDirection::kDriving)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& query) const override
    {
        const auto simple = type.simple_name();
        if (simple.ends_with("Query") || simple.ends_with("QueryHandler") || simple.ends_with("Queries")) {
            return Match{.confidence = ConfidenceLevel::kMedium,
                         .justification = std::format("Interface name '{}' denotes queries", simple),
                         .evidence = {Evidence::naming("Query naming convention")},
                         .metadata = {}};
        }
        const auto methods = query.methods_of(type);
        const bool all_queries = std::ranges::all_of(methods, [](const graph::MethodNode* method) {
            return starts_with_any(method->name, kQueryVerbs) && !method->return_type.is_void();
        });
        if (!all_queries) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("All {} method(s) are read-only queries", methods.size()),
                     .evidence = {Evidence::structural("Query verbs returning values on every method", {type.id})},
                     .metadata = {}};
    }
};

// ============================================================================
// Structural
// ============================================================================

class InjectedAsDependencyCriterion final : public PortCriterionBase
{
public:
    InjectedAsDependencyCriterion()
        : PortCriterionBase("injected-as-dependency", PortKind::kGeneric, PortDirection::kDriven)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& query) const override
    {
        std::vector<NodeId> holders;
        std::string names;
        for (const auto* holder : query.field_holders_of(type)) {
            if (!holder->is_class()) {
                continue;
            }
            holders.push_back(holder->id);
            if (!names.empty()) {
                names += ", ";
            }
            names += holder->simple_name();
        }
        if (holders.empty()) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("Injected as a field dependency into [{}]", names),
                     .evidence = {Evidence::relationship("Held as a field", std::move(holders))},
                     .metadata = {}};
    }
};

class SignatureBasedDrivenPortCriterion final : public PortCriterionBase
{
public:
    SignatureBasedDrivenPortCriterion()
        : PortCriterionBase("signature-based-driven-port", PortKind::kGeneric, PortDirection::kDriven)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& query) const override
    {
        if (!query.implementors_of(type).empty()) {
            return std::nullopt;
        }
        std::vector<NodeId> entities;
        for (const auto* used : query.signature_types_of(type)) {
            if (!used->is_interface() && query.has_identity(*used)) {
                entities.push_back(used->id);
            }
        }
        if (entities.empty()) {
            return std::nullopt;
        }
        return Match{
            .confidence = ConfidenceLevel::kMedium,
            .justification = "Unimplemented interface exchanging types with identity",
            .evidence = {Evidence::relationship("Signature uses types with identity", std::move(entities)),
                         Evidence::structural("No implementation in the codebase", {type.id})},
            .metadata = {}};
    }
};

template <std::size_t N>
class PackagePortCriterion final : public PortCriterionBase
{
public:
    PackagePortCriterion(std::string_view name,
                         PortKind kind,
                         PortDirection direction,
                         const std::array<std::string_view, N>& segments)
        : PortCriterionBase(name, kind, direction)
        , m_segments(segments)
    {}

protected:
    [[nodiscard]] MatchResult match_port(const TypeNode& type, const GraphQuery& /*query*/) const override
    {
        auto segment = package_segment_in(type.package_name(), m_segments);
        if (!segment) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kLow,
                     .justification = std::format("Declared in a '{}' package", *segment),
                     .evidence = {Evidence::naming(std::format("Package {}", type.package_name()))},
                     .metadata = {}};
    }

private:
    std::array<std::string_view, N> m_segments;
};

}  // namespace

bool is_port_candidate(const graph::TypeNode& type, const graph::GraphQuery& query)
{
    return type.is_interface() && !query.methods_of(type).empty();
}

std::vector<std::unique_ptr<PortCriterion>> make_port_criteria()
{
    using Suffixes = std::vector<std::string_view>;
    std::vector<std::unique_ptr<PortCriterion>> criteria;
    criteria.push_back(std::make_unique<ExplicitPortCriterion>(
        "explicit-repository", PortKind::kRepository, PortDirection::kDriven, "Repository", false));
    criteria.push_back(std::make_unique<ExplicitPortCriterion>(
        "explicit-primary-port", PortKind::kUseCase, PortDirection::kDriving, "PrimaryPort", true));
    criteria.push_back(std::make_unique<ExplicitPortCriterion>(
        "explicit-secondary-port", PortKind::kGateway, PortDirection::kDriven, "SecondaryPort", true));
    criteria.push_back(std::make_unique<NamingPortCriterion>(
        "naming-repository", PortKind::kRepository, PortDirection::kDriven, Suffixes{"Repository", "Repositories"}));
    criteria.push_back(std::make_unique<NamingPortCriterion>(
        "naming-use-case", PortKind::kUseCase, PortDirection::kDriving, Suffixes{"UseCase"}));
    criteria.push_back(std::make_unique<NamingPortCriterion>(
        "naming-gateway", PortKind::kGateway, PortDirection::kDriven, Suffixes{"Gateway", "Client"}));
    criteria.push_back(std::make_unique<CommandPatternCriterion>());
    criteria.push_back(std::make_unique<QueryPatternCriterion>());
    criteria.push_back(std::make_unique<InjectedAsDependencyCriterion>());
    criteria.push_back(std::make_unique<SignatureBasedDrivenPortCriterion>());
    criteria.push_back(std::make_unique<PackagePortCriterion<3>>(
        "package-in", PortKind::kUseCase, PortDirection::kDriving, kInboundSegments));
    criteria.push_back(std::make_unique<PackagePortCriterion<4>>(
        "package-out", PortKind::kGateway, PortDirection::kDriven, kOutboundSegments));
    return criteria;
}

PortEngine make_port_engine(DecisionPolicyKind policy, CriteriaProfile profile)
{
    return PortEngine(make_port_criteria(),
                      make_decision_policy<PortKind>(policy),
                      std::make_unique<PortCompatibility>(),
                      std::move(profile));
}

}  // namespace hexarch::classification
