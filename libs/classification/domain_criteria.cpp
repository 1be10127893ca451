/**
 * @file domain_criteria.cpp
 * @brief Built-in domain criteria
 */

#include "hexarch/classification/domain.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <set>
#include <string>

namespace hexarch::classification {

namespace {

using graph::GraphQuery;
using graph::NodeId;
using graph::TypeNode;

constexpr std::array<std::string_view, 13> kRepositorySuffixes = {
    "Repository", "Repositories", "Fetcher", "Loader", "Reader", "Saver", "Persister",
    "Writer",     "Store",        "Storage", "Gateway", "Dao",   "DAO"};

/// Persistence-mapping packages; their @Entity is not a DDD marker
constexpr std::array<std::string_view, 4> kPersistencePackages = {
    "javax.persistence.", "jakarta.persistence.", "org.springframework.data.", "org.hibernate."};

[[nodiscard]] std::string join_simple_names(const std::vector<const TypeNode*>& types)
{
    std::string joined;
    for (const auto* type : types) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += type->simple_name();
    }
    return joined;
}

[[nodiscard]] std::vector<NodeId> ids_of(const std::vector<const TypeNode*>& types)
{
    std::vector<NodeId> ids;
    ids.reserve(types.size());
    for (const auto* type : types) {
        ids.push_back(type->id);
    }
    return ids;
}

/// Holders via a plain field or a collection / optional element, self excluded
[[nodiscard]] std::vector<const TypeNode*> holders_of(const TypeNode& type, const GraphQuery& query)
{
    std::set<NodeId> seen;
    std::vector<const TypeNode*> holders;
    const auto add = [&](const std::vector<const TypeNode*>& found) {
        for (const auto* holder : found) {
            if (holder->id != type.id && seen.insert(holder->id).second) {
                holders.push_back(holder);
            }
        }
    };
    add(query.field_holders_of(type));
    add(query.collection_holders_of(type));
    return holders;
}

[[nodiscard]] std::vector<const TypeNode*> repositories_using(const TypeNode& type,
                                                             const GraphQuery& query)
{
    std::vector<const TypeNode*> repositories;
    for (const auto* interface_type : query.interfaces_using_in_signature(type)) {
        if (is_repository_like(*interface_type)) {
            repositories.push_back(interface_type);
        }
    }
    return repositories;
}

[[nodiscard]] bool has_marker_annotation(const TypeNode& type, std::string_view marker)
{
    return std::ranges::any_of(type.annotations, [marker](const std::string& annotation) {
        if (common::simple_name(annotation) != marker) {
            return false;
        }
        return std::ranges::none_of(kPersistencePackages, [&annotation](std::string_view prefix) {
            return annotation.starts_with(prefix);
        });
    });
}

/// DDD marker annotation or implemented interface with the marker's simple name
[[nodiscard]] std::optional<std::string> marker_on(const TypeNode& type,
                                                   const std::vector<std::string_view>& markers)
{
    for (const auto marker : markers) {
        if (has_marker_annotation(type, marker)) {
            return std::format("annotation @{}", marker);
        }
        if (type.implements_named(marker)) {
            return std::format("interface {}", marker);
        }
    }
    return std::nullopt;
}

/**
 * @brief Common name / id / role storage
 */
class DomainCriterionBase : public DomainCriterion
{
public:
    DomainCriterionBase(std::string_view name, DomainRole role)
        : m_name(name)
        , m_id(std::format("domain.{}", name))
        , m_role(role)
    {}

    [[nodiscard]] std::string_view name() const override { return m_name; }
    [[nodiscard]] std::string_view id() const override { return m_id; }
    [[nodiscard]] DomainRole target_role() const override { return m_role; }
    [[nodiscard]] bool applies_to(const TypeNode& type) const override
    {
        return type.form != graph::TypeForm::kAnnotation;
    }

private:
    std::string m_name;
    std::string m_id;
    DomainRole m_role;
};

// ============================================================================
// Explicit markers
// ============================================================================

class ExplicitMarkerCriterion final : public DomainCriterionBase
{
public:
    ExplicitMarkerCriterion(std::string_view name,
                            DomainRole role,
                            std::vector<std::string_view> markers)
        : DomainCriterionBase(name, role)
        , m_markers(std::move(markers))
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& /*query*/) const override
    {
        auto marker = marker_on(type, m_markers);
        if (!marker) {
            return std::nullopt;
        }
        const auto kind = marker->starts_with("annotation") ? EvidenceKind::kAnnotation
                                                            : EvidenceKind::kStructural;
        return Match{.confidence = ConfidenceLevel::kExplicit,
                     .justification = std::format("Marked as {} by {}", to_string(target_role()), *marker),
                     .evidence = {Evidence{.kind = kind, .message = *marker, .references = {type.id}}},
                     .metadata = {}};
    }

private:
    std::vector<std::string_view> m_markers;
};

// ============================================================================
// Strong heuristics
// ============================================================================

class RepositoryDominantCriterion final : public DomainCriterionBase
{
public:
    RepositoryDominantCriterion()
        : DomainCriterionBase("repository-dominant", DomainRole::kAggregateRoot)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (type.is_interface() || type.is_enum()) {
            return std::nullopt;
        }
        const auto* identity = query.identity_field_of(type);
        if (identity == nullptr) {
            return std::nullopt;
        }
        const auto repositories = repositories_using(type, query);
        if (repositories.empty()) {
            return std::nullopt;
        }
        return Match{
            .confidence = ConfidenceLevel::kHigh,
            .justification = std::format("Managed by repository [{}] and has identity field '{}'",
                                         join_simple_names(repositories),
                                         identity->name),
            .evidence = {Evidence::relationship(
                             std::format("Used in signature of {}", join_simple_names(repositories)),
                             ids_of(repositories)),
                         Evidence::structural(std::format("Identity field '{}'", identity->name),
                                              {identity->id})},
            .metadata = {}};
    }
};

class RecordSingleIdCriterion final : public DomainCriterionBase
{
public:
    RecordSingleIdCriterion()
        : DomainCriterionBase("record-single-id", DomainRole::kIdentifier)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        const auto simple = type.simple_name();
        if (simple.size() <= 2 || !simple.ends_with("Id")) {
            return std::nullopt;
        }
        if (type.is_record()) {
            if (type.record_components.size() != 1) {
                return std::nullopt;
            }
            return Match{
                .confidence = ConfidenceLevel::kHigh,
                .justification = std::format("Record wrapping a single component '{}'",
                                             type.record_components.front().name),
                .evidence = {Evidence::naming(std::format("Name '{}' ends with Id", simple)),
                             Evidence::structural("Single record component", {type.id})},
                .metadata = {}};
        }
        if (!type.is_class()) {
            return std::nullopt;
        }
        std::vector<const graph::FieldNode*> instance_fields;
        for (const auto* field : query.fields_of(type)) {
            if (!field->modifiers.has(graph::Modifier::kStatic)) {
                instance_fields.push_back(field);
            }
        }
        if (instance_fields.size() != 1) {
            return std::nullopt;
        }
        const auto* field = instance_fields.front();
        if (!field->modifiers.has(graph::Modifier::kPrivate)
            || !field->modifiers.has(graph::Modifier::kFinal)) {
            return std::nullopt;
        }
        return Match{
            .confidence = ConfidenceLevel::kHigh,
            .justification = std::format("Class wrapping a single private final field '{}'", field->name),
            .evidence = {Evidence::naming(std::format("Name '{}' ends with Id", simple)),
                         Evidence::structural("Single private final field", {field->id})},
            .metadata = {}};
    }
};

/// Parent class (transitively) or implemented interface carries an explicit marker
class InheritedCriterion final : public DomainCriterionBase
{
public:
    InheritedCriterion(std::string_view name, DomainRole role, std::string_view marker)
        : DomainCriterionBase(name, role)
        , m_marker(marker)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (marker_on(type, {m_marker})) {
            return std::nullopt;
        }
        std::set<NodeId> visited{type.id};
        for (const auto* parent = query.supertype_of(type);
             parent != nullptr && visited.insert(parent->id).second;
             parent = query.supertype_of(*parent)) {
            if (auto marker = marker_on(*parent, {m_marker})) {
                return inherited(*parent, *marker);
            }
        }
        for (const auto* interface_type : query.interfaces_of(type)) {
            if (has_marker_annotation(*interface_type, m_marker)) {
                return inherited(*interface_type, std::format("annotation @{}", m_marker));
            }
        }
        return std::nullopt;
    }

private:
    [[nodiscard]] Match inherited(const TypeNode& parent, const std::string& marker) const
    {
        return Match{
            .confidence = ConfidenceLevel::kHigh,
            .justification = std::format("Inherits {} from {} ({})",
                                         to_string(target_role()),
                                         parent.simple_name(),
                                         marker),
            .evidence = {Evidence::relationship(std::format("Parent {} carries {}", parent.qualified_name, marker),
                                                {parent.id})},
            .metadata = {}};
    }

    std::string_view m_marker;
};

// ============================================================================
// Medium heuristics
// ============================================================================

class EmbeddedValueObjectCriterion final : public DomainCriterionBase
{
public:
    EmbeddedValueObjectCriterion()
        : DomainCriterionBase("embedded-value-object", DomainRole::kValueObject)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (type.is_interface() || type.is_enum() || query.has_identity(type)) {
            return std::nullopt;
        }
        std::vector<const TypeNode*> eligible;
        bool held_by_identity = false;
        for (const auto* holder : holders_of(type, query)) {
            if (query.has_identity(*holder)) {
                held_by_identity = true;
                eligible.push_back(holder);
            } else if (is_value_object_candidate(*holder, query)) {
                eligible.push_back(holder);
            }
        }
        if (eligible.empty()) {
            return std::nullopt;
        }

        const auto names = join_simple_names(eligible);
        const auto holder_kind = held_by_identity ? "aggregate(s)" : "value object(s)";
        Evidence embedded = Evidence::relationship(std::format("Embedded in: {}", names), ids_of(eligible));
        if (!query.is_immutable(type)) {
            return Match{.confidence = ConfidenceLevel::kMedium,
                         .justification = std::format(
                             "Embedded in {} [{}], no identity, but not immutable", holder_kind, names),
                         .evidence = {std::move(embedded),
                                      Evidence::structural("No identity field", {type.id})},
                         .metadata = {}};
        }
        return Match{
            .confidence = held_by_identity ? ConfidenceLevel::kHigh : ConfidenceLevel::kMedium,
            .justification = std::format("Immutable type embedded in {}: {}", holder_kind, names),
            .evidence = {std::move(embedded), Evidence::structural("No identity, immutable", {type.id})},
            .metadata = {}};
    }

private:
    [[nodiscard]] static bool is_value_object_candidate(const TypeNode& type, const GraphQuery& query)
    {
        if (type.is_interface() || type.is_enum()) {
            return false;
        }
        const auto simple = type.simple_name();
        if (simple.ends_with("Id") || simple.ends_with("ID")) {
            return false;
        }
        return !query.has_identity(type);
    }
};

class ContainedEntityCriterion final : public DomainCriterionBase
{
public:
    ContainedEntityCriterion()
        : DomainCriterionBase("contained-entity", DomainRole::kEntity)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (type.is_interface() || type.is_enum() || !query.has_identity(type)) {
            return std::nullopt;
        }
        std::vector<const TypeNode*> aggregates;
        for (const auto* holder : holders_of(type, query)) {
            if (is_aggregate_candidate(*holder, query)) {
                aggregates.push_back(holder);
            }
        }
        if (aggregates.empty()) {
            return std::nullopt;
        }
        const auto names = join_simple_names(aggregates);
        return Match{.confidence = ConfidenceLevel::kHigh,
                     .justification = std::format("Has identity and is held by aggregate [{}]", names),
                     .evidence = {Evidence::relationship(std::format("Held by {}", names), ids_of(aggregates)),
                                  Evidence::structural("Identity field", {type.id})},
                     .metadata = {}};
    }

private:
    [[nodiscard]] static bool is_aggregate_candidate(const TypeNode& type, const GraphQuery& query)
    {
        if (!query.has_identity(type)) {
            return false;
        }
        return marker_on(type, {"AggregateRoot"}).has_value() || !repositories_using(type, query).empty();
    }
};

class DomainEventNamingCriterion final : public DomainCriterionBase
{
public:
    DomainEventNamingCriterion()
        : DomainCriterionBase("domain-event-naming", DomainRole::kDomainEvent)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& /*query*/) const override
    {
        if (!type.is_class() && !type.is_record()) {
            return std::nullopt;
        }
        const auto simple = type.simple_name();
        if (!simple.ends_with("Event") || simple == "Event" || simple == "DomainEvent") {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("Name '{}' ends with Event", simple),
                     .evidence = {Evidence::naming(std::format("{} follows the *Event convention", simple))},
                     .metadata = {}};
    }
};

class DomainRecordValueObjectCriterion final : public DomainCriterionBase
{
public:
    DomainRecordValueObjectCriterion()
        : DomainCriterionBase("domain-record-value-object", DomainRole::kValueObject)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (!type.is_record() || query.has_identity(type)) {
            return std::nullopt;
        }
        const auto referrers = query.referrers_of(type);
        if (referrers.empty()) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("Record without identity referenced by [{}]",
                                                  join_simple_names(referrers)),
                     .evidence = {Evidence::structural("Record without identity field", {type.id}),
                                  Evidence::relationship("Referenced by other types", ids_of(referrers))},
                     .metadata = {}};
    }
};

class DomainEnumCriterion final : public DomainCriterionBase
{
public:
    DomainEnumCriterion()
        : DomainCriterionBase("domain-enum", DomainRole::kValueObject)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (!type.is_enum()) {
            return std::nullopt;
        }
        const auto referrers = query.referrers_of(type);
        if (referrers.empty()) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("Enum referenced by [{}]", join_simple_names(referrers)),
                     .evidence = {Evidence::relationship("Referenced by other types", ids_of(referrers))},
                     .metadata = {}};
    }
};

class FlexibleApplicationServiceCriterion final : public DomainCriterionBase
{
public:
    FlexibleApplicationServiceCriterion()
        : DomainCriterionBase("flexible-application-service", DomainRole::kApplicationService)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (!type.is_class() || query.has_identity(type)) {
            return std::nullopt;
        }
        std::vector<const TypeNode*> dependencies;
        std::vector<NodeId> fields;
        for (const auto* field : query.fields_of(type)) {
            const auto* field_type = query.type(field->type.name);
            if (field_type != nullptr && field_type->is_interface() && is_repository_like(*field_type)) {
                dependencies.push_back(field_type);
                fields.push_back(field->id);
            }
        }
        if (dependencies.empty()) {
            return std::nullopt;
        }
        return Match{.confidence = ConfidenceLevel::kMedium,
                     .justification = std::format("Orchestrates repository-like dependencies [{}]",
                                                  join_simple_names(dependencies)),
                     .evidence = {Evidence::relationship("Holds repository-like dependencies", std::move(fields))},
                     .metadata = {}};
    }
};

class DomainServiceNamingCriterion final : public DomainCriterionBase
{
public:
    DomainServiceNamingCriterion()
        : DomainCriterionBase("domain-service-naming", DomainRole::kDomainService)
    {}

    [[nodiscard]] MatchResult evaluate(const TypeNode& type, const GraphQuery& query) const override
    {
        if (!type.is_class() || !type.simple_name().ends_with("DomainService")) {
            return std::nullopt;
        }
        // Stateless: no mutable instance field
        for (const auto* field : query.fields_of(type)) {
            if (!field->modifiers.has(graph::Modifier::kStatic)
                && !field->modifiers.has(graph::Modifier::kFinal)) {
                return std::nullopt;
            }
        }
        return Match{.confidence = ConfidenceLevel::kLow,
                     .justification = std::format("Stateless class named '{}'", type.simple_name()),
                     .evidence = {Evidence::naming("Name ends with DomainService")},
                     .metadata = {}};
    }
};

}  // namespace

bool is_repository_like_name(std::string_view simple_name)
{
    return std::ranges::any_of(kRepositorySuffixes, [simple_name](std::string_view suffix) {
        return simple_name.ends_with(suffix);
    });
}

bool is_repository_like(const graph::TypeNode& type)
{
    return is_repository_like_name(type.simple_name()) || type.has_annotation("Repository");
}

std::vector<std::unique_ptr<DomainCriterion>> make_domain_criteria()
{
    std::vector<std::unique_ptr<DomainCriterion>> criteria;
    criteria.push_back(std::make_unique<ExplicitMarkerCriterion>(
        "explicit-aggregate-root", DomainRole::kAggregateRoot, std::vector<std::string_view>{"AggregateRoot"}));
    criteria.push_back(std::make_unique<ExplicitMarkerCriterion>(
        "explicit-entity", DomainRole::kEntity, std::vector<std::string_view>{"Entity"}));
    criteria.push_back(std::make_unique<ExplicitMarkerCriterion>(
        "explicit-value-object", DomainRole::kValueObject, std::vector<std::string_view>{"ValueObject"}));
    criteria.push_back(std::make_unique<ExplicitMarkerCriterion>(
        "explicit-identifier",
        DomainRole::kIdentifier,
        std::vector<std::string_view>{"Identity", "Identifier"}));
    criteria.push_back(std::make_unique<ExplicitMarkerCriterion>(
        "explicit-domain-event", DomainRole::kDomainEvent, std::vector<std::string_view>{"DomainEvent"}));
    criteria.push_back(std::make_unique<RepositoryDominantCriterion>());
    criteria.push_back(std::make_unique<RecordSingleIdCriterion>());
    criteria.push_back(std::make_unique<InheritedCriterion>(
        "inherited-aggregate-root", DomainRole::kAggregateRoot, "AggregateRoot"));
    criteria.push_back(
        std::make_unique<InheritedCriterion>("inherited-entity", DomainRole::kEntity, "Entity"));
    criteria.push_back(std::make_unique<InheritedCriterion>(
        "inherited-value-object", DomainRole::kValueObject, "ValueObject"));
    criteria.push_back(std::make_unique<EmbeddedValueObjectCriterion>());
    criteria.push_back(std::make_unique<ContainedEntityCriterion>());
    criteria.push_back(std::make_unique<DomainEventNamingCriterion>());
    criteria.push_back(std::make_unique<DomainRecordValueObjectCriterion>());
    criteria.push_back(std::make_unique<DomainEnumCriterion>());
    criteria.push_back(std::make_unique<FlexibleApplicationServiceCriterion>());
    criteria.push_back(std::make_unique<DomainServiceNamingCriterion>());
    return criteria;
}

DomainEngine make_domain_engine(DecisionPolicyKind policy, CriteriaProfile profile)
{
    return DomainEngine(make_domain_criteria(),
                        make_decision_policy<DomainRole>(policy),
                        std::make_unique<DomainCompatibility>(),
                        std::move(profile));
}

}  // namespace hexarch::classification
