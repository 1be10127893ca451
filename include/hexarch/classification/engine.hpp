#pragma once

/**
 * @file engine.hpp
 * @brief Generic multi-criteria classification engine
 *
 * A criterion inspects one type through GraphQuery and either abstains or
 * contributes a role with a confidence. Contributions are ranked by
 * (priority desc, confidence desc, criterion name asc); the decision policy
 * turns the ranking into a Classification. The ranking never depends on the
 * order in which criteria were registered.
 */

#include "hexarch/graph.hpp"
#include "hexarch/graph_query.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hexarch::classification {

// ============================================================================
// Confidence and evidence
// ============================================================================

/// Ordered from weakest to strongest
enum class ConfidenceLevel : std::uint8_t {
    kLow,
    kMedium,
    kHigh,
    kExplicit
};

[[nodiscard]] std::string_view to_string(ConfidenceLevel level);

enum class EvidenceKind : std::uint8_t {
    kNaming,
    kStructural,
    kRelationship,
    kAnnotation
};

[[nodiscard]] std::string_view to_string(EvidenceKind kind);

struct Evidence
{
    EvidenceKind kind = EvidenceKind::kStructural;
    std::string message;
    std::vector<graph::NodeId> references;

    [[nodiscard]] static Evidence naming(std::string message)
    {
        return Evidence{.kind = EvidenceKind::kNaming, .message = std::move(message), .references = {}};
    }
    [[nodiscard]] static Evidence annotation(std::string message)
    {
        return Evidence{
            .kind = EvidenceKind::kAnnotation, .message = std::move(message), .references = {}};
    }
    [[nodiscard]] static Evidence structural(std::string message,
                                             std::vector<graph::NodeId> references = {})
    {
        return Evidence{.kind = EvidenceKind::kStructural,
                        .message = std::move(message),
                        .references = std::move(references)};
    }
    [[nodiscard]] static Evidence relationship(std::string message,
                                               std::vector<graph::NodeId> references)
    {
        return Evidence{.kind = EvidenceKind::kRelationship,
                        .message = std::move(message),
                        .references = std::move(references)};
    }
};

using Metadata = std::map<std::string, std::string, std::less<>>;

struct Match
{
    ConfidenceLevel confidence = ConfidenceLevel::kLow;
    std::string justification;
    std::vector<Evidence> evidence;
    Metadata metadata;
};

/// std::nullopt is "no match"
using MatchResult = std::optional<Match>;

// ============================================================================
// Priorities
// ============================================================================

/**
 * Default priority of a criterion, from the central table keyed by id
 * ("domain.explicit-entity", "port.naming-repository", ...).
 * Unknown ids get 0.
 */
[[nodiscard]] int default_priority(std::string_view criterion_id);

/// Every id in the central priority table, sorted
[[nodiscard]] std::vector<std::string> known_criterion_ids();

/**
 * @brief Per-criterion priority overrides layered over the default table
 *
 * Overrides may be zero or negative.
 */
class CriteriaProfile
{
public:
    CriteriaProfile() = default;
    explicit CriteriaProfile(std::map<std::string, int, std::less<>> overrides)
        : m_overrides(std::move(overrides))
    {}

    void set_priority(std::string criterion_id, int priority)
    {
        m_overrides.insert_or_assign(std::move(criterion_id), priority);
    }

    [[nodiscard]] int resolve(std::string_view criterion_id, int default_value) const
    {
        auto it = m_overrides.find(criterion_id);
        return it == m_overrides.end() ? default_value : it->second;
    }

    [[nodiscard]] bool empty() const noexcept { return m_overrides.empty(); }
    [[nodiscard]] const std::map<std::string, int, std::less<>>& overrides() const noexcept
    {
        return m_overrides;
    }

private:
    std::map<std::string, int, std::less<>> m_overrides;
};

// ============================================================================
// Criteria and contributions
// ============================================================================

template <typename Role>
class Criterion
{
public:
    virtual ~Criterion() = default;

    /// Kebab-case name, used as the final ranking tie-break
    [[nodiscard]] virtual std::string_view name() const = 0;
    /// Stable id, key of the priority table and of profile overrides
    [[nodiscard]] virtual std::string_view id() const = 0;
    [[nodiscard]] virtual int priority() const { return default_priority(id()); }
    [[nodiscard]] virtual Role target_role() const = 0;
    [[nodiscard]] virtual bool applies_to(const graph::TypeNode& /*type*/) const { return true; }
    [[nodiscard]] virtual MatchResult evaluate(const graph::TypeNode& type,
                                               const graph::GraphQuery& query) const = 0;
};

template <typename Role>
struct Contribution
{
    Role role;
    std::string criterion_name;
    std::string criterion_id;
    int priority = 0;
    ConfidenceLevel confidence = ConfidenceLevel::kLow;
    std::string justification;
    std::vector<Evidence> evidence;
    Metadata metadata;
};

/// Ranking order: priority desc, confidence desc, criterion name asc
template <typename Role>
[[nodiscard]] bool ranks_before(const Contribution<Role>& a, const Contribution<Role>& b)
{
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    return a.criterion_name < b.criterion_name;
}

template <typename Role>
void rank(std::vector<Contribution<Role>>& contributions)
{
    std::ranges::stable_sort(contributions, ranks_before<Role>);
}

// ============================================================================
// Results
// ============================================================================

enum class ConflictSeverity : std::uint8_t {
    kWarning,  ///< Competing role is compatible with the winner
    kError     ///< Competing role is incompatible with the winner
};

[[nodiscard]] std::string_view to_string(ConflictSeverity severity);

struct Conflict
{
    std::string competing_role;
    std::string competing_criterion;
    ConfidenceLevel competing_confidence = ConfidenceLevel::kLow;
    int competing_priority = 0;
    std::string justification;
    ConflictSeverity severity = ConflictSeverity::kWarning;
};

enum class ClassificationStatus : std::uint8_t {
    kClassified,
    kUnclassified,
    kConflict
};

[[nodiscard]] std::string_view to_string(ClassificationStatus status);

template <typename Role>
struct Classification
{
    ClassificationStatus status = ClassificationStatus::kUnclassified;
    std::optional<Role> role;
    ConfidenceLevel confidence = ConfidenceLevel::kLow;
    std::string criterion;
    int priority = 0;
    std::string justification;
    std::vector<Evidence> evidence;
    std::vector<Conflict> conflicts;
    Metadata metadata;

    [[nodiscard]] static Classification unclassified() { return Classification{}; }

    [[nodiscard]] bool is_classified() const noexcept
    {
        return status == ClassificationStatus::kClassified;
    }
    [[nodiscard]] bool has_error_conflict() const
    {
        return std::ranges::any_of(conflicts, [](const Conflict& c) {
            return c.severity == ConflictSeverity::kError;
        });
    }
    [[nodiscard]] std::optional<std::string> metadata_value(std::string_view key) const
    {
        auto it = metadata.find(key);
        if (it == metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

// ============================================================================
// Policies
// ============================================================================

/**
 * @brief Which role pairs may coexist on one type without an error
 *
 * Implementations must be reflexive and symmetric.
 */
template <typename Role>
class CompatibilityPolicy
{
public:
    virtual ~CompatibilityPolicy() = default;
    [[nodiscard]] virtual bool compatible(Role a, Role b) const = 0;
};

template <typename Role>
class DecisionPolicy
{
public:
    virtual ~DecisionPolicy() = default;

    /// @p ranked is non-empty and already in ranking order
    [[nodiscard]] virtual Classification<Role> decide(
        const std::vector<Contribution<Role>>& ranked,
        const CompatibilityPolicy<Role>& compatibility) const = 0;

protected:
    /// Conflicts of every contribution after @p winner_index whose role differs
    [[nodiscard]] static std::vector<Conflict> conflicts_with(
        const std::vector<Contribution<Role>>& ranked,
        std::size_t winner_index,
        const CompatibilityPolicy<Role>& compatibility)
    {
        const auto& winner = ranked[winner_index];
        std::vector<Conflict> conflicts;
        for (std::size_t i = 0; i < ranked.size(); ++i) {
            const auto& other = ranked[i];
            if (i == winner_index || other.role == winner.role) {
                continue;
            }
            conflicts.push_back(Conflict{
                .competing_role = std::string(to_string(other.role)),
                .competing_criterion = other.criterion_name,
                .competing_confidence = other.confidence,
                .competing_priority = other.priority,
                .justification = std::format(
                    "Also matched as {} by {}", to_string(other.role), other.criterion_name),
                .severity = compatibility.compatible(winner.role, other.role)
                                ? ConflictSeverity::kWarning
                                : ConflictSeverity::kError});
        }
        return conflicts;
    }

    [[nodiscard]] static Classification<Role> classified(const Contribution<Role>& winner,
                                                         std::vector<Conflict> conflicts)
    {
        return Classification<Role>{.status = ClassificationStatus::kClassified,
                                    .role = winner.role,
                                    .confidence = winner.confidence,
                                    .criterion = winner.criterion_name,
                                    .priority = winner.priority,
                                    .justification = winner.justification,
                                    .evidence = winner.evidence,
                                    .conflicts = std::move(conflicts),
                                    .metadata = winner.metadata};
    }
};

/// First-ranked contribution always wins
template <typename Role>
class DefaultDecisionPolicy : public DecisionPolicy<Role>
{
public:
    [[nodiscard]] Classification<Role> decide(
        const std::vector<Contribution<Role>>& ranked,
        const CompatibilityPolicy<Role>& compatibility) const override
    {
        return DecisionPolicy<Role>::classified(
            ranked.front(), DecisionPolicy<Role>::conflicts_with(ranked, 0, compatibility));
    }
};

/**
 * Reports CONFLICT without a winner when the two best contributions tie on
 * priority and confidence but their roles are incompatible.
 */
template <typename Role>
class StrictDecisionPolicy : public DecisionPolicy<Role>
{
public:
    [[nodiscard]] Classification<Role> decide(
        const std::vector<Contribution<Role>>& ranked,
        const CompatibilityPolicy<Role>& compatibility) const override
    {
        auto conflicts = DecisionPolicy<Role>::conflicts_with(ranked, 0, compatibility);
        if (ranked.size() >= 2) {
            const auto& first = ranked[0];
            const auto& second = ranked[1];
            if (first.priority == second.priority && first.confidence == second.confidence
                && !compatibility.compatible(first.role, second.role)) {
                Classification<Role> result;
                result.status = ClassificationStatus::kConflict;
                result.priority = first.priority;
                result.confidence = first.confidence;
                result.justification =
                    std::format("{} ({}) and {} ({}) tie at priority {}",
                                to_string(first.role),
                                first.criterion_name,
                                to_string(second.role),
                                second.criterion_name,
                                first.priority);
                result.conflicts = std::move(conflicts);
                return result;
            }
        }
        return DecisionPolicy<Role>::classified(ranked.front(), std::move(conflicts));
    }
};

enum class DecisionPolicyKind : std::uint8_t {
    kDefault,
    kStrict
};

template <typename Role>
[[nodiscard]] std::unique_ptr<DecisionPolicy<Role>> make_decision_policy(DecisionPolicyKind kind)
{
    if (kind == DecisionPolicyKind::kStrict) {
        return std::make_unique<StrictDecisionPolicy<Role>>();
    }
    return std::make_unique<DefaultDecisionPolicy<Role>>();
}

// ============================================================================
// Engine
// ============================================================================

template <typename Role>
class ClassificationEngine
{
public:
    using CriterionList = std::vector<std::unique_ptr<Criterion<Role>>>;

    ClassificationEngine(CriterionList criteria,
                         std::unique_ptr<DecisionPolicy<Role>> decision,
                         std::unique_ptr<CompatibilityPolicy<Role>> compatibility,
                         CriteriaProfile profile = {})
        : m_criteria(std::move(criteria))
        , m_decision(std::move(decision))
        , m_compatibility(std::move(compatibility))
        , m_profile(std::move(profile))
    {}

    [[nodiscard]] const CriterionList& criteria() const noexcept { return m_criteria; }
    [[nodiscard]] const CompatibilityPolicy<Role>& compatibility() const noexcept
    {
        return *m_compatibility;
    }
    [[nodiscard]] const CriteriaProfile& profile() const noexcept { return m_profile; }

    /// Matching contributions for @p type, in ranking order
    [[nodiscard]] std::vector<Contribution<Role>> contributions(const graph::TypeNode& type,
                                                                const graph::GraphQuery& query) const
    {
        std::vector<Contribution<Role>> result;
        for (const auto& criterion : m_criteria) {
            if (!criterion->applies_to(type)) {
                continue;
            }
            auto match = criterion->evaluate(type, query);
            if (!match) {
                continue;
            }
            result.push_back(Contribution<Role>{
                .role = criterion->target_role(),
                .criterion_name = std::string(criterion->name()),
                .criterion_id = std::string(criterion->id()),
                .priority = m_profile.resolve(criterion->id(), criterion->priority()),
                .confidence = match->confidence,
                .justification = std::move(match->justification),
                .evidence = std::move(match->evidence),
                .metadata = std::move(match->metadata)});
        }
        rank(result);
        return result;
    }

    [[nodiscard]] Classification<Role> classify(const graph::TypeNode& type,
                                                const graph::GraphQuery& query) const
    {
        const auto ranked = contributions(type, query);
        if (ranked.empty()) {
            return Classification<Role>::unclassified();
        }
        return m_decision->decide(ranked, *m_compatibility);
    }

private:
    CriterionList m_criteria;
    std::unique_ptr<DecisionPolicy<Role>> m_decision;
    std::unique_ptr<CompatibilityPolicy<Role>> m_compatibility;
    CriteriaProfile m_profile;
};

}  // namespace hexarch::classification
