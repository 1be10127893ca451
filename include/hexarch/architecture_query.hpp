#pragma once

/**
 * @file architecture_query.hpp
 * @brief Structural queries over an enriched graph
 *
 * Every operation is a pure read. Unknown packages, types or empty type sets
 * give zero-valued results instead of errors.
 */

#include "hexarch/classification/classifier.hpp"
#include "hexarch/graph.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hexarch::query {

// ============================================================================
// Result types
// ============================================================================

enum class CycleKind : std::uint8_t {
    kType,
    kPackage,
    kBoundedContext
};

[[nodiscard]] std::string_view to_string(CycleKind kind);

/**
 * @brief One dependency cycle; the first element is repeated at the end
 */
struct DependencyCycle
{
    CycleKind kind = CycleKind::kType;
    std::vector<std::string> path;

    [[nodiscard]] std::size_t length() const { return path.empty() ? 0 : path.size() - 1; }
};

struct LakosMetrics
{
    std::size_t component_count = 0;
    std::size_t ccd = 0;  ///< Cumulative component dependency
    double acd = 0.0;     ///< Average component dependency
    double nccd = 0.0;    ///< CCD normalized by n*log2(n)
    double racd = 0.0;    ///< ACD relative to log2(n)
};

enum class Zone : std::uint8_t {
    kZoneOfPain,
    kZoneOfUselessness,
    kMainSequence,
    kNearMainSequence,
    kOffMainSequence
};

[[nodiscard]] std::string_view to_string(Zone zone);

/// Zone for abstractness @p a and instability @p i
[[nodiscard]] Zone classify_zone(double a, double i);

struct CouplingMetrics
{
    std::string package;
    std::size_t afferent = 0;  ///< Ca
    std::size_t efferent = 0;  ///< Ce
    double abstractness = 0.0;

    [[nodiscard]] double instability() const
    {
        const auto total = afferent + efferent;
        return total == 0 ? 0.0 : static_cast<double>(efferent) / static_cast<double>(total);
    }
    [[nodiscard]] double distance() const;
    [[nodiscard]] Zone zone() const { return classify_zone(abstractness, instability()); }
};

struct AggregateInfo
{
    std::string root;
    std::vector<std::string> entities;
    std::vector<std::string> value_objects;

    [[nodiscard]] bool contains(std::string_view qualified_name) const;
};

struct BoundedContextInfo
{
    std::string name;
    std::string root_package;  ///< First three package segments
    std::vector<std::string> types;
};

enum class Layer : std::uint8_t {
    kUnknown,
    kDomain,
    kApplication,
    kInfrastructure,
    kPresentation
};

[[nodiscard]] std::string_view to_string(Layer layer);

struct LayerViolation
{
    std::string from_type;
    std::string to_type;
    Layer from_layer = Layer::kUnknown;
    Layer to_layer = Layer::kUnknown;
};

struct StabilityViolation
{
    std::string from_type;
    std::string to_type;
    double from_instability = 0.0;
    double to_instability = 0.0;
};

// ============================================================================
// Package helpers
// ============================================================================

/**
 * Bounded context of a package: the segment at index 2.
 * "com.example.order.domain" -> "order"; std::nullopt below three segments.
 */
[[nodiscard]] std::optional<std::string> bounded_context_of(std::string_view package);

/// Layer inferred from package keywords ("domain", "usecase", "adapter", "api", ...)
[[nodiscard]] Layer layer_of(std::string_view package);

/// Forbidden dependency direction between two layers
[[nodiscard]] bool is_layer_violation(Layer from, Layer to);

// ============================================================================
// Query facade
// ============================================================================

/**
 * @brief Cycles, Lakos and coupling metrics, aggregates and violations
 *
 * Dependencies are the REFERENCES edges of the graph. Classifications are
 * optional; without them aggregate roots fall back to a repository naming
 * heuristic and port directions are unknown.
 */
class ArchitectureQuery
{
public:
    explicit ArchitectureQuery(const graph::ApplicationGraph& graph,
                               const classification::ClassificationSet* classifications = nullptr);

    // Cycles
    [[nodiscard]] std::vector<DependencyCycle> find_type_cycles() const;
    [[nodiscard]] std::vector<DependencyCycle> find_package_cycles() const;
    [[nodiscard]] std::vector<DependencyCycle> find_bounded_context_cycles() const;
    /// Type, package and bounded-context cycles, in that order
    [[nodiscard]] std::vector<DependencyCycle> find_all_cycles() const;

    // Lakos
    /// Size of the REFERENCES closure from @p qualified_name, excluding itself
    [[nodiscard]] std::size_t depends_on(std::string_view qualified_name) const;
    [[nodiscard]] LakosMetrics lakos_metrics() const;
    [[nodiscard]] LakosMetrics lakos_metrics(std::string_view package) const;
    [[nodiscard]] LakosMetrics lakos_metrics(const std::set<std::string>& qualified_names) const;

    // Coupling
    [[nodiscard]] CouplingMetrics coupling_metrics(std::string_view package) const;
    /// One entry per package that holds a type, sorted by package
    [[nodiscard]] std::vector<CouplingMetrics> all_coupling_metrics() const;

    // Aggregates
    [[nodiscard]] std::vector<AggregateInfo> find_aggregates() const;
    /// Cohesion in [0, 1] rounded to two decimals; std::nullopt for a non-root
    [[nodiscard]] std::optional<double> aggregate_cohesion(std::string_view root) const;
    [[nodiscard]] std::optional<AggregateInfo> find_containing_aggregate(
        std::string_view qualified_name) const;
    /// Root -> entities followed by value objects; aggregates without members are omitted
    [[nodiscard]] std::map<std::string, std::vector<std::string>> aggregate_membership() const;
    [[nodiscard]] std::optional<std::string> find_repository_for_aggregate(
        std::string_view root) const;

    // Ports
    [[nodiscard]] std::optional<classification::PortDirection> find_port_direction(
        std::string_view qualified_name) const;

    // Contexts and violations
    [[nodiscard]] std::vector<BoundedContextInfo> find_bounded_contexts() const;
    [[nodiscard]] std::vector<LayerViolation> find_layer_violations() const;
    [[nodiscard]] std::vector<StabilityViolation> find_stability_violations() const;

private:
    using Adjacency = std::map<std::string, std::set<std::string>>;

    /// Type-level REFERENCES adjacency by qualified name
    [[nodiscard]] Adjacency reference_adjacency() const;
    [[nodiscard]] LakosMetrics lakos_for(const std::vector<const graph::TypeNode*>& types) const;
    [[nodiscard]] std::vector<const graph::TypeNode*> aggregate_roots() const;
    /// Members of the aggregate rooted at @p root; other @p roots are never members
    [[nodiscard]] AggregateInfo aggregate_of(const graph::TypeNode& root,
                                             const std::set<graph::NodeId>& roots) const;
    [[nodiscard]] std::vector<const graph::TypeNode*> repository_ports() const;
    /// Instability of a single type over its distinct REFERENCES neighbours
    [[nodiscard]] double type_instability(const graph::NodeId& type) const;

    const graph::ApplicationGraph* m_graph;
    const classification::ClassificationSet* m_classifications;
};

}  // namespace hexarch::query
