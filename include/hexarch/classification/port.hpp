#pragma once

/**
 * @file port.hpp
 * @brief Port kinds and directions, and the port criteria
 *
 * Only interfaces declaring at least one method are port candidates.
 */

#include "hexarch/classification/engine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace hexarch::classification {

enum class PortKind : std::uint8_t {
    kRepository,
    kUseCase,
    kGateway,
    kCommand,
    kQuery,
    kGeneric
};

enum class PortDirection : std::uint8_t {
    kDriving,  ///< Called by the outside world (primary)
    kDriven    ///< Implemented by infrastructure (secondary)
};

[[nodiscard]] std::string_view to_string(PortKind kind);
[[nodiscard]] std::string_view to_string(PortDirection direction);
[[nodiscard]] std::optional<PortDirection> parse_port_direction(std::string_view text);

/// Contribution metadata keys
inline constexpr std::string_view kDirectionKey = "direction";
inline constexpr std::string_view kManagedTypeKey = "managed_type";

using PortCriterion = Criterion<PortKind>;
using PortClassification = Classification<PortKind>;
using PortEngine = ClassificationEngine<PortKind>;

/**
 * GENERIC is compatible with every kind; COMMAND and QUERY are compatible
 * with USE_CASE.
 */
class PortCompatibility final : public CompatibilityPolicy<PortKind>
{
public:
    [[nodiscard]] bool compatible(PortKind a, PortKind b) const override;
};

/// True for interfaces with at least one declared method
[[nodiscard]] bool is_port_candidate(const graph::TypeNode& type, const graph::GraphQuery& query);

[[nodiscard]] std::vector<std::unique_ptr<PortCriterion>> make_port_criteria();

[[nodiscard]] PortEngine make_port_engine(DecisionPolicyKind policy = DecisionPolicyKind::kDefault,
                                          CriteriaProfile profile = {});

}  // namespace hexarch::classification
