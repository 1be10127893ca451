#pragma once

/**
 * @file domain.hpp
 * @brief Domain roles (aggregate root, entity, value object, ...) and their criteria
 */

#include "hexarch/classification/engine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace hexarch::classification {

enum class DomainRole : std::uint8_t {
    kAggregateRoot,
    kEntity,
    kValueObject,
    kIdentifier,
    kDomainEvent,
    kDomainService,
    kApplicationService
};

/// "AGGREGATE_ROOT", "VALUE_OBJECT", ...
[[nodiscard]] std::string_view to_string(DomainRole role);
[[nodiscard]] std::optional<DomainRole> parse_domain_role(std::string_view text);

using DomainCriterion = Criterion<DomainRole>;
using DomainClassification = Classification<DomainRole>;
using DomainEngine = ClassificationEngine<DomainRole>;

/**
 * AGGREGATE_ROOT and ENTITY may coexist; every other pair of distinct roles
 * is an error.
 */
class DomainCompatibility final : public CompatibilityPolicy<DomainRole>
{
public:
    [[nodiscard]] bool compatible(DomainRole a, DomainRole b) const override;
};

/// Interface name suffixes that mark a persistence-style dependency
[[nodiscard]] bool is_repository_like_name(std::string_view simple_name);

/// Repository-like by name suffix or @Repository
[[nodiscard]] bool is_repository_like(const graph::TypeNode& type);

/// The built-in domain criteria, in registration order
[[nodiscard]] std::vector<std::unique_ptr<DomainCriterion>> make_domain_criteria();

[[nodiscard]] DomainEngine make_domain_engine(DecisionPolicyKind policy = DecisionPolicyKind::kDefault,
                                              CriteriaProfile profile = {});

}  // namespace hexarch::classification
