/**
 * @file compatibility.cpp
 * @brief Role names and role compatibility rules
 */

#include "hexarch/classification/domain.hpp"
#include "hexarch/classification/port.hpp"

#include <array>
#include <utility>

namespace hexarch::classification {

namespace {

constexpr std::array<std::pair<DomainRole, std::string_view>, 7> kDomainRoleNames = {{
    {DomainRole::kAggregateRoot, "AGGREGATE_ROOT"},
    {DomainRole::kEntity, "ENTITY"},
    {DomainRole::kValueObject, "VALUE_OBJECT"},
    {DomainRole::kIdentifier, "IDENTIFIER"},
    {DomainRole::kDomainEvent, "DOMAIN_EVENT"},
    {DomainRole::kDomainService, "DOMAIN_SERVICE"},
    {DomainRole::kApplicationService, "APPLICATION_SERVICE"},
}};

[[nodiscard]] bool is_entity_kind(DomainRole role)
{
    return role == DomainRole::kAggregateRoot || role == DomainRole::kEntity;
}

}  // namespace

// ============================================================================
// Domain
// ============================================================================

std::string_view to_string(DomainRole role)
{
    for (const auto& [value, name] : kDomainRoleNames) {
        if (value == role) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::optional<DomainRole> parse_domain_role(std::string_view text)
{
    for (const auto& [value, name] : kDomainRoleNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

bool DomainCompatibility::compatible(DomainRole a, DomainRole b) const
{
    if (a == b) {
        return true;
    }
    return is_entity_kind(a) && is_entity_kind(b);
}

// ============================================================================
// Port
// ============================================================================

std::string_view to_string(PortKind kind)
{
    switch (kind) {
        case PortKind::kRepository:
            return "REPOSITORY";
        case PortKind::kUseCase:
            return "USE_CASE";
        case PortKind::kGateway:
            return "GATEWAY";
        case PortKind::kCommand:
            return "COMMAND";
        case PortKind::kQuery:
            return "QUERY";
        case PortKind::kGeneric:
            return "GENERIC";
    }
    return "GENERIC";
}

std::string_view to_string(PortDirection direction)
{
    return direction == PortDirection::kDriving ? "DRIVING" : "DRIVEN";
}

std::optional<PortDirection> parse_port_direction(std::string_view text)
{
    if (text == "DRIVING") {
        return PortDirection::kDriving;
    }
    if (text == "DRIVEN") {
        return PortDirection::kDriven;
    }
    return std::nullopt;
}

bool PortCompatibility::compatible(PortKind a, PortKind b) const
{
    if (a == b || a == PortKind::kGeneric || b == PortKind::kGeneric) {
        return true;
    }
    const auto command_or_query = [](PortKind k) {
        return k == PortKind::kCommand || k == PortKind::kQuery;
    };
    return (command_or_query(a) && b == PortKind::kUseCase)
           || (command_or_query(b) && a == PortKind::kUseCase);
}

}  // namespace hexarch::classification
