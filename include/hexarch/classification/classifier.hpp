#pragma once

/**
 * @file classifier.hpp
 * @brief Whole-graph classification: ports first, then domain roles
 */

#include "hexarch/classification/domain.hpp"
#include "hexarch/classification/port.hpp"
#include "hexarch/graph.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace hexarch::classification {

struct ClassifierOptions
{
    DecisionPolicyKind decision_policy = DecisionPolicyKind::kDefault;
    CriteriaProfile profile;
};

struct ClassificationSummary
{
    std::size_t total = 0;
    std::size_t classified = 0;
    std::size_t unclassified = 0;
    std::size_t conflicts = 0;               ///< Results with CONFLICT status
    std::map<std::string, std::size_t> by_role;  ///< "AGGREGATE_ROOT" / "REPOSITORY" -> count
};

/**
 * @brief Domain and port results for every type of one graph
 *
 * A type has at most one CLASSIFIED result: when an interface is classified
 * both as a port and as a domain type, the port result is kept and the domain
 * role is recorded on it as an ERROR conflict.
 */
class ClassificationSet
{
public:
    void set_domain(const graph::NodeId& type, DomainClassification result);
    void set_port(const graph::NodeId& type, PortClassification result);

    [[nodiscard]] const DomainClassification* domain(const graph::NodeId& type) const;
    [[nodiscard]] const PortClassification* port(const graph::NodeId& type) const;

    [[nodiscard]] std::optional<DomainRole> domain_role(const graph::NodeId& type) const;
    [[nodiscard]] std::optional<PortKind> port_kind(const graph::NodeId& type) const;
    [[nodiscard]] std::optional<PortDirection> port_direction(const graph::NodeId& type) const;

    [[nodiscard]] const std::map<graph::NodeId, DomainClassification>& domain_results() const noexcept
    {
        return m_domain;
    }
    [[nodiscard]] const std::map<graph::NodeId, PortClassification>& port_results() const noexcept
    {
        return m_port;
    }

    [[nodiscard]] ClassificationSummary summary() const;

private:
    std::map<graph::NodeId, DomainClassification> m_domain;
    std::map<graph::NodeId, PortClassification> m_port;
};

/**
 * Classify every type of @p graph.
 *
 * Interfaces with methods go through the port engine; every type that is not
 * an annotation goes through the domain engine.
 */
[[nodiscard]] ClassificationSet classify_all(const graph::ApplicationGraph& graph,
                                             const ClassifierOptions& options = {});

}  // namespace hexarch::classification
