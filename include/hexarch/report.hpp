#pragma once

/**
 * @file report.hpp
 * @brief JSON documents for graph summaries, classifications and audits
 */

#include "hexarch/architecture_query.hpp"
#include "hexarch/classification/classifier.hpp"
#include "hexarch/common.hpp"
#include "hexarch/config.hpp"
#include "hexarch/graph.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace hexarch::report {

/// Node and edge counts by kind and origin, plus graph metadata
[[nodiscard]] nlohmann::json graph_summary(const graph::ApplicationGraph& graph);

/// Per-type port and domain results, sorted by qualified name, with a summary
[[nodiscard]] nlohmann::json classifications_to_json(const graph::ApplicationGraph& graph,
                                                     const classification::ClassificationSet& results);

/**
 * Build an audit.v1 document.
 *
 * Coupling and Lakos figures cover @p options.packages, or every package when
 * the list is empty. Violation lists are empty when disabled in @p options.
 */
[[nodiscard]] nlohmann::json build_audit(const graph::ApplicationGraph& graph,
                                         const classification::ClassificationSet& results,
                                         const config::AuditConfig& options);

/**
 * Validate an audit document against audit.v1.schema.json in @p schema_dir.
 *
 * @return Empty on success, SchemaValidationFailed otherwise
 */
[[nodiscard]] hexarch::VoidResult validate_audit(const nlohmann::json& audit,
                                                 const std::string& schema_dir);

}  // namespace hexarch::report
