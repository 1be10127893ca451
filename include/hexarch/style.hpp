#pragma once

/**
 * @file style.hpp
 * @brief Package-organization style detection
 */

#include "hexarch/graph.hpp"

namespace hexarch::graph {

/**
 * Score the package names of all types against known layout conventions
 * (hexagonal, onion, layered, clean, modular monolith).
 *
 * The best score wins; ties go to the style listed first above. Scores below
 * 0.3 yield ArchitectureStyle::kUnknown.
 */
[[nodiscard]] DetectedStyle detect_style(const ApplicationGraph& graph);

}  // namespace hexarch::graph
