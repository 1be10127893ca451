#pragma once

/**
 * @file graph_builder.hpp
 * @brief Build the application graph from semantic facts
 */

#include "hexarch/common.hpp"
#include "hexarch/facts.hpp"
#include "hexarch/graph.hpp"

namespace hexarch::facts {

struct BuildOptions
{
    bool compute_derived = true;  ///< Run the derived-edge computer after the RAW pass
    bool detect_style = true;     ///< Store the detected package style in the metadata
};

/**
 * Build a graph from @p facts.
 *
 * Types are inserted in qualified-name order and members in id order, so any
 * permutation of the same facts yields the same graph. References to types
 * absent from the facts produce no edge.
 *
 * @return Graph, or the first graph invariant violation
 */
[[nodiscard]] hexarch::Result<graph::ApplicationGraph> build_graph(const SemanticFacts& facts,
                                                                   const BuildOptions& options = {});

}  // namespace hexarch::facts
