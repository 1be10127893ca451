#pragma once

/**
 * @file derived_edges.hpp
 * @brief Inference of derived edges from raw structural facts
 *
 * - USES_IN_SIGNATURE: interface -> in-codebase type in a method's return or
 *   parameter types (generic arguments included)
 * - USES_AS_COLLECTION_ELEMENT: declaring type -> element type of a
 *   sequence, set, map-value or array field
 * - USES_AS_OPTIONAL_ELEMENT: declaring type -> wrapped type of an
 *   Optional-like field
 *
 * Every derived edge carries a proof. An edge whose (from, to, kind) already
 * exists is skipped, so running the computation again changes nothing.
 */

#include "hexarch/common.hpp"
#include "hexarch/graph.hpp"

#include <cstddef>
#include <string_view>

namespace hexarch::derived {

inline constexpr std::string_view kRuleSignatureUsage = "signature-usage";
inline constexpr std::string_view kRuleCollectionUnwrap = "collection-unwrap";
inline constexpr std::string_view kRuleOptionalUnwrap = "optional-unwrap";

struct DerivedEdgeStats
{
    std::size_t signature_edges = 0;
    std::size_t collection_edges = 0;
    std::size_t optional_edges = 0;
    std::size_t skipped_existing = 0;

    [[nodiscard]] std::size_t added() const noexcept
    {
        return signature_edges + collection_edges + optional_edges;
    }
};

/// Sequence and set wrappers (List, Set, Collection, Stream, ...)
[[nodiscard]] bool is_collection_wrapper(std::string_view type_name);
/// Optional-like single-element wrappers
[[nodiscard]] bool is_optional_wrapper(std::string_view type_name);
/// Key/value containers, unwrapped to their value type
[[nodiscard]] bool is_map_wrapper(std::string_view type_name);

/**
 * Add derived edges to @p graph.
 *
 * @return Counts of added and skipped edges, or the graph's insertion error
 */
[[nodiscard]] hexarch::Result<DerivedEdgeStats> compute_derived_edges(graph::ApplicationGraph& graph);

}  // namespace hexarch::derived
