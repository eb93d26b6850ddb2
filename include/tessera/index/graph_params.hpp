#pragma once

/** \file graph_params.hpp
 *  \brief Configuration for HNSW adjacency storage.
 *
 * Degree caps here are capacity hints: neighbor sets are reserved to these sizes,
 * but the graph never rejects a larger set. Degree pruning belongs to the caller.
 *
 * Environment overrides (read through core::safe_getenv):
 * - TESSERA_GRAPH_M_MAX   decimal, upper-layer neighbor hint
 * - TESSERA_GRAPH_M_MAX0  decimal, base-layer neighbor hint
 * - TESSERA_GRAPH_DEBUG   diagnostics to stderr when set and not "0..."
 */

#include <cstdint>
#include <expected>

#include "tessera/error.hpp"

namespace tessera::index {

/** \brief Adjacency storage parameters. */
struct GraphParams {
    std::uint32_t m_max{16};    /**< Neighbor hint for layers > 0 */
    std::uint32_t m_max0{32};   /**< Neighbor hint for layer 0 (usually 2x m_max) */
    bool debug{false};          /**< Emit [tessera.graph] diagnostics */
};

/** \brief Check parameter consistency.
 *
 * Preconditions: m_max >= 1; m_max0 >= m_max
 * \return Success or config_invalid
 */
auto validate_graph_params(const GraphParams& params)
    -> std::expected<void, core::error>;

/** \brief Apply TESSERA_GRAPH_* overrides on top of \p base and validate the result. */
auto graph_params_from_env(const GraphParams& base = {})
    -> std::expected<GraphParams, core::error>;

/** \brief True when TESSERA_GRAPH_DEBUG is on; sampled once per process. */
auto graph_debug_from_env() noexcept -> bool;

} // namespace tessera::index
