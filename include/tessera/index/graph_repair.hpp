#pragma once

/** \file graph_repair.hpp
 *  \brief Physical removal of tombstoned elements from adjacency maps.
 */

#include <cstddef>

#include "roaring64map.hh"

#include "tessera/index/layered_graph.hpp"
#include "tessera/index/undirected_graph.hpp"

namespace tessera::index::repair {

/**
 * \brief Outcome of a bulk removal
 */
struct RepairSummary {
    std::size_t removed{0};          // Node entries deleted (summed over levels for LayeredGraph)
    std::size_t missing{0};          // Requested ids not present (LayeredGraph: absent from every level)
    roaring::Roaring64Map affected;  // Survivors that lost at least one neighbor
};

/**
 * \brief Remove every id in \p deleted from \p graph
 *
 * Survivors keep their remaining edges; callers re-link the ids in
 * RepairSummary::affected.
 */
auto remove_nodes(UndirectedGraph& graph, const roaring::Roaring64Map& deleted) -> RepairSummary;

/**
 * \brief Same as above, on every level of \p graph
 */
auto remove_nodes(LayeredGraph& graph, const roaring::Roaring64Map& deleted) -> RepairSummary;

} // namespace tessera::index::repair
