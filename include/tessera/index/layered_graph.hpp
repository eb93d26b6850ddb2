#pragma once

/** \file layered_graph.hpp
 *  \brief Per-level adjacency for an HNSW index.
 *
 * Level 0 holds every element and is sized with m_max0; upper levels use m_max.
 * Each level is an independent UndirectedGraph, so symmetry holds per level.
 *
 * Thread-safety: NOT thread-safe; same contract as UndirectedGraph.
 */

#include <cstddef>
#include <expected>
#include <vector>

#include "tessera/error.hpp"
#include "tessera/index/graph_params.hpp"
#include "tessera/index/undirected_graph.hpp"

namespace tessera::index {

/** \brief Former neighbors of a removed node on one level. */
struct LayerRemoval {
    std::size_t layer{0};
    EdgeSet former_neighbors;
};

/** \brief Stack of per-level adjacency maps. */
class LayeredGraph {
public:
    /** \brief Start with the base level only. Parameters are not re-validated here. */
    explicit LayeredGraph(const GraphParams& params);

    /** \brief Grow to at least \p n levels. Never shrinks. */
    auto ensure_layers(std::size_t n) -> void;

    [[nodiscard]] auto num_layers() const noexcept -> std::size_t;

    /** \brief Level \p i, or nullptr when out of range. Invalidated by ensure_layers(). */
    [[nodiscard]] auto layer(std::size_t i) -> UndirectedGraph*;
    [[nodiscard]] auto layer(std::size_t i) const -> const UndirectedGraph*;

    /** \brief Remove \p node from every level it is present on.
     *
     * \return One entry per level the node was removed from, in ascending level order
     */
    auto remove_node(ElementId node) -> std::vector<LayerRemoval>;

    /** \brief Verify symmetry on every level; the error message names the level. */
    auto check_symmetry() const -> std::expected<void, core::error>;

    /** \brief Statistics per level. */
    [[nodiscard]] auto stats() const -> std::vector<GraphStats>;

    [[nodiscard]] auto params() const noexcept -> const GraphParams&;

private:
    GraphParams params_;
    std::vector<UndirectedGraph> layers_;
};

} // namespace tessera::index
