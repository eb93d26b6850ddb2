#pragma once

/** \file undirected_graph.hpp
 *  \brief Symmetric adjacency map backing one HNSW layer.
 *
 * Every edge is stored in both endpoints' neighbor sets. All mutations perform the
 * reverse-edge bookkeeping themselves, so the index layer only states the new
 * neighbor set of the node it is working on.
 *
 * Nodes are keyed by externally issued ElementId values; edges are ids looked up
 * through the one owning map. There are no pointers between nodes.
 *
 * Thread-safety: NOT thread-safe; callers serialize mutations. See
 * SharedUndirectedGraph for a reader/writer-locked wrapper.
 * Errors: mutations never fail; absence is reported through sentinel results.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tessera/error.hpp"

namespace tessera::index {

/** \brief Opaque vector identifier issued by the index layer. */
using ElementId = std::uint64_t;

/** \brief Neighbor set of a node. */
using EdgeSet = std::unordered_set<ElementId>;

/** \brief Adjacency map statistics. */
struct GraphStats {
    std::size_t n_nodes{0};                 /**< Registered nodes */
    std::size_t n_edges{0};                 /**< Undirected edges, self-loops counted once */
    std::size_t self_loops{0};              /**< Nodes listing themselves as neighbor */
    std::size_t isolated_nodes{0};          /**< Nodes with an empty neighbor set */
    std::size_t max_degree{0};              /**< Largest neighbor set */
    std::size_t over_capacity{0};           /**< Nodes with degree > m_max (informational) */
    float avg_degree{0.0f};                 /**< Mean neighbor set size */
    std::uint64_t reverse_edge_updates{0};  /**< Reverse-edge touches since construction */
};

/** \brief Undirected graph over ElementId with guaranteed edge symmetry.
 *
 * Invariant: b in edges(a) implies a in edges(b), after every public call.
 * add_edge() never creates a self-loop; set_node()/add_node() store the given set
 * as-is, including a reference to the node itself.
 */
class UndirectedGraph {
public:
    using NodeMap = std::unordered_map<ElementId, EdgeSet>;

    /** \brief Create an empty graph.
     *
     * \param m_max Capacity hint for neighbor sets created by add_empty_node();
     *              never enforced as a limit.
     */
    explicit UndirectedGraph(std::size_t m_max);

    /** \brief Adopt an existing adjacency map (snapshot restore).
     *
     * \return The graph, or data_integrity if \p nodes is not symmetric
     */
    static auto from_nodes(std::size_t m_max, NodeMap nodes)
        -> std::expected<UndirectedGraph, core::error>;

    /** \brief Neighbor set of \p node, or nullptr when absent.
     *
     * The pointer is invalidated by the next mutation of this graph.
     * Complexity: O(1)
     */
    [[nodiscard]] auto get_edges(ElementId node) const -> const EdgeSet*;

    /** \brief Register \p node with an empty neighbor set.
     *
     * \return true if created; false if already present (no mutation)
     */
    auto add_empty_node(ElementId node) -> bool;

    /** \brief Insert a new node together with its edges.
     *
     * Fails without any mutation when \p node already exists. Otherwise stores
     * \p edges and adds \p node to every neighbor's set, creating missing
     * neighbors with an empty set first.
     *
     * \return Neighbors linked (order unspecified), or std::nullopt if \p node exists
     * Complexity: O(|edges|)
     */
    auto add_node(ElementId node, EdgeSet edges) -> std::optional<std::vector<ElementId>>;

    /** \brief Replace (or insert) the neighbor set of \p node.
     *
     * Only neighbors that were added or dropped relative to the previous set get
     * their reverse edge updated. A dropped neighbor that is no longer registered is
     * skipped. The new set is not filtered for \p node itself.
     *
     * Complexity: O(|old| + |new|) to diff, O(delta) reverse updates
     */
    auto set_node(ElementId node, EdgeSet edges) -> void;

    /** \brief Remove \p node and every reverse edge pointing at it.
     *
     * Former neighbors stay registered even when their set becomes empty.
     *
     * \return Former neighbor set, or std::nullopt if \p node was absent
     * Complexity: O(old degree)
     */
    auto remove_node(ElementId node) -> std::optional<EdgeSet>;

    /** \brief Insert the symmetric edge a-b, creating either endpoint if needed.
     *
     * a == b is ignored. Intended for fixtures and tests; the index layer works
     * through add_node()/set_node().
     */
    auto add_edge(ElementId a, ElementId b) -> void;

    [[nodiscard]] auto contains(ElementId node) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;
    [[nodiscard]] auto m_max() const noexcept -> std::size_t;

    /** \brief Whole adjacency map (read-only). */
    [[nodiscard]] auto nodes() const noexcept -> const NodeMap&;

    /** \brief Compute statistics. Complexity: O(N + E) */
    [[nodiscard]] auto stats() const -> GraphStats;

    /** \brief Verify edge symmetry.
     *
     * \return Success, or data_integrity naming the first one-directional edge found
     */
    auto check_symmetry() const -> std::expected<void, core::error>;

    /** \brief Count nodes reachable from \p start by BFS (start included; 0 if absent). */
    [[nodiscard]] auto reachable_count(ElementId start) const -> std::size_t;

    /** \brief Enable [tessera.graph] stderr diagnostics for this instance. */
    auto set_debug(bool on) noexcept -> void { debug_ = on; }

private:
    auto link_back(ElementId neighbor, ElementId node) -> void;

    std::size_t m_max_;
    NodeMap nodes_;
    std::uint64_t reverse_updates_{0};
    bool debug_;
};

} // namespace tessera::index
