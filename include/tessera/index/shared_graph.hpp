#pragma once

/** \file shared_graph.hpp
 *  \brief UndirectedGraph behind a single reader/writer lock.
 *
 * Every mutation can touch several neighbor sets, so the whole map is guarded by one
 * std::shared_mutex: readers share it, each mutation holds it exclusively for the
 * full reconciliation. Readers never observe a one-directional edge.
 *
 * Thread-safety: all members are safe for concurrent calls.
 */

#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include "tessera/error.hpp"
#include "tessera/index/undirected_graph.hpp"

namespace tessera::index {

class SharedUndirectedGraph {
public:
    explicit SharedUndirectedGraph(std::size_t m_max);
    explicit SharedUndirectedGraph(UndirectedGraph graph);

    SharedUndirectedGraph(const SharedUndirectedGraph&) = delete;
    SharedUndirectedGraph& operator=(const SharedUndirectedGraph&) = delete;

    /** \brief Copy of the neighbor set of \p node, or std::nullopt when absent. */
    [[nodiscard]] auto get_edges(ElementId node) const -> std::optional<EdgeSet>;

    auto add_empty_node(ElementId node) -> bool;
    auto add_node(ElementId node, EdgeSet edges) -> std::optional<std::vector<ElementId>>;
    auto set_node(ElementId node, EdgeSet edges) -> void;
    auto remove_node(ElementId node) -> std::optional<EdgeSet>;
    auto add_edge(ElementId a, ElementId b) -> void;

    [[nodiscard]] auto contains(ElementId node) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto stats() const -> GraphStats;
    auto check_symmetry() const -> std::expected<void, core::error>;

    /** \brief Run \p fn with shared access to the graph. */
    template <typename Fn>
    auto read(Fn&& fn) const -> std::invoke_result_t<Fn, const UndirectedGraph&> {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(graph_);
    }

    /** \brief Run \p fn with exclusive access; use for multi-step updates that must be atomic. */
    template <typename Fn>
    auto write(Fn&& fn) -> std::invoke_result_t<Fn, UndirectedGraph&> {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(graph_);
    }

private:
    UndirectedGraph graph_;
    mutable std::shared_mutex mutex_;
};

} // namespace tessera::index
