#include "tessera/index/undirected_graph.hpp"
#include "tessera/index/graph_params.hpp"

#include <algorithm>
#include <cstdio>
#include <queue>
#include <string>
#include <utility>

namespace tessera::index {

UndirectedGraph::UndirectedGraph(std::size_t m_max)
    : m_max_(m_max), debug_(graph_debug_from_env()) {}

auto UndirectedGraph::from_nodes(std::size_t m_max, NodeMap nodes)
    -> std::expected<UndirectedGraph, core::error> {
    UndirectedGraph g(m_max);
    g.nodes_ = std::move(nodes);
    if (auto ok = g.check_symmetry(); !ok) {
        return std::unexpected(ok.error());
    }
    return g;
}

auto UndirectedGraph::get_edges(ElementId node) const -> const EdgeSet* {
    auto it = nodes_.find(node);
    return it == nodes_.end() ? nullptr : &it->second;
}

auto UndirectedGraph::add_edge(ElementId a, ElementId b) -> void {
    if (a == b) return;
    nodes_[a].insert(b);
    nodes_[b].insert(a);
}

auto UndirectedGraph::add_empty_node(ElementId node) -> bool {
    if (nodes_.contains(node)) return false;
    EdgeSet edges;
    edges.reserve(m_max_);
    nodes_.emplace(node, std::move(edges));
    return true;
}

auto UndirectedGraph::link_back(ElementId neighbor, ElementId node) -> void {
    // operator[] registers a missing neighbor with an empty set
    nodes_[neighbor].insert(node);
    ++reverse_updates_;
}

auto UndirectedGraph::add_node(ElementId node, EdgeSet edges)
    -> std::optional<std::vector<ElementId>> {
    auto [it, inserted] = nodes_.try_emplace(node, std::move(edges));
    if (!inserted) {
        if (debug_) {
            std::fprintf(stderr, "[tessera.graph] add_node rejected: %llu already present\n",
                         static_cast<unsigned long long>(node));
        }
        return std::nullopt;
    }

    std::vector<ElementId> linked(it->second.begin(), it->second.end());
    for (ElementId e : linked) {
        link_back(e, node);
    }
    return linked;
}

auto UndirectedGraph::set_node(ElementId node, EdgeSet edges) -> void {
    if (debug_ && edges.contains(node)) {
        std::fprintf(stderr, "[tessera.graph] set_node stores self-reference on %llu\n",
                     static_cast<unsigned long long>(node));
    }

    std::vector<ElementId> to_add;
    std::vector<ElementId> to_remove;

    auto it = nodes_.find(node);
    if (it == nodes_.end()) {
        to_add.assign(edges.begin(), edges.end());
        nodes_.emplace(node, std::move(edges));
    } else {
        const EdgeSet& old_edges = it->second;
        for (ElementId old_edge : old_edges) {
            if (!edges.contains(old_edge)) to_remove.push_back(old_edge);
        }
        for (ElementId new_edge : edges) {
            if (!old_edges.contains(new_edge)) to_add.push_back(new_edge);
        }
        it->second = std::move(edges);
    }

    for (ElementId n : to_add) {
        link_back(n, node);
    }
    for (ElementId n : to_remove) {
        auto nit = nodes_.find(n);
        if (nit != nodes_.end()) {
            nit->second.erase(node);
            ++reverse_updates_;
        }
    }
}

auto UndirectedGraph::remove_node(ElementId node) -> std::optional<EdgeSet> {
    auto it = nodes_.find(node);
    if (it == nodes_.end()) return std::nullopt;

    EdgeSet edges = std::move(it->second);
    nodes_.erase(it);
    for (ElementId e : edges) {
        auto nit = nodes_.find(e);
        if (nit != nodes_.end()) {
            nit->second.erase(node);
            ++reverse_updates_;
        }
    }
    return edges;
}

auto UndirectedGraph::contains(ElementId node) const -> bool {
    return nodes_.contains(node);
}

auto UndirectedGraph::size() const noexcept -> std::size_t {
    return nodes_.size();
}

auto UndirectedGraph::empty() const noexcept -> bool {
    return nodes_.empty();
}

auto UndirectedGraph::m_max() const noexcept -> std::size_t {
    return m_max_;
}

auto UndirectedGraph::nodes() const noexcept -> const NodeMap& {
    return nodes_;
}

auto UndirectedGraph::stats() const -> GraphStats {
    GraphStats stats;
    stats.n_nodes = nodes_.size();
    stats.reverse_edge_updates = reverse_updates_;

    std::size_t endpoint_sum = 0;
    for (const auto& [id, edges] : nodes_) {
        const std::size_t degree = edges.size();
        endpoint_sum += degree;
        stats.max_degree = std::max(stats.max_degree, degree);
        if (degree == 0) ++stats.isolated_nodes;
        if (degree > m_max_) ++stats.over_capacity;
        if (edges.contains(id)) ++stats.self_loops;
    }

    // A self-loop occupies one slot; every other edge occupies two
    stats.n_edges = (endpoint_sum - stats.self_loops) / 2 + stats.self_loops;
    stats.avg_degree = stats.n_nodes > 0 ?
        static_cast<float>(endpoint_sum) / static_cast<float>(stats.n_nodes) : 0.0f;
    return stats;
}

auto UndirectedGraph::check_symmetry() const -> std::expected<void, core::error> {
    for (const auto& [a, edges] : nodes_) {
        for (ElementId b : edges) {
            auto it = nodes_.find(b);
            if (it == nodes_.end()) {
                return std::unexpected(core::error{
                    core::error_code::data_integrity,
                    "edge " + std::to_string(a) + "->" + std::to_string(b) +
                        " points at unregistered node",
                    "index.graph"
                });
            }
            if (!it->second.contains(a)) {
                return std::unexpected(core::error{
                    core::error_code::data_integrity,
                    "edge " + std::to_string(a) + "->" + std::to_string(b) +
                        " has no reverse edge",
                    "index.graph"
                });
            }
        }
    }
    return {};
}

auto UndirectedGraph::reachable_count(ElementId start) const -> std::size_t {
    if (!nodes_.contains(start)) return 0;

    std::unordered_set<ElementId> visited;
    visited.reserve(nodes_.size());
    std::queue<ElementId> q;
    visited.insert(start);
    q.push(start);

    std::size_t count = 0;
    while (!q.empty()) {
        ElementId current = q.front(); q.pop();
        ++count;

        auto it = nodes_.find(current);
        if (it == nodes_.end()) continue;
        for (ElementId nb : it->second) {
            if (visited.insert(nb).second) {
                q.push(nb);
            }
        }
    }
    return count;
}

} // namespace tessera::index
