#include "tessera/index/shared_graph.hpp"

#include <utility>

namespace tessera::index {

SharedUndirectedGraph::SharedUndirectedGraph(std::size_t m_max) : graph_(m_max) {}

SharedUndirectedGraph::SharedUndirectedGraph(UndirectedGraph graph)
    : graph_(std::move(graph)) {}

auto SharedUndirectedGraph::get_edges(ElementId node) const -> std::optional<EdgeSet> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const EdgeSet* edges = graph_.get_edges(node);
    if (!edges) return std::nullopt;
    return *edges;
}

auto SharedUndirectedGraph::add_empty_node(ElementId node) -> bool {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.add_empty_node(node);
}

auto SharedUndirectedGraph::add_node(ElementId node, EdgeSet edges)
    -> std::optional<std::vector<ElementId>> {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.add_node(node, std::move(edges));
}

auto SharedUndirectedGraph::set_node(ElementId node, EdgeSet edges) -> void {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    graph_.set_node(node, std::move(edges));
}

auto SharedUndirectedGraph::remove_node(ElementId node) -> std::optional<EdgeSet> {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return graph_.remove_node(node);
}

auto SharedUndirectedGraph::add_edge(ElementId a, ElementId b) -> void {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    graph_.add_edge(a, b);
}

auto SharedUndirectedGraph::contains(ElementId node) const -> bool {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.contains(node);
}

auto SharedUndirectedGraph::size() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.size();
}

auto SharedUndirectedGraph::stats() const -> GraphStats {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.stats();
}

auto SharedUndirectedGraph::check_symmetry() const -> std::expected<void, core::error> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return graph_.check_symmetry();
}

} // namespace tessera::index
