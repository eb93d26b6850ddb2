#include "tessera/index/layered_graph.hpp"

#include <string>
#include <utility>

namespace tessera::index {

LayeredGraph::LayeredGraph(const GraphParams& params) : params_(params) {
    layers_.emplace_back(params_.m_max0);
    if (params_.debug) layers_.back().set_debug(true);
}

auto LayeredGraph::ensure_layers(std::size_t n) -> void {
    while (layers_.size() < n) {
        layers_.emplace_back(params_.m_max);
        if (params_.debug) layers_.back().set_debug(true);
    }
}

auto LayeredGraph::num_layers() const noexcept -> std::size_t {
    return layers_.size();
}

auto LayeredGraph::layer(std::size_t i) -> UndirectedGraph* {
    return i < layers_.size() ? &layers_[i] : nullptr;
}

auto LayeredGraph::layer(std::size_t i) const -> const UndirectedGraph* {
    return i < layers_.size() ? &layers_[i] : nullptr;
}

auto LayeredGraph::remove_node(ElementId node) -> std::vector<LayerRemoval> {
    std::vector<LayerRemoval> removed;
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        if (auto former = layers_[i].remove_node(node)) {
            removed.push_back(LayerRemoval{i, std::move(*former)});
        }
    }
    return removed;
}

auto LayeredGraph::check_symmetry() const -> std::expected<void, core::error> {
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        auto ok = layers_[i].check_symmetry();
        if (!ok) {
            auto err = ok.error();
            err.message = "layer " + std::to_string(i) + ": " + err.message;
            return std::unexpected(std::move(err));
        }
    }
    return {};
}

auto LayeredGraph::stats() const -> std::vector<GraphStats> {
    std::vector<GraphStats> out;
    out.reserve(layers_.size());
    for (const auto& g : layers_) out.push_back(g.stats());
    return out;
}

auto LayeredGraph::params() const noexcept -> const GraphParams& {
    return params_;
}

} // namespace tessera::index
