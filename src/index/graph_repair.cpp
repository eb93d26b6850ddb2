/** \file graph_repair.cpp
 *  \brief Tombstone-driven bulk removal for UndirectedGraph and LayeredGraph.
 */

#include "tessera/index/graph_repair.hpp"
#include "tessera/index/graph_params.hpp"

#include <cstdio>

namespace tessera::index::repair {

namespace {

// Removes the listed ids from one map; survivors are collected into \p affected.
auto remove_from(UndirectedGraph& graph, const roaring::Roaring64Map& deleted,
                 roaring::Roaring64Map& affected, roaring::Roaring64Map& seen) -> std::size_t {
    std::size_t removed = 0;
    for (std::uint64_t id : deleted) {
        auto former = graph.remove_node(id);
        if (!former) continue;
        ++removed;
        seen.add(id);
        for (ElementId n : *former) {
            if (!deleted.contains(n)) affected.add(n);
        }
    }
    return removed;
}

auto log_summary(const char* what, const RepairSummary& s) -> void {
    if (!graph_debug_from_env()) return;
    std::fprintf(stderr, "[tessera.graph] %s: removed=%zu missing=%zu affected=%llu\n",
                 what, s.removed, s.missing,
                 static_cast<unsigned long long>(s.affected.cardinality()));
}

} // namespace

auto remove_nodes(UndirectedGraph& graph, const roaring::Roaring64Map& deleted) -> RepairSummary {
    RepairSummary summary;
    roaring::Roaring64Map seen;
    summary.removed = remove_from(graph, deleted, summary.affected, seen);
    summary.missing = static_cast<std::size_t>(deleted.cardinality() - seen.cardinality());
    log_summary("remove_nodes", summary);
    return summary;
}

auto remove_nodes(LayeredGraph& graph, const roaring::Roaring64Map& deleted) -> RepairSummary {
    RepairSummary summary;
    roaring::Roaring64Map seen;
    for (std::size_t i = 0; i < graph.num_layers(); ++i) {
        summary.removed += remove_from(*graph.layer(i), deleted, summary.affected, seen);
    }
    summary.missing = static_cast<std::size_t>(deleted.cardinality() - seen.cardinality());
    log_summary("remove_nodes(layered)", summary);
    return summary;
}

} // namespace tessera::index::repair
