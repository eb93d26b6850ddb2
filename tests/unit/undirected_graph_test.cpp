#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <utility>
#include <vector>

#include "tessera/index/undirected_graph.hpp"

using namespace tessera::index;
using tessera::core::error_code;

namespace {

// Asserts the neighbor set of every listed node; unlisted nodes are not checked.
void check(const UndirectedGraph& g,
           const std::vector<std::pair<ElementId, std::vector<ElementId>>>& expected) {
    for (const auto& [n, e] : expected) {
        INFO("node " << n);
        const EdgeSet* edges = g.get_edges(n);
        REQUIRE(edges != nullptr);
        REQUIRE(*edges == EdgeSet(e.begin(), e.end()));
    }
}

std::vector<ElementId> sorted(std::vector<ElementId> v) {
    std::sort(v.begin(), v.end());
    return v;
}

std::vector<ElementId> sorted(const EdgeSet& s) {
    return sorted(std::vector<ElementId>(s.begin(), s.end()));
}

} // namespace

TEST_CASE("construction stores m_max as a hint only", "[graph]") {
    UndirectedGraph g(10);
    REQUIRE(g.m_max() == 10);
    REQUIRE(g.empty());
    REQUIRE(g.size() == 0);
    REQUIRE(g.get_edges(0) == nullptr);
    REQUIRE(g.check_symmetry().has_value());
}

TEST_CASE("reference scenario", "[graph]") {
    UndirectedGraph g(10);

    REQUIRE(g.add_empty_node(0));
    check(g, {{0, {}}});
    REQUIRE(g.size() == 1);

    auto r1 = g.add_node(1, {0});
    REQUIRE(r1.has_value());
    REQUIRE(*r1 == std::vector<ElementId>{0});
    check(g, {{0, {1}}, {1, {0}}});

    auto r2 = g.add_node(1, {2});
    REQUIRE_FALSE(r2.has_value());
    check(g, {{0, {1}}, {1, {0}}});
    REQUIRE_FALSE(g.contains(2));

    auto r3 = g.add_node(2, {0, 1});
    REQUIRE(r3.has_value());
    REQUIRE(sorted(*r3) == std::vector<ElementId>{0, 1});
    check(g, {{0, {1, 2}}, {1, {0, 2}}, {2, {0, 1}}});

    g.set_node(2, {1});
    check(g, {{0, {1}}, {1, {0, 2}}, {2, {1}}});

    auto removed = g.remove_node(2);
    REQUIRE(removed.has_value());
    REQUIRE(*removed == EdgeSet{1});
    check(g, {{0, {1}}, {1, {0}}});
    REQUIRE(g.size() == 2);
    REQUIRE(g.check_symmetry().has_value());
}

TEST_CASE("mixed mutation sequence keeps both directions in step", "[graph]") {
    UndirectedGraph g(10);
    REQUIRE(g.add_empty_node(0));
    REQUIRE_FALSE(g.add_empty_node(0));
    REQUIRE(g.add_node(1, {0}).has_value());
    REQUIRE(g.add_node(2, {0, 1}).has_value());

    auto r = g.add_node(3, {1, 2});
    REQUIRE(r.has_value());
    REQUIRE(sorted(*r) == std::vector<ElementId>{1, 2});
    check(g, {{0, {1, 2}}, {1, {0, 2, 3}}, {2, {0, 1, 3}}, {3, {1, 2}}});

    g.set_node(3, {0});
    check(g, {{0, {1, 2, 3}}, {1, {0, 2}}, {2, {0, 1}}, {3, {0}}});

    g.add_edge(2, 3);
    check(g, {{0, {1, 2, 3}}, {1, {0, 2}}, {2, {0, 1, 3}}, {3, {0, 2}}});

    auto removed = g.remove_node(2);
    REQUIRE(removed.has_value());
    REQUIRE(sorted(*removed) == std::vector<ElementId>{0, 1, 3});
    check(g, {{0, {1, 3}}, {1, {0}}, {3, {0}}});

    REQUIRE_FALSE(g.remove_node(2).has_value());

    // Absent node: set_node inserts
    g.set_node(2, {1});
    check(g, {{0, {1, 3}}, {1, {0, 2}}, {2, {1}}, {3, {0}}});
    REQUIRE(g.check_symmetry().has_value());
}

TEST_CASE("add_empty_node is idempotent", "[graph]") {
    UndirectedGraph g(4);
    REQUIRE(g.add_node(1, {2, 3}).has_value());

    REQUIRE(g.add_empty_node(7));
    const auto after_first = g.nodes();
    REQUIRE_FALSE(g.add_empty_node(7));
    REQUIRE(g.nodes() == after_first);

    // Existing node with edges is left alone
    REQUIRE_FALSE(g.add_empty_node(1));
    check(g, {{1, {2, 3}}, {7, {}}});
}

TEST_CASE("add_node on an existing node changes nothing", "[graph]") {
    UndirectedGraph g(4);
    REQUIRE(g.add_node(1, {2}).has_value());
    const auto before = g.nodes();
    const auto updates_before = g.stats().reverse_edge_updates;

    REQUIRE_FALSE(g.add_node(1, {3, 4}).has_value());
    REQUIRE_FALSE(g.add_node(2, {}).has_value());
    REQUIRE(g.nodes() == before);
    REQUIRE(g.stats().reverse_edge_updates == updates_before);
    REQUIRE_FALSE(g.contains(3));
}

TEST_CASE("add_node registers missing neighbors", "[graph]") {
    UndirectedGraph g(4);
    auto r = g.add_node(5, {6, 7});
    REQUIRE(r.has_value());
    REQUIRE(g.size() == 3);
    check(g, {{5, {6, 7}}, {6, {5}}, {7, {5}}});
}

TEST_CASE("set_node only touches the changed neighbors", "[graph]") {
    UndirectedGraph g(8);
    g.set_node(1, {2, 3, 4});
    REQUIRE(g.stats().reverse_edge_updates == 3);

    // Same set again: nothing to reconcile
    g.set_node(1, {2, 3, 4});
    REQUIRE(g.stats().reverse_edge_updates == 3);

    // One added (5), one dropped (2)
    g.set_node(1, {3, 4, 5});
    REQUIRE(g.stats().reverse_edge_updates == 5);
    check(g, {{1, {3, 4, 5}}, {2, {}}, {3, {1}}, {4, {1}}, {5, {1}}});

    // Dropped neighbors stay registered
    g.set_node(1, {});
    check(g, {{1, {}}, {2, {}}, {3, {}}, {4, {}}, {5, {}}});
    REQUIRE(g.size() == 5);
    REQUIRE(g.check_symmetry().has_value());
}

TEST_CASE("set_node leaves unrelated edges of neighbors intact", "[graph]") {
    UndirectedGraph g(8);
    g.add_edge(2, 3);
    g.set_node(1, {2, 3});
    g.set_node(1, {3});
    check(g, {{1, {3}}, {2, {3}}, {3, {1, 2}}});
}

TEST_CASE("remove_node orphans the node everywhere", "[graph]") {
    UndirectedGraph g(4);
    REQUIRE(g.add_node(1, {2, 3}).has_value());
    REQUIRE(g.add_node(4, {1}).has_value());

    auto former = g.remove_node(1);
    REQUIRE(former.has_value());
    REQUIRE(*former == EdgeSet{2, 3, 4});
    REQUIRE_FALSE(g.contains(1));
    for (const auto& [id, edges] : g.nodes()) {
        REQUIRE_FALSE(edges.contains(1));
    }
    // Former neighbors stay, now isolated
    check(g, {{2, {}}, {3, {}}, {4, {}}});

    REQUIRE_FALSE(g.remove_node(1).has_value());
    REQUIRE_FALSE(g.remove_node(99).has_value());
    REQUIRE(g.size() == 3);
}

TEST_CASE("add_edge ignores self references", "[graph]") {
    UndirectedGraph g(4);
    g.add_edge(1, 1);
    REQUIRE(g.empty());

    g.add_edge(1, 2);
    const auto before = g.nodes();
    g.add_edge(2, 2);
    REQUIRE(g.nodes() == before);

    // Duplicate edge is a no-op under set semantics
    g.add_edge(2, 1);
    REQUIRE(g.nodes() == before);
    check(g, {{1, {2}}, {2, {1}}});
}

TEST_CASE("set_node stores a self reference as given", "[graph]") {
    UndirectedGraph g(4);
    g.set_node(1, {1, 2});
    check(g, {{1, {1, 2}}, {2, {1}}});
    REQUIRE(g.check_symmetry().has_value());

    auto s = g.stats();
    REQUIRE(s.self_loops == 1);
    REQUIRE(s.n_edges == 2);

    g.set_node(1, {2});
    check(g, {{1, {2}}, {2, {1}}});
    REQUIRE(g.stats().self_loops == 0);

    auto former = g.remove_node(2);
    REQUIRE(former.has_value());
    check(g, {{1, {}}});
}

TEST_CASE("get_edges distinguishes isolated from absent", "[graph]") {
    UndirectedGraph g(4);
    REQUIRE(g.add_empty_node(3));
    const EdgeSet* e = g.get_edges(3);
    REQUIRE(e != nullptr);
    REQUIRE(e->empty());
    REQUIRE(g.get_edges(4) == nullptr);
}

TEST_CASE("degree above m_max is stored, not enforced", "[graph]") {
    UndirectedGraph g(2);
    auto r = g.add_node(0, {1, 2, 3, 4, 5});
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 5);
    REQUIRE(g.get_edges(0)->size() == 5);

    auto s = g.stats();
    REQUIRE(s.over_capacity == 1);
    REQUIRE(s.max_degree == 5);
}

TEST_CASE("stats and reachability", "[graph][stats]") {
    UndirectedGraph g(4);
    REQUIRE(g.add_node(0, {1, 2}).has_value());
    REQUIRE(g.add_node(3, {2}).has_value());
    REQUIRE(g.add_empty_node(9));
    g.add_edge(7, 8);

    auto s = g.stats();
    REQUIRE(s.n_nodes == 7);
    REQUIRE(s.n_edges == 4);
    REQUIRE(s.isolated_nodes == 1);
    REQUIRE(s.max_degree == 2);
    REQUIRE(s.self_loops == 0);

    REQUIRE(g.reachable_count(0) == 4);
    REQUIRE(g.reachable_count(7) == 2);
    REQUIRE(g.reachable_count(9) == 1);
    REQUIRE(g.reachable_count(42) == 0);

    REQUIRE(g.remove_node(2).has_value());
    REQUIRE(g.reachable_count(0) == 2);
    REQUIRE(g.reachable_count(3) == 1);
}

TEST_CASE("from_nodes adopts symmetric maps and rejects the rest", "[graph]") {
    UndirectedGraph::NodeMap ok{{1, {2}}, {2, {1}}, {3, {}}};
    auto g = UndirectedGraph::from_nodes(6, ok);
    REQUIRE(g.has_value());
    REQUIRE(g->m_max() == 6);
    REQUIRE(g->nodes() == ok);

    UndirectedGraph::NodeMap one_way{{1, {2}}, {2, {}}};
    auto bad = UndirectedGraph::from_nodes(6, one_way);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == error_code::data_integrity);
    REQUIRE(bad.error().component == "index.graph");

    UndirectedGraph::NodeMap dangling{{1, {2}}};
    auto bad2 = UndirectedGraph::from_nodes(6, dangling);
    REQUIRE_FALSE(bad2.has_value());
    REQUIRE(bad2.error().code == error_code::data_integrity);
}
