#include <catch2/catch.hpp>
#include <weft/graph.hpp>
#include <string>

using namespace weft;

static size_t index_of(const std::vector<size_t>& order, size_t id) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] == id) return i;
    }
    return order.size();
}

static bool linked(const Graph<int>& g, size_t from, size_t to) {
    for (const auto& e : g.successors(from)) {
        if (e.to == to) return true;
    }
    return false;
}

// ===== Basic Graph operations =====

TEST_CASE("graph add node and query", "[graph]") {
    Graph<std::string> g;
    auto a = g.add_node("File['/tmp/one']");
    auto b = g.add_node("Service['ssh']");
    REQUIRE(a == 0);
    REQUIRE(b == 1);
    REQUIRE(g.node(a) == "File['/tmp/one']");
    REQUIRE(g.node(b) == "Service['ssh']");
}

TEST_CASE("graph successors keep edge data in insertion order", "[graph]") {
    Graph<std::string, int> g;
    auto a = g.add_node("A");
    auto b = g.add_node("B");
    auto c = g.add_node("C");
    g.add_edge(a, b, 7);
    g.add_edge(a, c, 8);
    g.add_edge(b, c, 9);

    REQUIRE(g.successors(a).size() == 2);
    REQUIRE(g.successors(a)[0].to == b);
    REQUIRE(g.successors(a)[1].to == c);
    REQUIRE(g.successors(a)[1].data == 8);
    REQUIRE(g.successors(b)[0].from == b);
    REQUIRE(g.successors(c).empty());
}

// ===== Topological sort =====

TEST_CASE("topo sort respects every edge", "[graph]") {
    // diamond: a -> b, a -> c, b -> d, c -> d
    Graph<int> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    auto c = g.add_node(2);
    auto d = g.add_node(3);
    g.add_edge(a, b);
    g.add_edge(a, c);
    g.add_edge(b, d);
    g.add_edge(c, d);

    auto r = g.topological_sort();
    REQUIRE(r.is_ok());
    auto& order = r.value();
    REQUIRE(order.size() == 4);
    REQUIRE(index_of(order, a) < index_of(order, b));
    REQUIRE(index_of(order, a) < index_of(order, c));
    REQUIRE(index_of(order, b) < index_of(order, d));
    REQUIRE(index_of(order, c) < index_of(order, d));
}

TEST_CASE("topo sort of unrelated nodes keeps insertion order", "[graph]") {
    Graph<int> g;
    for (int i = 0; i < 6; ++i) g.add_node(i);
    auto r = g.topological_sort();
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<size_t>{0, 1, 2, 3, 4, 5});
}

TEST_CASE("topo sort breaks ties by smallest id", "[graph]") {
    // 3 -> 0 forces 3 first among {0, 3}; 1 and 2 are free
    Graph<int> g;
    for (int i = 0; i < 4; ++i) g.add_node(i);
    g.add_edge(3, 0);
    g.add_edge(2, 1);

    auto r = g.topological_sort();
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<size_t>{2, 1, 3, 0});
}

TEST_CASE("topo sort is identical across runs", "[graph]") {
    Graph<int> g;
    for (int i = 0; i < 20; ++i) g.add_node(i);
    for (size_t i = 0; i + 3 < 20; i += 2) g.add_edge(i + 3, i);

    auto first = g.topological_sort();
    REQUIRE(first.is_ok());
    for (int run = 0; run < 5; ++run) {
        REQUIRE(g.topological_sort().value() == first.value());
    }
}

TEST_CASE("topo sort counts parallel edges", "[graph]") {
    Graph<int> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    auto c = g.add_node(2);
    g.add_edge(c, b);
    g.add_edge(c, b);
    g.add_edge(b, a);
    auto r = g.topological_sort();
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<size_t>{2, 1, 0});
}

TEST_CASE("topo sort fails on cycle", "[graph]") {
    Graph<int> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b);
    g.add_edge(b, a);
    auto r = g.topological_sort();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::Cycle);
}

// ===== Cycle witnesses =====

TEST_CASE("find_cycle on acyclic graph is empty", "[graph]") {
    Graph<int> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b);
    REQUIRE(g.find_cycle().empty());
}

TEST_CASE("find_cycle returns a closed walk", "[graph]") {
    // 0 -> 1 -> 2 -> 3 -> 1, plus an unrelated node
    Graph<int> g;
    for (int i = 0; i < 5; ++i) g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(2, 3);
    g.add_edge(3, 1);

    auto cycle = g.find_cycle();
    REQUIRE(cycle == std::vector<size_t>{1, 2, 3, 1});
    for (size_t i = 0; i + 1 < cycle.size(); ++i) {
        REQUIRE(linked(g, cycle[i], cycle[i + 1]));
    }
}

TEST_CASE("find_cycle reports a self loop", "[graph]") {
    Graph<int> g;
    g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(b, b);
    REQUIRE(g.find_cycle() == std::vector<size_t>{1, 1});
}

TEST_CASE("find_cycle handles long chains without recursion", "[graph]") {
    Graph<int> g;
    const int n = 50000;
    for (int i = 0; i < n; ++i) g.add_node(i);
    for (int i = 0; i + 1 < n; ++i) g.add_edge(i, i + 1);
    REQUIRE(g.find_cycle().empty());
    g.add_edge(n - 1, 0);
    auto cycle = g.find_cycle();
    REQUIRE(cycle.size() == static_cast<size_t>(n) + 1);
    REQUIRE(cycle.front() == 0);
    REQUIRE(cycle.back() == 0);
}
