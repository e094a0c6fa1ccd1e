//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Grasp.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <grasp/graph.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

namespace Grasp::Test {
using Catch::Approx;

TEST_CASE("Attribute store", "[graph]") {
    AttributeStore store;
    REQUIRE(store.empty());
    REQUIRE(store.add(EntityKind::node, 0, "color", {"red"}));
    REQUIRE(store.add(EntityKind::node, 0, "color", {"blue"}));
    REQUIRE_FALSE(store.add(EntityKind::node, 0, "color", {"red"}));
    REQUIRE(store.add(EntityKind::node, 0, "size", {"1", "2"}));
    REQUIRE(store.add(EntityKind::edge, 0, "color", {"green"}));
    REQUIRE(store.size() == 4);

    auto attrs = store.get(EntityKind::node, 0);
    REQUIRE(attrs.size() == 2);
    REQUIRE(attrs[0].name == "color");
    REQUIRE(attrs[0].values == std::vector<TermVec>{{"red"}, {"blue"}});
    REQUIRE(attrs[1].name == "size");

    REQUIRE(store.find(EntityKind::edge, 0, "color")->size() == 1);
    REQUIRE(store.find(EntityKind::edge, 0, "size") == nullptr);
    REQUIRE(store.has(EntityKind::edge, 0));
    REQUIRE_FALSE(store.has(EntityKind::node, 1));
    REQUIRE(store.get(EntityKind::edge, 1).empty());
}

TEST_CASE("Graph structure", "[graph]") {
    Graph g;
    REQUIRE(g.empty());
    auto ab = g.addEdge("a", "b");
    REQUIRE(g.numNodes() == 2);
    REQUIRE(g.numEdges() == 1);

    SECTION("edges are undirected") {
        REQUIRE(g.addEdge("b", "a") == ab);
        REQUIRE(g.numEdges() == 1);
        REQUIRE(g.findEdge("b", "a") == ab);
        REQUIRE(g.findEdge(g.find("a"), g.find("b")) == ab);
        REQUIRE(g.neighbors(g.find("b")).size() == 1);
    }
    SECTION("nodes keep insertion order") {
        g.addNode("z");
        g.addEdge("c", "a");
        REQUIRE(g.name(0) == "a");
        REQUIRE(g.name(1) == "b");
        REQUIRE(g.name(2) == "z");
        REQUIRE(g.name(3) == "c");
        REQUIRE(g.addNode("b") == 1);
    }
    SECTION("lookup of unknown entities") {
        REQUIRE(g.find("x") == Graph::no_node);
        REQUIRE(g.findEdge("a", "x") == Graph::no_edge);
        g.addNode("c");
        REQUIRE(g.findEdge("a", "c") == Graph::no_edge);
    }
    SECTION("self-loop") {
        auto aa = g.addEdge("a", "a");
        REQUIRE(aa != ab);
        REQUIRE(g.neighbors(g.find("a")).size() == 2);
        REQUIRE(g.degree(g.find("a")) == 3);
        REQUIRE(g.degree(g.find("b")) == 1);
    }
    SECTION("attributes require existing entities") {
        REQUIRE(g.addAttribute(EntityKind::node, 1, "color", {"red"}));
        REQUIRE(g.addAttribute(EntityKind::edge, ab, "weight", {"3"}));
        REQUIRE_THROWS_AS(g.addAttribute(EntityKind::edge, 1, "weight", {"3"}), std::logic_error);
        REQUIRE_THROWS_AS(g.addAttribute(EntityKind::node, 7, "color", {"red"}), std::logic_error);
        REQUIRE(g.attributes().size() == 2);
    }
}

TEST_CASE("Graph algorithms", "[graph]") {
    Graph g;
    g.addEdge("a", "b");
    g.addEdge("b", "c");
    g.addEdge("x", "y");
    g.addNode("z");
    g.addEdge("c", "a");
    g.addEdge("c", "d");

    SECTION("components partition the nodes") {
        auto comps = g.components();
        REQUIRE(comps.size() == 3);
        REQUIRE(comps[0] == NodeVec{g.find("a"), g.find("b"), g.find("c"), g.find("d")});
        REQUIRE(comps[1] == NodeVec{g.find("x"), g.find("y")});
        REQUIRE(comps[2] == NodeVec{g.find("z")});
        std::size_t n = 0;
        for (const auto& c : comps) { n += c.size(); }
        REQUIRE(n == g.numNodes());
    }
    SECTION("empty graph has no components") {
        REQUIRE(Graph().components().empty());
    }
    SECTION("degree and clustering") {
        REQUIRE(g.degree(g.find("c")) == 3);
        REQUIRE(g.degree(g.find("z")) == 0);
        REQUIRE(g.clustering(g.find("a")) == Approx(1.0));
        REQUIRE(g.clustering(g.find("c")) == Approx(1.0 / 3.0));
        REQUIRE(g.clustering(g.find("d")) == Approx(0.0));
        REQUIRE(g.clustering(g.find("z")) == Approx(0.0));
    }
    SECTION("clustering ignores self-loops") {
        g.addEdge("a", "a");
        REQUIRE(g.clustering(g.find("a")) == Approx(1.0));
    }
    SECTION("subgraph") {
        g.addAttribute(EntityKind::node, g.find("a"), "color", {"red"});
        g.addAttribute(EntityKind::edge, g.findEdge("a", "b"), "weight", {"2"});
        g.addAttribute(EntityKind::edge, g.findEdge("x", "y"), "weight", {"5"});
        auto sub = g.subgraph(g.components()[0]);
        REQUIRE(sub.numNodes() == 4);
        REQUIRE(sub.numEdges() == 4);
        REQUIRE(sub.name(0) == "a");
        REQUIRE(sub.attributes().size() == 2);
        REQUIRE(sub.attributes().find(EntityKind::edge, sub.findEdge("b", "a"), "weight") != nullptr);
        REQUIRE(sub.find("x") == Graph::no_node);
    }
    SECTION("equality ignores insertion order") {
        Graph h;
        h.addNode("z");
        h.addEdge("d", "c");
        h.addEdge("a", "c");
        h.addEdge("y", "x");
        h.addEdge("c", "b");
        h.addEdge("b", "a");
        REQUIRE(g.equals(h));
        REQUIRE(h.equals(g));
        h.addAttribute(EntityKind::node, h.find("z"), "color", {"red"});
        REQUIRE_FALSE(g.equals(h));
        g.addAttribute(EntityKind::node, g.find("z"), "color", {"red"});
        REQUIRE(g.equals(h));
        h.addEdge("z", "d");
        REQUIRE_FALSE(g.equals(h));
    }
}
} // namespace Grasp::Test
