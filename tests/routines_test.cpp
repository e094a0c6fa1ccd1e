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
#include <grasp/event.h>
#include <grasp/routines.h>

#include "test_files.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

namespace Grasp::Test {
namespace fs = std::filesystem;
using Catch::Approx;
namespace {
struct ResourceLog : EventHandler {
    ResourceLog() : EventHandler(Event::verbosity_max) {}
    void onEvent(const Event& ev) override {
        if (const auto* res = event_cast<ResourceEvent>(ev)) {
            (res->isWrite() ? written : read).emplace_back(res->name);
        }
        else if (const auto* log = event_cast<LogEvent>(ev); log && log->isWarning()) {
            ++warnings;
        }
    }
    StringVec read;
    StringVec written;
    int       warnings = 0;
};
} // namespace

TEST_CASE("Split by components", "[routines]") {
    TempDir dir;
    auto    input = dir.file("graph.lp");
    SECTION("two components") {
        writeFile(input, "edge(a,b).\nedge(b,c).\nedge(x,y).\n");
        auto files = splitByComponents(input, dir.file("out_{}.lp"));
        REQUIRE(files == StringVec{dir.file("out_0.lp"), dir.file("out_1.lp")});
        REQUIRE(readFile(files[0]) == "edge(a,b).\nedge(b,c).\n");
        REQUIRE(readFile(files[1]) == "edge(x,y).\n");
        REQUIRE(dir.numFiles() == 3);
    }
    SECTION("isolated node is its own component") {
        writeFile(input, "edge(a,b).\nz.\n");
        auto files = splitByComponents(input, dir.file("out_{}.lp"));
        REQUIRE(files.size() == 2);
        REQUIRE(readFile(files[0]) == "edge(a,b).\n");
        REQUIRE(readFile(files[1]) == "node(z).\n");
    }
    SECTION("attributes follow their component") {
        writeFile(input, "edge(a,b).\ncolor(x,red).\nweight(a,b,2).\n");
        SplitOptions opts;
        opts.format = FactFormat("edge", "vertex");
        auto files  = splitByComponents(input, dir.file("c{}"), opts);
        REQUIRE(readFile(files[0]) == "edge(a,b).\nweight(a,b,2).\n");
        REQUIRE(readFile(files[1]) == "color(x,red).\n");
    }
    SECTION("default template") {
        writeFile(input, "edge(a,b).\nedge(c,d).\n");
        auto files = splitByComponents(input, "");
        REQUIRE(files == StringVec{dir.file("graph_0.lp"), dir.file("graph_1.lp")});
        REQUIRE(fs::exists(files[1]));
        REQUIRE(defaultSplitTemplate("g.lp") == "g_{}.lp");
    }
    SECTION("empty graph has no components") {
        writeFile(input, "% nothing\n");
        REQUIRE(splitByComponents(input, dir.file("out_{}.lp")).empty());
        REQUIRE(dir.numFiles() == 1);
    }
    SECTION("invalid template writes nothing") {
        writeFile(input, "edge(a,b).\nedge(x,y).\n");
        REQUIRE_THROWS_AS(splitByComponents(input, dir.file("out.lp")), std::invalid_argument);
        REQUIRE_THROWS_AS(splitByComponents(input, dir.file("out_{}_{}.lp")), std::invalid_argument);
        REQUIRE_THROWS_AS(splitByComponents(input, (dir.path / "missing" / "out_{}.lp").string()),
                          std::invalid_argument);
        REQUIRE(dir.numFiles() == 1);
    }
    SECTION("template is checked before input is read") {
        REQUIRE_THROWS_AS(splitByComponents(dir.file("missing.lp"), dir.file("out.lp")), std::invalid_argument);
        REQUIRE_THROWS_AS(splitByComponents(dir.file("missing.lp"), dir.file("out_{}.lp")), std::runtime_error);
    }
    SECTION("failure on one component writes none") {
        writeFile(input, "edge(a,b).\nedge(x,y).\n");
        fs::create_directory(dir.path / "out_1.lp");
        REQUIRE_THROWS_AS(splitByComponents(input, dir.file("out_{}.lp")), std::logic_error);
        REQUIRE_FALSE(fs::exists(dir.path / "out_0.lp"));
        REQUIRE(dir.numFiles() == 2);
    }
    SECTION("strict mode") {
        writeFile(input, "edge(a,b).\nedge(x,y\n");
        SplitOptions opts;
        REQUIRE(splitByComponents(input, dir.file("out_{}.lp"), opts).size() == 1);
        opts.parser.enableStrict();
        REQUIRE_THROWS_AS(splitByComponents(input, dir.file("strict_{}.lp"), opts), std::runtime_error);
        REQUIRE_FALSE(fs::exists(dir.path / "strict_0.lp"));
    }
    SECTION("resources are reported") {
        writeFile(input, "edge(a,b).\nedge(x,y).\nbad\n");
        ResourceLog log;
        auto        files = splitByComponents(input, dir.file("out_{}.lp"), SplitOptions(), &log);
        REQUIRE(log.read == StringVec{input});
        REQUIRE(log.written == files);
        REQUIRE(log.warnings == 2);
    }
}

TEST_CASE("Split graph", "[routines]") {
    TempDir dir;
    Graph   g;
    g.addEdge("x", "y");
    g.addNode("z");
    g.addEdge("a", "x");
    auto files = splitByComponents(g, dir.file("part{}.lp"), FactFormat("link", "vertex"));
    REQUIRE(files.size() == 2);
    REQUIRE(readFile(files[0]) == "link(a,x).\nlink(x,y).\n");
    REQUIRE(readFile(files[1]) == "vertex(z).\n");
    REQUIRE_THROWS_AS(splitByComponents(g, dir.file("part.lp")), std::invalid_argument);
    REQUIRE_THROWS_AS(splitByComponents(g, dir.file("p{}.lp"), FactFormat("Link")), std::invalid_argument);
    REQUIRE(dir.numFiles() == 2);
}

TEST_CASE("Normalize", "[routines]") {
    TempDir dir;
    auto    input  = dir.file("graph.lp");
    auto    output = dir.file("clean.lp");
    writeFile(input, "% a graph\n"
                     "edge(b,a). edge(c,b).\n"
                     "\n"
                     "this is not a fact\n"
                     "#const n=3.\n"
                     "color(a,red).\r\n"
                     "z.\n");
    const std::string clean = "color(a,red).\nnode(z).\nedge(a,b).\nedge(b,c).\n";
    SECTION("output is canonical") {
        normalize(input, output);
        REQUIRE(readFile(output) == clean);
        REQUIRE(dir.numFiles() == 2);
    }
    SECTION("normalization is idempotent") {
        normalize(input, output);
        auto again = dir.file("again.lp");
        normalize(output, again);
        REQUIRE(readFile(again) == readFile(output));
    }
    SECTION("in place") {
        normalize(input, "");
        REQUIRE(readFile(input) == clean);
        REQUIRE(dir.numFiles() == 1);
    }
    SECTION("edge predicate is rewritten") {
        writeFile(input, "link(a,b).\nlink(b,c).\n");
        NormalizeOptions opts;
        opts.edgePredicate = "link";
        normalize(input, output, opts);
        REQUIRE(readFile(output) == "link(a,b).\nlink(b,c).\n");
        opts.targetEdgePredicate = "edge";
        normalize(input, output, opts);
        REQUIRE(readFile(output) == "edge(a,b).\nedge(b,c).\n");
        opts.edgePredicate       = "edge";
        opts.targetEdgePredicate = "arc";
        opts.nodePredicate       = "vertex";
        writeFile(input, "edge(a,b).\nq.\n");
        normalize(input, output, opts);
        REQUIRE(readFile(output) == "vertex(q).\narc(a,b).\n");
    }
    SECTION("invalid configuration is rejected before anything is written") {
        NormalizeOptions opts;
        opts.targetEdgePredicate = "Arc";
        REQUIRE_THROWS_AS(normalize(input, output, opts), std::invalid_argument);
        opts = NormalizeOptions();
        REQUIRE_THROWS_AS(normalize(input, dir.path.string(), opts), std::invalid_argument);
        REQUIRE_THROWS_AS(normalize(input, (dir.path / "missing" / "x.lp").string(), opts), std::invalid_argument);
        REQUIRE(dir.numFiles() == 1);
    }
    SECTION("missing input") {
        REQUIRE_THROWS_AS(normalize(dir.file("missing.lp"), output), std::runtime_error);
        REQUIRE_FALSE(fs::exists(output));
    }
    SECTION("strict mode keeps target untouched") {
        writeFile(output, "old\n");
        NormalizeOptions opts;
        opts.parser.enableStrict();
        REQUIRE_THROWS_AS(normalize(input, output, opts), std::runtime_error);
        REQUIRE(readFile(output) == "old\n");
    }
    SECTION("unrepresentable graph keeps target untouched") {
        writeFile(input, "edge(a,b).\ncolor(a,x).\n");
        writeFile(output, "old\n");
        NormalizeOptions opts;
        opts.targetEdgePredicate = "color";
        REQUIRE_THROWS_AS(normalize(input, output, opts), std::invalid_argument);
        REQUIRE(readFile(output) == "old\n");
        REQUIRE(dir.numFiles() == 2);
    }
}

TEST_CASE("Graph files", "[routines]") {
    TempDir dir;
    Graph   g;
    g.addEdge("a", "b");
    g.addNode("\"c d\"");
    auto fname = dir.file("g.lp");
    graphToFile(g, fname);
    REQUIRE(readFile(fname) == "node(\"c d\").\nedge(a,b).\n");
    REQUIRE(graphFromFile(fname, "edge").equals(g));
    REQUIRE_THROWS_AS(graphFromFile(fname, "Edge"), std::invalid_argument);
    REQUIRE_THROWS_AS(graphFromFile(dir.file("none.lp"), "edge"), std::runtime_error);
}

TEST_CASE("Staged files", "[routines]") {
    TempDir dir;
    Graph   g1, g2;
    g1.addEdge("a", "b");
    g2.addNode("z");
    auto first  = dir.file("first.lp");
    auto second = dir.file("second.lp");
    writeFile(first, "old\n");
    StagedFiles out;
    out.add(first, g1, FactFormat());
    out.add(second, g2, FactFormat());
    REQUIRE(out.size() == 2);
    REQUIRE(out.targets() == StringVec{first, second});
    REQUIRE(fs::exists(StagedFiles::stagingName(first)));
    REQUIRE(readFile(first) == "old\n");
    SECTION("commit replaces all targets") {
        ResourceLog log;
        out.commit(&log);
        REQUIRE(out.empty());
        REQUIRE(readFile(first) == "edge(a,b).\n");
        REQUIRE(readFile(second) == "node(z).\n");
        REQUIRE(log.written == StringVec{first, second});
        REQUIRE(dir.numFiles() == 2);
    }
    SECTION("failed commit restores replaced targets") {
        fs::remove(StagedFiles::stagingName(second));
        ResourceLog log;
        REQUIRE_THROWS_AS(out.commit(&log), std::runtime_error);
        REQUIRE(readFile(first) == "old\n");
        REQUIRE_FALSE(fs::exists(second));
        REQUIRE_FALSE(fs::exists(StagedFiles::backupName(first)));
        REQUIRE_FALSE(fs::exists(StagedFiles::stagingName(first)));
        REQUIRE(log.written.empty());
        REQUIRE(dir.numFiles() == 1);
    }
    SECTION("discard keeps targets") {
        out.discard();
        REQUIRE(out.empty());
        REQUIRE(readFile(first) == "old\n");
        REQUIRE(dir.numFiles() == 1);
    }
}

TEST_CASE("Graph info", "[routines]") {
    SECTION("empty graph") {
        auto info = graphInfo(Graph());
        REQUIRE(info.nodes == 0);
        REQUIRE(info.components == 0);
        REQUIRE(info.minDegree == 0);
        REQUIRE(info.avgDegree == Approx(0.0));
    }
    SECTION("triangle with tail and isolated node") {
        Graph g;
        g.addEdge("a", "b");
        g.addEdge("b", "c");
        g.addEdge("c", "a");
        g.addEdge("c", "d");
        g.addNode("z");
        auto info = graphInfo(g);
        REQUIRE(info.nodes == 5);
        REQUIRE(info.edges == 4);
        REQUIRE(info.components == 2);
        REQUIRE(info.isolated == 1);
        REQUIRE(info.minDegree == 0);
        REQUIRE(info.maxDegree == 3);
        REQUIRE(info.avgDegree == Approx(8.0 / 5.0));
        REQUIRE(info.avgClustering == Approx((1.0 + 1.0 + 1.0 / 3.0) / 5.0));
    }
}
} // namespace Grasp::Test
