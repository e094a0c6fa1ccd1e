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
#include <grasp/graph_builder.h>

#include <grasp/parser.h>

#include <utility>

namespace Grasp {

GraphBuilder::GraphBuilder(std::string_view edgePredicate) : edge_(edgePredicate) {
    checkPredicate(edge_, "edge predicate");
}

void GraphBuilder::add(const Atom& atom) { add(Atom(atom)); }

void GraphBuilder::add(Atom&& atom) {
    ++atoms_;
    if (atom.arity() == 2 && atom.predicate == edge_) {
        graph_.addEdge(atom.args[0], atom.args[1]);
    }
    else if (atom.arity() == 0) {
        graph_.addNode(atom.predicate);
    }
    else if (atom.arity() == 1) {
        graph_.addNode(atom.args[0]);
    }
    else {
        // owner is only known once all edges are added
        auto node = graph_.addNode(atom.args[0]);
        pending_.push_back(Pending{node, std::move(atom)});
    }
}

Graph GraphBuilder::end() {
    for (auto& [node, atom] : pending_) {
        const auto& args  = atom.args;
        auto        other = graph_.find(args[1]);
        if (auto e = other != Graph::no_node ? graph_.findEdge(node, other) : Graph::no_edge; e != Graph::no_edge) {
            graph_.addAttribute(EntityKind::edge, e, atom.predicate, TermVec(args.begin() + 2, args.end()));
        }
        else {
            graph_.addAttribute(EntityKind::node, node, atom.predicate, TermVec(args.begin() + 1, args.end()));
        }
    }
    pending_.clear();
    atoms_ = 0;
    return std::exchange(graph_, Graph());
}

Graph buildGraph(FactReader& reader, std::string_view edgePredicate) {
    GraphBuilder builder(edgePredicate);
    for (Atom atom; reader.next(atom);) { builder.add(std::move(atom)); }
    return builder.end();
}

Graph buildGraph(std::istream& in, std::string_view edgePredicate, const ParserOptions& opts, EventHandler* handler) {
    FactReader reader(in, opts, handler);
    return buildGraph(reader, edgePredicate);
}

} // namespace Grasp
