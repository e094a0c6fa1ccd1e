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
#include <grasp/graph_writer.h>

#include <potassco/error.h>

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <utility>

namespace Grasp {
namespace {
void appendFact(std::string& out, std::string_view pred, std::initializer_list<std::string_view> head,
                const TermVec& tail = {}) {
    out.assign(pred);
    char sep = '(';
    auto arg = [&](std::string_view term) {
        out += sep;
        out.append(term);
        sep = ',';
    };
    std::for_each(head.begin(), head.end(), arg);
    std::for_each(tail.begin(), tail.end(), arg);
    if (sep == ',') {
        out += ')';
    }
    out += '.';
}
void checkTerms(const TermVec& terms, const char* attr, const std::string& owner) {
    for (const auto& t : terms) {
        POTASSCO_CHECK(termType(t) != TermType::invalid, std::errc::invalid_argument,
                       "attribute '%s' of '%s': '%s' is not a valid term", attr, owner.c_str(), t.c_str());
    }
}
} // namespace
/////////////////////////////////////////////////////////////////////////////////////////
// FactSequence
/////////////////////////////////////////////////////////////////////////////////////////
FactSequence::FactSequence(const Graph& g, const FactFormat& format) : graph_(&g), format_(format) {
    format_.validate();
    edges_.reserve(g.numEdges());
    for (EdgeId e = 0; e != g.numEdges(); ++e) {
        auto [a, b] = g.edge(e);
        if (g.name(b) < g.name(a)) {
            std::swap(a, b);
        }
        edges_.push_back(SortedEdge{e, a, b});
    }
    std::sort(edges_.begin(), edges_.end(), [&g](const SortedEdge& lhs, const SortedEdge& rhs) {
        if (int c = g.name(lhs.lo).compare(g.name(rhs.lo)); c != 0) {
            return c < 0;
        }
        return g.name(lhs.hi) < g.name(rhs.hi);
    });
    checkGraph();
}

// Rejects graphs whose facts would not read back to the same graph.
void FactSequence::checkGraph() const {
    const auto& g    = *graph_;
    const auto& edge = format_.edgePredicate;
    for (NodeId n = 0; n != g.numNodes(); ++n) {
        const auto& node = g.name(n);
        POTASSCO_CHECK(termType(node) != TermType::invalid, std::errc::invalid_argument,
                       "node '%s' is not a valid term", node.c_str());
        for (const auto& [name, values] : g.attributes(EntityKind::node, n)) {
            checkPredicate(name, "attribute");
            for (const auto& v : values) {
                POTASSCO_CHECK(not v.empty(), std::errc::invalid_argument,
                               "attribute '%s' of node '%s' requires a value", name.c_str(), node.c_str());
                POTASSCO_CHECK(name != edge || v.size() != 1, std::errc::invalid_argument,
                               "attribute '%s' of node '%s' clashes with edge predicate", name.c_str(), node.c_str());
                auto other = g.find(v[0]);
                POTASSCO_CHECK(other == Graph::no_node || g.findEdge(n, other) == Graph::no_edge,
                               std::errc::invalid_argument, "attribute '%s' of node '%s' is ambiguous with edge (%s,%s)",
                               name.c_str(), node.c_str(), node.c_str(), v[0].c_str());
                checkTerms(v, name.c_str(), node);
            }
        }
    }
    for (const auto& [id, lo, hi] : edges_) {
        for (const auto& [name, values] : g.attributes(EntityKind::edge, id)) {
            checkPredicate(name, "attribute");
            for (const auto& v : values) {
                POTASSCO_CHECK(name != edge || not v.empty(), std::errc::invalid_argument,
                               "attribute '%s' of edge (%s,%s) clashes with edge predicate", name.c_str(),
                               g.name(lo).c_str(), g.name(hi).c_str());
                checkTerms(v, name.c_str(), g.name(lo));
            }
        }
    }
}

void FactSequence::formatNode(std::string& out, NodeId n) const {
    appendFact(out, format_.nodePredicate, {graph_->name(n)});
}

void FactSequence::formatEdge(std::string& out, uint32_t pos) const {
    const auto& e = edges_[pos];
    appendFact(out, format_.edgePredicate, {graph_->name(e.lo), graph_->name(e.hi)});
}

void FactSequence::formatAttribute(std::string& out, EntityKind kind, uint32_t pos, const AttributeStore::Entry& e,
                                   const TermVec& value) const {
    if (kind == EntityKind::node) {
        appendFact(out, e.name, {graph_->name(pos)}, value);
    }
    else {
        appendFact(out, e.name, {graph_->name(edges_[pos].lo), graph_->name(edges_[pos].hi)}, value);
    }
}

std::ostream& FactSequence::write(std::ostream& os) const {
    for (const auto& line : *this) { os << line << '\n'; }
    return os;
}
/////////////////////////////////////////////////////////////////////////////////////////
// FactSequence::const_iterator
/////////////////////////////////////////////////////////////////////////////////////////
FactSequence::const_iterator::const_iterator(const FactSequence* seq, Phase p) : seq_(seq), phase_(p) {
    if (phase_ != phase_done) {
        index_ = UINT32_MAX;
        next();
    }
}

void FactSequence::const_iterator::next() {
    const auto& g = *seq_->graph_;
    const auto  m = static_cast<uint32_t>(seq_->edges_.size());
    ++index_;
    for (;;) {
        switch (phase_) {
            case phase_nodes:
                if (pos_ == g.numNodes()) {
                    phase_ = phase_edges;
                    pos_   = 0;
                    break;
                }
                if (g.attributes().has(EntityKind::node, pos_)) {
                    if (nextAttribute(EntityKind::node, pos_)) {
                        return;
                    }
                }
                else if (entry_ == 0 && g.neighbors(pos_).empty()) {
                    seq_->formatNode(line_, pos_);
                    entry_ = 1;
                    return;
                }
                ++pos_;
                entry_ = value_ = 0;
                break;
            case phase_edges:
                if (pos_ == m) {
                    phase_ = phase_edge_attrs;
                    pos_   = 0;
                    break;
                }
                seq_->formatEdge(line_, pos_++);
                return;
            case phase_edge_attrs:
                if (pos_ == m) {
                    phase_ = phase_done;
                    break;
                }
                if (nextAttribute(EntityKind::edge, pos_)) {
                    return;
                }
                ++pos_;
                entry_ = value_ = 0;
                break;
            default: line_.clear(); return;
        }
    }
}

bool FactSequence::const_iterator::nextAttribute(EntityKind kind, uint32_t pos) {
    auto id    = kind == EntityKind::node ? pos : seq_->edges_[pos].id;
    auto attrs = seq_->graph_->attributes(kind, id);
    for (; entry_ < attrs.size(); ++entry_, value_ = 0) {
        if (const auto& e = attrs[entry_]; value_ < e.values.size()) {
            seq_->formatAttribute(line_, kind, pos, e, e.values[value_++]);
            return true;
        }
    }
    return false;
}

std::ostream& writeGraph(std::ostream& os, const Graph& g, const FactFormat& format) {
    return FactSequence(g, format).write(os);
}

} // namespace Grasp
