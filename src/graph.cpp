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

#include <potassco/error.h>

#include <algorithm>
#include <iterator>

namespace Grasp {
/////////////////////////////////////////////////////////////////////////////////////////
// class AttributeStore
/////////////////////////////////////////////////////////////////////////////////////////
bool AttributeStore::add(EntityKind kind, uint32_t id, std::string_view name, TermVec value) {
    auto& entries = map_[key(kind, id)];
    auto  it      = std::find_if(entries.begin(), entries.end(), [&](const Entry& e) { return e.name == name; });
    if (it == entries.end()) {
        it = entries.insert(entries.end(), Entry{std::string(name), {}});
    }
    else if (std::find(it->values.begin(), it->values.end(), value) != it->values.end()) {
        return false;
    }
    it->values.push_back(std::move(value));
    ++size_;
    return true;
}

std::span<const AttributeStore::Entry> AttributeStore::get(EntityKind kind, uint32_t id) const {
    if (auto it = map_.find(key(kind, id)); it != map_.end()) {
        return it->second;
    }
    return {};
}

const std::vector<TermVec>* AttributeStore::find(EntityKind kind, uint32_t id, std::string_view name) const {
    for (const auto& e : get(kind, id)) {
        if (e.name == name) {
            return &e.values;
        }
    }
    return nullptr;
}
/////////////////////////////////////////////////////////////////////////////////////////
// class Graph
/////////////////////////////////////////////////////////////////////////////////////////
NodeId Graph::addNode(std::string_view name) {
    auto [it, added] = ids_.try_emplace(std::string(name), numNodes());
    if (added) {
        names_.emplace_back(name);
        adj_.emplace_back();
    }
    return it->second;
}

EdgeId Graph::addEdge(std::string_view a, std::string_view b) {
    auto x = addNode(a);
    return addEdge(x, addNode(b));
}

EdgeId Graph::addEdge(NodeId a, NodeId b) {
    POTASSCO_CHECK_PRE(a < numNodes() && b < numNodes(), "invalid node");
    auto [it, added] = edgeIds_.try_emplace(edgeKey(a, b), numEdges());
    if (added) {
        edges_.push_back(Edge{a, b});
        adj_[a].push_back(b);
        if (a != b) {
            adj_[b].push_back(a);
        }
    }
    return it->second;
}

bool Graph::addAttribute(EntityKind kind, uint32_t id, std::string_view name, TermVec value) {
    POTASSCO_CHECK_PRE(id < (kind == EntityKind::node ? numNodes() : numEdges()), "invalid entity");
    return attrs_.add(kind, id, name, std::move(value));
}

NodeId Graph::find(std::string_view name) const {
    auto it = ids_.find(std::string(name));
    return it != ids_.end() ? it->second : no_node;
}

EdgeId Graph::findEdge(NodeId a, NodeId b) const {
    auto it = edgeIds_.find(edgeKey(a, b));
    return it != edgeIds_.end() ? it->second : no_edge;
}

EdgeId Graph::findEdge(std::string_view a, std::string_view b) const {
    auto x = find(a);
    auto y = find(b);
    return x != no_node && y != no_node ? findEdge(x, y) : no_edge;
}

uint32_t Graph::degree(NodeId n) const {
    return static_cast<uint32_t>(adj_[n].size()) + static_cast<uint32_t>(findEdge(n, n) != no_edge);
}

double Graph::clustering(NodeId n) const {
    NodeVec adj;
    std::copy_if(adj_[n].begin(), adj_[n].end(), std::back_inserter(adj), [n](NodeId x) { return x != n; });
    if (adj.size() < 2) {
        return 0.0;
    }
    uint64_t links = 0;
    for (auto i = adj.begin(), end = adj.end(); i != end; ++i) {
        for (auto j = i + 1; j != end; ++j) { links += findEdge(*i, *j) != no_edge; }
    }
    auto k = static_cast<double>(adj.size());
    return (2.0 * static_cast<double>(links)) / (k * (k - 1.0));
}

std::vector<NodeVec> Graph::components() const {
    std::vector<NodeVec> ret;
    std::vector<bool>    seen(numNodes(), false);
    NodeVec              stack;
    for (NodeId root = 0; root != numNodes(); ++root) {
        if (seen[root]) {
            continue;
        }
        auto& comp = ret.emplace_back();
        seen[root] = true;
        stack.assign(1, root);
        while (not stack.empty()) {
            auto n = stack.back();
            stack.pop_back();
            comp.push_back(n);
            for (auto x : adj_[n]) {
                if (not seen[x]) {
                    seen[x] = true;
                    stack.push_back(x);
                }
            }
        }
        std::sort(comp.begin(), comp.end());
    }
    return ret;
}

Graph Graph::subgraph(std::span<const NodeId> nodes) const {
    Graph   sub;
    NodeVec map(numNodes(), no_node);
    for (auto n : nodes) {
        map[n] = sub.addNode(names_[n]);
        for (const auto& [name, values] : attributes(EntityKind::node, n)) {
            for (const auto& v : values) { sub.addAttribute(EntityKind::node, map[n], name, v); }
        }
    }
    for (EdgeId e = 0; e != numEdges(); ++e) {
        auto a = map[edges_[e].first], b = map[edges_[e].second];
        if (a == no_node || b == no_node) {
            continue;
        }
        auto id = sub.addEdge(a, b);
        for (const auto& [name, values] : attributes(EntityKind::edge, e)) {
            for (const auto& v : values) { sub.addAttribute(EntityKind::edge, id, name, v); }
        }
    }
    return sub;
}

namespace {
// Returns whether the attributes in lhs are all contained in rhs and both have the same size.
bool sameAttributes(std::span<const AttributeStore::Entry> lhs, const AttributeStore& rhs, EntityKind kind,
                    uint32_t id) {
    if (lhs.size() != rhs.get(kind, id).size()) {
        return false;
    }
    for (const auto& [name, values] : lhs) {
        const auto* other = rhs.find(kind, id, name);
        if (not other || other->size() != values.size()) {
            return false;
        }
        for (const auto& v : values) {
            if (std::find(other->begin(), other->end(), v) == other->end()) {
                return false;
            }
        }
    }
    return true;
}
} // namespace

bool Graph::equals(const Graph& other) const {
    if (numNodes() != other.numNodes() || numEdges() != other.numEdges() ||
        attrs_.size() != other.attrs_.size()) {
        return false;
    }
    for (NodeId n = 0; n != numNodes(); ++n) {
        auto x = other.find(names_[n]);
        if (x == no_node || not sameAttributes(attributes(EntityKind::node, n), other.attrs_, EntityKind::node, x)) {
            return false;
        }
    }
    for (EdgeId e = 0; e != numEdges(); ++e) {
        auto x = other.findEdge(names_[edges_[e].first], names_[edges_[e].second]);
        if (x == no_edge || not sameAttributes(attributes(EntityKind::edge, e), other.attrs_, EntityKind::edge, x)) {
            return false;
        }
    }
    return true;
}

} // namespace Grasp
