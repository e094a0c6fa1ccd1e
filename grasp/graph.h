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
#pragma once

#include <grasp/graspfwd.h>

#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

/*!
 * \file
 * \brief Defines the undirected graph with attributes on nodes and edges.
 */
namespace Grasp {

/**
 * \defgroup graph Graph
 * \brief Graph representation and graph algorithms.
 */
//@{

//! Named-value storage per graph entity.
/*!
 * Attributes are keyed by (entity-kind, entity-id, attribute-name). Each key
 * maps to the list of value tuples recorded for it, in insertion order and
 * without duplicates. Attribute names of an entity are also kept in
 * insertion order.
 */
class AttributeStore {
public:
    //! An attribute name and its recorded values.
    struct Entry {
        std::string          name;
        std::vector<TermVec> values;
    };
    using EntryVec = std::vector<Entry>;

    //! Records value for the given attribute.
    /*!
     * \return false if the value was already recorded.
     */
    bool add(EntityKind kind, uint32_t id, std::string_view name, TermVec value);
    //! Returns the attributes of the given entity in insertion order.
    [[nodiscard]] std::span<const Entry> get(EntityKind kind, uint32_t id) const;
    //! Returns the values of the given attribute or nullptr if it does not exist.
    [[nodiscard]] const std::vector<TermVec>* find(EntityKind kind, uint32_t id, std::string_view name) const;
    [[nodiscard]] bool has(EntityKind kind, uint32_t id) const { return not get(kind, id).empty(); }
    //! Number of (entity, name, value) triples stored.
    [[nodiscard]] uint32_t size() const { return size_; }
    [[nodiscard]] bool     empty() const { return size_ == 0; }

private:
    static uint64_t key(EntityKind kind, uint32_t id) {
        return (static_cast<uint64_t>(id) << 1u) | static_cast<uint64_t>(kind);
    }
    std::unordered_map<uint64_t, EntryVec> map_;
    uint32_t                               size_{0};
};

//! An undirected edge between two nodes.
/*!
 * Endpoints are stored in the order given when the edge was first added.
 */
struct Edge {
    NodeId first;
    NodeId second;
};

//! An undirected graph with named nodes and attributes.
/*!
 * Nodes are identified by their name and keep their insertion order.
 * An edge (a,b) is the same as (b,a) and is stored once.
 */
class Graph {
public:
    static constexpr NodeId no_node = UINT32_MAX;
    static constexpr EdgeId no_edge = UINT32_MAX;

    //! Adds a node with the given name unless it already exists.
    /*!
     * \return The id of the node.
     */
    NodeId addNode(std::string_view name);
    //! Adds the undirected edge (a, b) creating its endpoints if necessary.
    /*!
     * \return The id of the edge - the existing one if (a,b) or (b,a) was already added.
     */
    EdgeId addEdge(std::string_view a, std::string_view b);
    EdgeId addEdge(NodeId a, NodeId b);
    //! Records an attribute value for the given node or edge.
    bool addAttribute(EntityKind kind, uint32_t id, std::string_view name, TermVec value);

    [[nodiscard]] uint32_t           numNodes() const { return static_cast<uint32_t>(names_.size()); }
    [[nodiscard]] uint32_t           numEdges() const { return static_cast<uint32_t>(edges_.size()); }
    [[nodiscard]] bool               empty() const { return names_.empty(); }
    [[nodiscard]] const std::string& name(NodeId n) const { return names_[n]; }
    [[nodiscard]] const Edge&        edge(EdgeId e) const { return edges_[e]; }
    [[nodiscard]] std::span<const Edge> edges() const { return edges_; }
    //! Returns the id of the node with the given name or no_node.
    [[nodiscard]] NodeId find(std::string_view name) const;
    //! Returns the id of the edge (a,b) or no_edge.
    [[nodiscard]] EdgeId findEdge(NodeId a, NodeId b) const;
    [[nodiscard]] EdgeId findEdge(std::string_view a, std::string_view b) const;
    //! Returns the neighbors of n - n itself is contained if it has a self-loop.
    [[nodiscard]] std::span<const NodeId> neighbors(NodeId n) const { return adj_[n]; }
    [[nodiscard]] const AttributeStore&   attributes() const { return attrs_; }
    [[nodiscard]] std::span<const AttributeStore::Entry> attributes(EntityKind kind, uint32_t id) const {
        return attrs_.get(kind, id);
    }

    //! Returns the degree of n - a self-loop counts twice.
    [[nodiscard]] uint32_t degree(NodeId n) const;
    //! Returns the local clustering coefficient of n.
    /*!
     * The fraction of pairs of distinct neighbors of n that are adjacent.
     * Self-loops are ignored. Nodes with less than two neighbors have coefficient 0.
     */
    [[nodiscard]] double clustering(NodeId n) const;
    //! Computes the connected components of this graph.
    /*!
     * Components are ordered by their first node and the nodes of each
     * component are listed in insertion order.
     */
    [[nodiscard]] std::vector<NodeVec> components() const;
    //! Returns the subgraph induced by the given nodes.
    /*!
     * The subgraph contains the given nodes (in the given order), all edges
     * between them, and their node and edge attributes.
     */
    [[nodiscard]] Graph subgraph(std::span<const NodeId> nodes) const;

    //! Returns whether both graphs have the same nodes, edges, and attributes.
    /*!
     * Node names identify nodes, i.e. insertion order is not relevant.
     */
    [[nodiscard]] bool equals(const Graph& other) const;

private:
    using NameMap = std::unordered_map<std::string, NodeId>;
    using EdgeMap = std::unordered_map<uint64_t, EdgeId>;
    static uint64_t edgeKey(NodeId a, NodeId b) {
        if (a > b) {
            std::swap(a, b);
        }
        return (static_cast<uint64_t>(a) << 32u) | b;
    }

    StringVec            names_;
    NameMap              ids_;
    std::vector<Edge>    edges_;
    EdgeMap              edgeIds_;
    std::vector<NodeVec> adj_;
    AttributeStore       attrs_;
};
//@}

} // namespace Grasp
