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

#include <grasp/fact.h>
#include <grasp/graph.h>

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <string>

/*!
 * \file
 * \brief Defines the conversion of a graph into a sequence of facts.
 */
namespace Grasp {

//! A lazy, restartable sequence of the facts describing a graph.
/*!
 * Facts are produced in the following order:
 *  -# for each node in insertion order either its attribute facts or, if it
 *     has neither attributes nor incident edges, a fact over the node predicate,
 *  -# each edge once, with endpoints and edges ordered lexicographically,
 *  -# the attribute facts of each edge, in the same edge order.
 *
 * Reading the produced facts with the same edge predicate yields a graph
 * that is equal to the written one.
 *
 * \note The graph must not be modified while the sequence is in use.
 */
class FactSequence {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::string;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const std::string*;
        using reference         = const std::string&;

        const_iterator() = default;

        reference       operator*() const { return line_; }
        pointer         operator->() const { return &line_; }
        const_iterator& operator++() {
            next();
            return *this;
        }
        const_iterator operator++(int) {
            auto t = *this;
            next();
            return t;
        }
        friend bool operator==(const const_iterator& lhs, const const_iterator& rhs) {
            bool done = lhs.phase_ == phase_done;
            return done == (rhs.phase_ == phase_done) && (done || lhs.index_ == rhs.index_);
        }

    private:
        friend class FactSequence;
        enum Phase : uint32_t { phase_nodes = 0, phase_edges = 1, phase_edge_attrs = 2, phase_done = 3 };
        explicit const_iterator(const FactSequence* seq, Phase p);
        void                next();
        bool                nextAttribute(EntityKind kind, uint32_t pos);
        const FactSequence* seq_{nullptr};
        std::string         line_;
        Phase               phase_{phase_done};
        uint32_t            pos_{0};   // node or position in sorted edges
        uint32_t            entry_{0}; // attribute entry of current entity
        uint32_t            value_{0}; // value of current entry
        uint32_t            index_{0}; // number of current line
    };

    //! Creates the sequence of facts for g.
    /*!
     * \throws std::invalid_argument if the format is invalid or if g contains
     *         names or attributes that would not read back unchanged.
     */
    FactSequence(const Graph& g, const FactFormat& format);
    //! The sequence refers to its graph, which therefore must outlive it.
    FactSequence(Graph&&, const FactFormat&) = delete;

    [[nodiscard]] const_iterator    begin() const { return const_iterator(this, const_iterator::phase_nodes); }
    [[nodiscard]] const_iterator    end() const { return const_iterator(this, const_iterator::phase_done); }
    [[nodiscard]] const FactFormat& format() const { return format_; }

    //! Writes all facts to os, one per line.
    std::ostream& write(std::ostream& os) const;

private:
    struct SortedEdge {
        EdgeId id;
        NodeId lo;
        NodeId hi;
    };
    void checkGraph() const;
    void formatNode(std::string& out, NodeId n) const;
    void formatEdge(std::string& out, uint32_t pos) const;
    void formatAttribute(std::string& out, EntityKind kind, uint32_t pos, const AttributeStore::Entry& e,
                         const TermVec& value) const;

    const Graph*            graph_;
    FactFormat              format_;
    std::vector<SortedEdge> edges_;
};

//! Writes the facts of g to os.
std::ostream& writeGraph(std::ostream& os, const Graph& g, const FactFormat& format = FactFormat());

} // namespace Grasp
