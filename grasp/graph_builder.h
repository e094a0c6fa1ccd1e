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

#include <iosfwd>
#include <string>
#include <string_view>

/*!
 * \file
 * \brief Defines a class for building a graph from a sequence of atoms.
 */
namespace Grasp {

//! Assembles a graph from atoms.
/*!
 * - An atom over the edge predicate with exactly two arguments adds an edge.
 * - An atom with exactly one argument or without arguments declares a node.
 * - Any other atom is an attribute of the node named by its first argument,
 *   or of the edge named by its first two arguments if such an edge exists
 *   once all atoms were added.
 *
 * Usage:
 * \code
 * GraphBuilder builder("edge");
 * for (const auto& atom : atoms) { builder.add(atom); }
 * Graph g = builder.end();
 * \endcode
 */
class GraphBuilder {
public:
    //! Creates a builder recognizing edges by the given predicate.
    /*!
     * \throws std::invalid_argument if edgePredicate is not a valid predicate name.
     */
    explicit GraphBuilder(std::string_view edgePredicate = default_edge_predicate);

    [[nodiscard]] const std::string& edgePredicate() const { return edge_; }

    //! Adds the given atom to the graph under construction.
    void add(const Atom& atom);
    void add(Atom&& atom);
    //! Resolves pending attributes and returns the finished graph.
    /*!
     * The builder is reset and can be used for a new graph afterwards.
     */
    Graph end();

    //! Number of atoms added since the last call to end().
    [[nodiscard]] uint32_t numAtoms() const { return atoms_; }

private:
    struct Pending {
        NodeId node;
        Atom   atom;
    };
    Graph                graph_;
    std::vector<Pending> pending_;
    std::string          edge_;
    uint32_t             atoms_{0};
};

//! Builds a graph from all facts extracted by reader.
Graph buildGraph(FactReader& reader, std::string_view edgePredicate);
//! Builds a graph from all facts in in.
Graph buildGraph(std::istream& in, std::string_view edgePredicate, const ParserOptions& opts,
                 EventHandler* handler = nullptr);

} // namespace Grasp
