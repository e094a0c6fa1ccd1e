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

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

/*!
 * \file
 * \brief Defines the atom type and the vocabulary of the fact format.
 *
 * A fact is a line of the form <tt>predicate(arg1,...,argN).</tt> where each
 * argument is a bare identifier, an integer literal, or a quoted string.
 * Arguments are stored in their canonical source form so that writing an
 * atom reproduces it exactly.
 */
namespace Grasp {

//! Predicate used for connectivity if nothing else is configured.
inline constexpr std::string_view default_edge_predicate = "edge";
//! Predicate used for isolated nodes if nothing else is configured.
inline constexpr std::string_view default_node_predicate = "node";

//! A parsed fact: a predicate name and its ordered argument terms.
struct Atom {
    Atom() = default;
    Atom(std::string pred, TermVec terms) : predicate(std::move(pred)), args(std::move(terms)) {}

    [[nodiscard]] uint32_t arity() const { return static_cast<uint32_t>(args.size()); }

    friend bool operator==(const Atom&, const Atom&) = default;

    std::string predicate;
    TermVec     args;
};

//! Predicates used when mapping a graph to facts.
/*!
 * The edge predicate is configured independently for reading and writing
 * so that a single pass can rename the edge relation.
 */
struct FactFormat {
    FactFormat() = default;
    explicit FactFormat(std::string_view edge, std::string_view node = default_node_predicate)
        : edgePredicate(edge)
        , nodePredicate(node) {}

    //! Throws std::invalid_argument if one of the predicates is not an identifier.
    void validate() const;

    std::string edgePredicate{default_edge_predicate};
    std::string nodePredicate{default_node_predicate};
};

//! Character classes of the fact format.
constexpr bool isLower(char c) { return c >= 'a' && c <= 'z'; }
constexpr bool isDigit(char c) { return c >= '0' && c <= '9'; }
constexpr bool isAlnum(char c) { return isLower(c) || isDigit(c) || (c >= 'A' && c <= 'Z') || c == '_' || c == '\''; }

//! Returns the length of the quoted string at the start of text or 0 if there is none.
/*!
 * <string> ::= '"' { <char> | "\" ( '"' | "\" | "n" ) } '"'
 *
 * A <char> is any character except '"', '\\', and line breaks.
 * \param error If not null, receives a description of the problem on failure.
 * \param errorPos If not null, receives the offset of the problem on failure.
 */
[[nodiscard]] std::size_t scanString(std::string_view text, const char** error = nullptr,
                                     std::size_t* errorPos = nullptr);

//! Kinds of terms supported as fact arguments.
enum class TermType : uint8_t { identifier, number, string, invalid };

//! Returns the type of the given term text.
[[nodiscard]] TermType termType(std::string_view term);
//! Returns whether str is a valid predicate or constant name.
[[nodiscard]] bool isIdentifier(std::string_view str);
//! Throws std::invalid_argument naming what if pred is not a valid predicate name.
void checkPredicate(std::string_view pred, const char* what);

//! Writes the atom pred(args...) followed by a period to os.
std::ostream& writeAtom(std::ostream& os, std::string_view pred, const TermVec& args);
//! Returns pred(args...). as a string.
[[nodiscard]] std::string toString(const Atom& atom);

} // namespace Grasp
