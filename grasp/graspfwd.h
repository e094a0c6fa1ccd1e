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

#include <cstdint>
#include <string>
#include <vector>
/*!
 * \file
 * \brief Forward declarations of important grasp types.
 */

//! Root namespace for all types and functions of libgrasp.
namespace Grasp {
struct Atom;
struct FactFormat;
struct ParserOptions;
class LineParser;
class FactReader;
class AttributeStore;
class Graph;
class GraphBuilder;
class FactSequence;
class StagedFiles;
class EventHandler;
struct Event;
struct GraphInfo;

using NodeId    = uint32_t;
using EdgeId    = uint32_t;
using NodeVec   = std::vector<NodeId>;
using TermVec   = std::vector<std::string>;
using AtomVec   = std::vector<Atom>;
using StringVec = std::vector<std::string>;

//! Kinds of graph entities that can carry attributes.
enum class EntityKind : uint8_t { node = 0, edge = 1 };
} // namespace Grasp
