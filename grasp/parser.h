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

#include <istream>
#include <string>
#include <string_view>

/*!
 * \file
 * \brief Defines the parser for the line-oriented fact format.
 */
namespace Grasp {
/////////////////////////////////////////////////////////////////////////////////////////
// PARSING BASE
/////////////////////////////////////////////////////////////////////////////////////////
/*!
 * \addtogroup input
 */
//@{

//! Options controlling how invalid lines are handled.
struct ParserOptions {
    enum Mode : uint8_t {
        mode_lenient = 0, //!< Skip invalid lines and report a warning.
        mode_strict  = 1  //!< Fail on the first invalid line.
    };
    constexpr ParserOptions() = default;
    constexpr explicit ParserOptions(Mode m) : mode(m) {}
    [[nodiscard]] constexpr bool strict() const { return mode == mode_strict; }

    ParserOptions& enableStrict() {
        mode = mode_strict;
        return *this;
    }
    Mode mode{mode_lenient};
};

//! Parser for a single line of facts.
/*!
 * A line contains zero or more facts, optionally followed by a comment
 * starting with '%'. Lines starting with '#' are directives and are ignored.
 * A line with a syntax error is rejected as a whole.
 */
class LineParser {
public:
    enum Status {
        status_ok    = 0, //!< At least one fact was parsed.
        status_empty = 1, //!< Blank line, comment, or directive.
        status_error = 2  //!< Syntax error - see error() and column().
    };
    //! Parses the facts in line and appends them to out.
    /*!
     * \note On status_error, out is left unchanged.
     */
    Status parse(std::string_view line, AtomVec& out);

    [[nodiscard]] const char* error() const { return error_; }
    //! 1-based column of the last error.
    [[nodiscard]] uint32_t column() const { return column_; }

private:
    bool  skipWs();
    bool  match(char c);
    bool  matchFact(Atom& out);
    bool  matchName(std::string& out);
    bool  matchTerm(std::string& out);
    bool  matchNumber(std::string& out);
    bool  matchString(std::string& out);
    bool  fail(const char* what);
    [[nodiscard]] char peek() const { return pos_ < line_.size() ? line_[pos_] : '\0'; }

    std::string_view line_;
    std::size_t      pos_{0};
    const char*      error_{nullptr};
    uint32_t         column_{0};
};

//! Reads facts from a stream line by line.
/*!
 * In lenient mode, invalid lines are skipped and reported as warnings to the
 * optional event handler. In strict mode, the first invalid line raises an
 * exception naming the line.
 */
class FactReader {
public:
    explicit FactReader(std::istream& in, const ParserOptions& opts = ParserOptions(),
                        EventHandler* handler = nullptr);
    FactReader(const FactReader&)            = delete;
    FactReader& operator=(const FactReader&) = delete;

    //! Sets the name used for the input in messages.
    void setName(std::string_view name) { name_ = name; }
    //! Extracts the next atom.
    /*!
     * \return false if the input is exhausted.
     */
    bool next(Atom& out);

    //! Number of the line read last.
    [[nodiscard]] uint32_t line() const { return line_; }
    //! Number of invalid lines skipped so far.
    [[nodiscard]] uint32_t skipped() const { return skipped_; }

private:
    bool fill();

    std::istream* in_;
    EventHandler* handler_;
    LineParser    parser_;
    AtomVec       pending_;
    std::string   buffer_;
    std::string   name_;
    std::size_t   front_{0};
    uint32_t      line_{0};
    uint32_t      skipped_{0};
    ParserOptions opts_;
};

//! Reads all facts from in.
AtomVec readFacts(std::istream& in, const ParserOptions& opts = ParserOptions(), EventHandler* handler = nullptr);
//@}

} // namespace Grasp
