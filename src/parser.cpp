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
#include <grasp/parser.h>

#include <grasp/event.h>

#include <potassco/error.h>

namespace Grasp {
/////////////////////////////////////////////////////////////////////////////////////////
// LineParser
/////////////////////////////////////////////////////////////////////////////////////////
LineParser::Status LineParser::parse(std::string_view line, AtomVec& out) {
    line_   = line;
    pos_    = 0;
    error_  = nullptr;
    column_ = 0;
    if (not line_.empty() && line_.back() == '\r') {
        line_.remove_suffix(1);
    }
    auto size = out.size();
    if (skipWs() && peek() == '#') {
        return status_empty;
    }
    while (skipWs()) {
        Atom atom;
        if (not matchFact(atom)) {
            out.resize(size);
            return status_error;
        }
        out.push_back(std::move(atom));
    }
    return out.size() != size ? status_ok : status_empty;
}

// Skips blanks and a trailing comment.
// Returns whether there is more input on the line.
bool LineParser::skipWs() {
    for (char c; (c = peek()) == ' ' || c == '\t' || c == '\f' || c == '\v';) { ++pos_; }
    if (peek() == '%') {
        pos_ = line_.size();
    }
    return pos_ < line_.size();
}

bool LineParser::match(char c) {
    if (peek() == c && pos_ < line_.size()) {
        ++pos_;
        return true;
    }
    return false;
}

bool LineParser::fail(const char* what) {
    error_  = what;
    column_ = static_cast<uint32_t>(pos_ + 1);
    return false;
}

// <fact> ::= <name> [ "(" <term> { "," <term> } ")" ] "."
bool LineParser::matchFact(Atom& out) {
    if (not matchName(out.predicate)) {
        return fail("predicate name expected");
    }
    skipWs();
    if (match('(')) {
        do {
            skipWs();
            if (not matchTerm(out.args.emplace_back())) {
                return false;
            }
            skipWs();
        } while (match(','));
        if (not match(')')) {
            return fail(peek() == '(' ? "nested terms not supported" : "')' expected");
        }
        skipWs();
    }
    return match('.') || fail("'.' expected");
}

// <name> ::= { "_" } <lower> { <alnum> }
bool LineParser::matchName(std::string& out) {
    auto start = pos_;
    while (peek() == '_') { ++pos_; }
    if (not isLower(peek())) {
        pos_ = start;
        return false;
    }
    while (isAlnum(peek())) { ++pos_; }
    out.assign(line_.substr(start, pos_ - start));
    return true;
}

bool LineParser::matchTerm(std::string& out) {
    if (char c = peek(); c == '"') {
        return matchString(out);
    }
    else if (c == '-' || isDigit(c)) {
        return matchNumber(out);
    }
    return matchName(out) || fail("term expected");
}

// <number> ::= [ "-" ] <digit> { <digit> }
bool LineParser::matchNumber(std::string& out) {
    auto start = pos_;
    match('-');
    if (not isDigit(peek())) {
        return fail("digit expected");
    }
    while (isDigit(peek())) { ++pos_; }
    if (isAlnum(peek())) {
        return fail("invalid number");
    }
    out.assign(line_.substr(start, pos_ - start));
    return true;
}

bool LineParser::matchString(std::string& out) {
    const char* err = nullptr;
    std::size_t at  = 0;
    auto        len = scanString(line_.substr(pos_), &err, &at);
    if (len == 0) {
        pos_ += at;
        return fail(err);
    }
    out.assign(line_.substr(pos_, len));
    pos_ += len;
    return true;
}
/////////////////////////////////////////////////////////////////////////////////////////
// FactReader
/////////////////////////////////////////////////////////////////////////////////////////
FactReader::FactReader(std::istream& in, const ParserOptions& opts, EventHandler* handler)
    : in_(&in)
    , handler_(handler)
    , name_("<input>")
    , opts_(opts) {}

bool FactReader::next(Atom& out) {
    while (front_ == pending_.size()) {
        if (not fill()) {
            return false;
        }
    }
    out = std::move(pending_[front_++]);
    return true;
}

bool FactReader::fill() {
    pending_.clear();
    front_ = 0;
    if (not std::getline(*in_, buffer_)) {
        POTASSCO_CHECK(not in_->bad(), std::errc::io_error, "'%s': read error after line %u", name_.c_str(), line_);
        return false;
    }
    ++line_;
    if (parser_.parse(buffer_, pending_) == LineParser::status_error) {
        POTASSCO_CHECK(not opts_.strict(), std::errc::illegal_byte_sequence, "'%s': parse error in line %u:%u: %s",
                       name_.c_str(), line_, parser_.column(), parser_.error());
        ++skipped_;
        warnFmt(handler_, Event::subsystem_parse, "'%s': skipping invalid line %u:%u: %s", name_.c_str(), line_,
                parser_.column(), parser_.error());
    }
    return true;
}

AtomVec readFacts(std::istream& in, const ParserOptions& opts, EventHandler* handler) {
    AtomVec    ret;
    FactReader reader(in, opts, handler);
    for (Atom atom; reader.next(atom);) { ret.push_back(std::move(atom)); }
    return ret;
}

} // namespace Grasp
