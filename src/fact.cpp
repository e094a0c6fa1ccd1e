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
#include <grasp/fact.h>

#include <potassco/error.h>

#include <ostream>
#include <sstream>

namespace Grasp {
std::size_t scanString(std::string_view text, const char** error, std::size_t* errorPos) {
    auto fail = [&](const char* what, std::size_t pos) -> std::size_t {
        if (error) {
            *error = what;
        }
        if (errorPos) {
            *errorPos = pos;
        }
        return 0;
    };
    if (text.empty() || text.front() != '"') {
        return fail("'\"' expected", 0);
    }
    for (std::size_t pos = 1; pos < text.size();) {
        switch (char c = text[pos++]) {
            case '"' : return pos;
            case '\n':
            case '\r': return fail("line break in string", pos - 1);
            case '\\':
                if (pos == text.size()) {
                    return fail("unterminated string", pos);
                }
                if (c = text[pos]; c != '"' && c != '\\' && c != 'n') {
                    return fail("invalid escape sequence", pos);
                }
                ++pos;
                break;
            default: break;
        }
    }
    return fail("unterminated string", text.size());
}

bool isIdentifier(std::string_view str) {
    auto pos = str.find_first_not_of('_');
    if (pos == std::string_view::npos || not isLower(str[pos])) {
        return false;
    }
    for (auto c : str.substr(pos + 1)) {
        if (not isAlnum(c)) {
            return false;
        }
    }
    return true;
}

TermType termType(std::string_view term) {
    if (term.empty()) {
        return TermType::invalid;
    }
    if (isIdentifier(term)) {
        return TermType::identifier;
    }
    if (term.front() == '"') {
        return scanString(term) == term.size() ? TermType::string : TermType::invalid;
    }
    auto digits = term.substr(term.front() == '-');
    if (digits.empty()) {
        return TermType::invalid;
    }
    for (auto c : digits) {
        if (not isDigit(c)) {
            return TermType::invalid;
        }
    }
    return TermType::number;
}

void checkPredicate(std::string_view pred, const char* what) {
    POTASSCO_CHECK(isIdentifier(pred), std::errc::invalid_argument, "%s: '%.*s' is not a valid predicate name", what,
                   static_cast<int>(pred.size()), pred.data());
}

void FactFormat::validate() const {
    checkPredicate(edgePredicate, "edge predicate");
    checkPredicate(nodePredicate, "node predicate");
}

std::ostream& writeAtom(std::ostream& os, std::string_view pred, const TermVec& args) {
    os << pred;
    if (not args.empty()) {
        char sep = '(';
        for (const auto& arg : args) {
            os << sep << arg;
            sep = ',';
        }
        os << ')';
    }
    return os << '.';
}

std::string toString(const Atom& atom) {
    std::ostringstream str;
    writeAtom(str, atom.predicate, atom.args);
    return str.str();
}

} // namespace Grasp
