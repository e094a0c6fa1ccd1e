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

#include <grasp/config.h>
#include <grasp/event.h>
#include <grasp/routines.h>

#include <potassco/application.h>
#include <potassco/program_opts/typed_value.h>

#include <string>

namespace Grasp::Cli {
/////////////////////////////////////////////////////////////////////////////////////////
// grasp exit codes
/////////////////////////////////////////////////////////////////////////////////////////
enum ExitCode {
    exit_ok     = 0,  /*!< Operation completed.                                 */
    exit_error  = 65, /*!< Operation was interrupted by an error.               */
    exit_no_run = 128 /*!< Operation not started because of command line error. */
};
/////////////////////////////////////////////////////////////////////////////////////////
// grasp application options
/////////////////////////////////////////////////////////////////////////////////////////
struct GraspAppOptions {
    enum Mode { mode_clean = 0, mode_split = 1, mode_info = 2 };
    bool apply(const std::string& name, const std::string& value);
    void initOptions(Potassco::ProgramOptions::OptionContext& root);
    //! Throws std::invalid_argument if the options are not consistent.
    void validate() const;

    [[nodiscard]] NormalizeOptions normalizeOptions() const;
    [[nodiscard]] SplitOptions     splitOptions() const;
    [[nodiscard]] ParserOptions    parserOptions() const {
        return strict ? ParserOptions(ParserOptions::mode_strict) : ParserOptions();
    }

    std::string input;                                // input file
    std::string output;                               // target file or template - empty for default
    std::string edge{default_edge_predicate};         // edge predicate of input
    std::string edgeOut;                              // edge predicate of output - empty for same as input
    std::string node{default_node_predicate};         // predicate for isolated nodes
    Mode        mode   = mode_clean;
    bool        strict = false;
};
/////////////////////////////////////////////////////////////////////////////////////////
// grasp application
/////////////////////////////////////////////////////////////////////////////////////////
// Standalone application for converting, cleaning, and splitting graph fact files.
class GraspApp
    : public Potassco::Application
    , public EventHandler {
public:
    GraspApp();
    [[nodiscard]] const char* getName() const override { return "grasp"; }
    [[nodiscard]] const char* getVersion() const override { return GRASP_VERSION; }
    [[nodiscard]] const char* getUsage() const override {
        return "[options] <file>\n"
               "Clean, split, or describe the graph given as facts in <file>";
    }

protected:
    // -------------------------------------------------------------------------------------------
    // Application functions
    [[nodiscard]] HelpOpt     getHelpOption() const override { return {"Print {1=basic|2=full} help and exit", 2}; }
    [[nodiscard]] const char* getPositional(const std::string& value) const override;

    void initOptions(Potassco::ProgramOptions::OptionContext& root) override;
    void validateOptions(const Potassco::ProgramOptions::OptionContext& root,
                         const Potassco::ProgramOptions::ParsedOptions& parsed,
                         const Potassco::ProgramOptions::ParsedValues&  values) override;
    void setup() override;
    void run() override;
    void onVersion(const std::string& version) override;
    bool onUnhandledException(const char* msg) override;
    // -------------------------------------------------------------------------------------------
    // Event handler
    void onEvent(const Event& ev) override;

private:
    void printInfo(const GraphInfo& info) const;

    GraspAppOptions opts_;
};
} // namespace Grasp::Cli
