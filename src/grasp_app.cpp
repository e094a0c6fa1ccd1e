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
#include <grasp/cli/grasp_app.h>

#include <grasp/graph.h>

#include <potassco/error.h>
#include <potassco/program_opts/string_convert.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <utility>

namespace Grasp {
/////////////////////////////////////////////////////////////////////////////////////////
// Some helpers
/////////////////////////////////////////////////////////////////////////////////////////
#define WRITE_STDERR(TYPE, MSG, ...)                                                                                   \
    do {                                                                                                               \
        char buffer[256];                                                                                              \
        auto len = formatMessage(buffer, Potassco::Application::TYPE, (MSG) POTASSCO_OPTARGS(__VA_ARGS__));            \
        fwrite(buffer, sizeof(char), len, stderr);                                                                     \
        fflush(stderr);                                                                                                \
    } while (0)
/////////////////////////////////////////////////////////////////////////////////////////
// GraspAppOptions
/////////////////////////////////////////////////////////////////////////////////////////
namespace Cli {
void GraspAppOptions::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    using namespace Potassco::ProgramOptions;
    OptionGroup basic("Basic Options");
    auto        applyOpt = [this](const std::string& name, const std::string& value) { return apply(name, value); };
    basic.addOptions()                                                                                 //
        ("mode,m", parse(applyOpt)->arg("<mode>")->defaultsTo("clean"),                                //
         "Run in %A mode\n"                                                                            //
         "      clean: Rewrite graph in normalized form\n"                                             //
         "      split: Write each connected component to its own file\n"                               //
         "      info : Print basic statistics of graph")                                               //
        ("output,o", storeTo(output)->arg("<file>"),                                                   //
         "Write to %A (clean) or to files named by %A with '{}' as index (split)")                     //
        ("edge,e", storeTo(edge)->arg("<pred>"), "Read edges from atoms over predicate %A [edge]")     //
        ("edge-out", storeTo(edgeOut)->arg("<pred>"), "Write edges as atoms over predicate %A")        //
        ("node", storeTo(node)->arg("<pred>"), "Write isolated nodes as atoms over predicate %A [node]") //
        ("strict", flag(strict), "Fail on first invalid line instead of skipping it")                  //
        ("file,f,@2", storeTo(input), "Input file");                                                   //
    root.add(basic);
}
bool GraspAppOptions::apply(const std::string& name, const std::string& value) {
    using Potassco::Parse::eqIgnoreCase;
    if (name == "mode") {
        constexpr std::pair<const char*, Mode> modes[] = {
            {"clean", mode_clean}, {"split", mode_split}, {"info", mode_info}};
        auto it = std::find_if(std::begin(modes), std::end(modes),
                               [&value](const auto& m) { return eqIgnoreCase(value.c_str(), m.first); });
        if (it != std::end(modes)) {
            mode = it->second;
            return true;
        }
    }
    return false;
}
void GraspAppOptions::validate() const {
    POTASSCO_CHECK(not input.empty(), std::errc::invalid_argument, "no input file given!");
    checkPredicate(edge, "'edge'");
    checkPredicate(node, "'node'");
    if (not edgeOut.empty()) {
        checkPredicate(edgeOut, "'edge-out'");
    }
    POTASSCO_CHECK(mode != mode_info || output.empty(), std::errc::invalid_argument,
                   "'output': not supported in info mode!");
    if (mode == mode_split && not output.empty()) {
        checkSplitTemplate(output);
    }
}
NormalizeOptions GraspAppOptions::normalizeOptions() const {
    NormalizeOptions ret;
    ret.edgePredicate       = edge;
    ret.targetEdgePredicate = edgeOut;
    ret.nodePredicate       = node;
    ret.parser              = parserOptions();
    return ret;
}
SplitOptions GraspAppOptions::splitOptions() const {
    SplitOptions ret;
    ret.format = FactFormat(edge, node);
    ret.parser = parserOptions();
    return ret;
}
/////////////////////////////////////////////////////////////////////////////////////////
// GraspApp
/////////////////////////////////////////////////////////////////////////////////////////
GraspApp::GraspApp() = default;

const char* GraspApp::getPositional(const std::string&) const { return "file"; }

void GraspApp::initOptions(Potassco::ProgramOptions::OptionContext& root) { opts_.initOptions(root); }

void GraspApp::validateOptions(const Potassco::ProgramOptions::OptionContext&,
                               const Potassco::ProgramOptions::ParsedOptions&,
                               const Potassco::ProgramOptions::ParsedValues&) {
    setExitCode(exit_no_run);
    POTASSCO_CHECK(opts_.mode != GraspAppOptions::mode_split || opts_.edgeOut.empty() || opts_.edgeOut == opts_.edge,
                   std::errc::invalid_argument, "'edge-out': not supported in split mode!");
    opts_.validate();
    setExitCode(exit_ok);
}

void GraspApp::setup() {
    auto verb = static_cast<Event::Verbosity>(std::min(getVerbose(), static_cast<uint32_t>(Event::verbosity_max)));
    setVerbosity(Event::subsystem_parse, verb);
    setVerbosity(Event::subsystem_build, verb);
    setVerbosity(Event::subsystem_write, verb);
}

void GraspApp::run() {
    switch (opts_.mode) {
        case GraspAppOptions::mode_split:
            for (const auto& f : splitByComponents(opts_.input, opts_.output, opts_.splitOptions(), this)) {
                printf("%s\n", f.c_str());
            }
            break;
        case GraspAppOptions::mode_info:
            printInfo(graphInfo(graphFromFile(opts_.input, opts_.edge, opts_.parserOptions(), this)));
            break;
        default: normalize(opts_.input, opts_.output, opts_.normalizeOptions(), this); break;
    }
    fflush(stdout);
}

void GraspApp::printInfo(const GraphInfo& info) const {
    printf("%-14s: %s\n", "Graph", opts_.input.c_str());
    printf("%-14s: %u\n", "Nodes", info.nodes);
    printf("%-14s: %u\n", "Edges", info.edges);
    printf("%-14s: %u\n", "Components", info.components);
    printf("%-14s: %u\n", "Isolated", info.isolated);
    printf("%-14s: %.3f (min: %u max: %u)\n", "Degree", info.avgDegree, info.minDegree, info.maxDegree);
    printf("%-14s: %.3f\n", "Avg clustering", info.avgClustering);
}

void GraspApp::onVersion(const std::string& version) {
    printf("%s\n", version.c_str());
    printf("%s\n", GRASP_LEGAL);
}

bool GraspApp::onUnhandledException(const char* msg) {
    setExitCode(getExitCode() == exit_no_run ? exit_no_run : exit_error);
    fprintf(stderr, "%s\n", msg);
    return false;
}

void GraspApp::onEvent(const Event& ev) {
    if (const auto* log = event_cast<LogEvent>(ev)) {
        if (log->isWarning()) {
            WRITE_STDERR(message_warning, "%s\n", log->msg);
        }
        else {
            WRITE_STDERR(message_info, "%s\n", log->msg);
        }
    }
    else if (const auto* res = event_cast<ResourceEvent>(ev)) {
        WRITE_STDERR(message_info, "%s '%s': %u nodes, %u edges\n", res->isWrite() ? "Wrote" : "Read", res->name,
                     res->nodes, res->edges);
    }
}
} // namespace Cli
} // namespace Grasp
