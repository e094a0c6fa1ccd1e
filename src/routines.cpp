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
#include <grasp/routines.h>

#include <grasp/event.h>
#include <grasp/graph_builder.h>
#include <grasp/graph_writer.h>

#include <potassco/error.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <system_error>

namespace Grasp {
namespace fs = std::filesystem;
namespace {
constexpr std::string_view slot_marker = "{}";
constexpr const char*      staging_ext = ".grasp-tmp";
constexpr const char*      backup_ext  = ".grasp-bak";

// Checks that fname names a file in an existing directory.
void checkTarget(const std::string& fname) {
    fs::path   p(fname);
    const auto dir = p.parent_path();
    POTASSCO_CHECK(p.has_filename(), std::errc::invalid_argument, "'%s': target is not a file name", fname.c_str());
    POTASSCO_CHECK(dir.empty() || fs::is_directory(dir), std::errc::invalid_argument,
                   "'%s': target directory does not exist", fname.c_str());
    POTASSCO_CHECK(not fs::is_directory(p), std::errc::invalid_argument, "'%s': target is a directory", fname.c_str());
}
} // namespace

/////////////////////////////////////////////////////////////////////////////////////////
// StagedFiles
/////////////////////////////////////////////////////////////////////////////////////////
StagedFiles::~StagedFiles() { discard(); }

std::string StagedFiles::stagingName(const std::string& target) { return target + staging_ext; }
std::string StagedFiles::backupName(const std::string& target) { return target + backup_ext; }

void StagedFiles::add(const std::string& target, const Graph& g, const FactFormat& format) {
    checkTarget(target);
    FactSequence facts(g, format);
    files_.push_back(File{target, g.numNodes(), g.numEdges(), false, false});
    std::ofstream out(stagingName(target), std::ios::out | std::ios::trunc);
    POTASSCO_CHECK(out.is_open(), std::errc::io_error, "'%s': could not open output file!", target.c_str());
    facts.write(out).flush();
    POTASSCO_CHECK(out.good(), std::errc::io_error, "'%s': error writing output file!", target.c_str());
}

void StagedFiles::commit(EventHandler* handler) {
    std::error_code ec;
    std::string     failed;
    for (auto& f : files_) {
        if (fs::exists(f.target, ec)) {
            fs::rename(f.target, backupName(f.target), ec);
            f.backup = not ec;
        }
        if (not ec) {
            fs::rename(stagingName(f.target), f.target, ec);
            f.installed = not ec;
        }
        if (ec) {
            failed = f.target;
            break;
        }
    }
    if (ec) {
        rollback();
        POTASSCO_CHECK(not ec, std::errc::io_error, "'%s': could not replace file: %s", failed.c_str(),
                       ec.message().c_str());
    }
    for (const auto& f : files_) {
        if (f.backup && not fs::remove(backupName(f.target), ec) && ec) {
            warnFmt(handler, Event::subsystem_write, "'%s': could not remove backup file: %s", f.target.c_str(),
                    ec.message().c_str());
        }
        if (handler) {
            handler->dispatch(
                ResourceEvent(Event::subsystem_write, ResourceEvent::op_write, f.target.c_str(), f.nodes, f.edges));
        }
    }
    files_.clear();
}

void StagedFiles::rollback() noexcept {
    for (auto it = files_.rbegin(), end = files_.rend(); it != end; ++it) {
        std::error_code ec;
        if (it->installed) {
            fs::remove(it->target, ec);
            it->installed = false;
        }
        if (it->backup) {
            fs::rename(backupName(it->target), it->target, ec);
            it->backup = false;
        }
    }
    discard();
}

void StagedFiles::discard() noexcept {
    for (const auto& f : files_) {
        if (not f.installed) {
            std::error_code ec;
            fs::remove(stagingName(f.target), ec);
        }
    }
    files_.clear();
}

StringVec StagedFiles::targets() const {
    StringVec ret;
    ret.reserve(files_.size());
    std::transform(files_.begin(), files_.end(), std::back_inserter(ret), [](const File& f) { return f.target; });
    return ret;
}

FactFormat NormalizeOptions::targetFormat() const {
    return FactFormat(targetEdgePredicate.empty() ? edgePredicate : targetEdgePredicate, nodePredicate);
}

Graph graphFromFile(const std::string& fname, std::string_view edgePredicate, const ParserOptions& opts,
                    EventHandler* handler) {
    checkPredicate(edgePredicate, "edge predicate");
    std::ifstream in(fname);
    POTASSCO_CHECK(in.is_open(), std::errc::no_such_file_or_directory, "'%s': could not open input file!",
                   fname.c_str());
    FactReader reader(in, opts, handler);
    reader.setName(fname);
    auto g = buildGraph(reader, edgePredicate);
    if (reader.skipped()) {
        warnFmt(handler, Event::subsystem_parse, "'%s': %u invalid line(s) skipped", fname.c_str(), reader.skipped());
    }
    if (handler) {
        handler->dispatch(
            ResourceEvent(Event::subsystem_parse, ResourceEvent::op_read, fname.c_str(), g.numNodes(), g.numEdges()));
    }
    return g;
}

void graphToFile(const Graph& g, const std::string& fname, const FactFormat& format, EventHandler* handler) {
    StagedFiles out;
    out.add(fname, g, format);
    out.commit(handler);
}

std::string defaultSplitTemplate(const std::string& fname) {
    fs::path p(fname);
    auto     name = p.stem().string();
    name.append("_").append(slot_marker).append(p.extension().string());
    return (p.parent_path() / name).string();
}

void checkSplitTemplate(std::string_view tmpl) {
    auto pos  = tmpl.find(slot_marker);
    bool once = pos != std::string_view::npos && tmpl.find(slot_marker, pos + slot_marker.size()) == std::string_view::npos;
    POTASSCO_CHECK(once, std::errc::invalid_argument, "'%.*s': target template must contain '{}' exactly once",
                   static_cast<int>(tmpl.size()), tmpl.data());
    checkTarget(std::string(tmpl));
}

StringVec splitByComponents(const Graph& g, const std::string& tmpl, const FactFormat& format,
                            EventHandler* handler) {
    checkSplitTemplate(tmpl);
    format.validate();
    auto pos   = tmpl.find(slot_marker);
    auto comps = g.components();
    if (handler) {
        char msg[80];
        std::snprintf(msg, std::size(msg), "%u connected component(s)", static_cast<uint32_t>(comps.size()));
        report(handler, Event::subsystem_build, Event::verbosity_high, msg);
    }
    StagedFiles out;
    uint32_t    i = 0;
    for (const auto& comp : comps) {
        auto target = tmpl;
        target.replace(pos, slot_marker.size(), std::to_string(i++));
        out.add(target, g.subgraph(comp), format);
    }
    auto written = out.targets();
    out.commit(handler);
    return written;
}

StringVec splitByComponents(const std::string& fname, const std::string& tmpl, const SplitOptions& opts,
                            EventHandler* handler) {
    const auto targets = tmpl.empty() ? defaultSplitTemplate(fname) : tmpl;
    checkSplitTemplate(targets);
    opts.format.validate();
    auto g = graphFromFile(fname, opts.format.edgePredicate, opts.parser, handler);
    return splitByComponents(g, targets, opts.format, handler);
}

void normalize(const std::string& fname, const std::string& target, const NormalizeOptions& opts,
               EventHandler* handler) {
    const auto format = opts.targetFormat();
    const auto& out   = target.empty() ? fname : target;
    format.validate();
    checkTarget(out);
    auto g = graphFromFile(fname, opts.edgePredicate, opts.parser, handler);
    graphToFile(g, out, format, handler);
}

GraphInfo graphInfo(const Graph& g) {
    GraphInfo info;
    info.nodes      = g.numNodes();
    info.edges      = g.numEdges();
    info.components = static_cast<uint32_t>(g.components().size());
    if (g.empty()) {
        return info;
    }
    uint64_t degrees    = 0;
    double   clustering = 0.0;
    info.minDegree      = std::numeric_limits<uint32_t>::max();
    for (NodeId n = 0; n != g.numNodes(); ++n) {
        auto d          = g.degree(n);
        info.minDegree  = std::min(info.minDegree, d);
        info.maxDegree  = std::max(info.maxDegree, d);
        info.isolated  += static_cast<uint32_t>(d == 0);
        degrees        += d;
        clustering     += g.clustering(n);
    }
    info.avgDegree     = static_cast<double>(degrees) / info.nodes;
    info.avgClustering = clustering / info.nodes;
    return info;
}

} // namespace Grasp
