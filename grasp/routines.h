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
#include <grasp/parser.h>

#include <string>
#include <string_view>
#include <vector>

/*!
 * \file
 * \brief Defines file level operations on graphs stored as facts.
 */
namespace Grasp {

//! Options for splitting a graph into its connected components.
struct SplitOptions {
    FactFormat    format; //!< Format used for reading the source and writing the components.
    ParserOptions parser;
};

//! Options for normalizing a fact file.
struct NormalizeOptions {
    std::string   edgePredicate{default_edge_predicate}; //!< Edge predicate of the source.
    std::string   targetEdgePredicate;                   //!< Edge predicate of the target - empty means same as source.
    std::string   nodePredicate{default_node_predicate}; //!< Predicate for isolated nodes in the target.
    ParserOptions parser;

    //! Returns the format of the target.
    [[nodiscard]] FactFormat targetFormat() const;
};

//! Summary statistics of a graph.
struct GraphInfo {
    uint32_t nodes{0};
    uint32_t edges{0};
    uint32_t components{0};
    uint32_t isolated{0};      //!< Number of nodes without incident edges.
    uint32_t minDegree{0};
    uint32_t maxDegree{0};
    double   avgDegree{0.0};
    double   avgClustering{0.0};
};

//! A set of graph files that replace their targets together.
/*!
 * Each file added is first written to a staging file next to its target.
 * commit() moves all staging files to their targets. An existing target is
 * kept as a backup until every staging file is in place. If any step of the
 * commit fails, already replaced targets are restored from their backups.
 * Hence, either all targets are replaced or none is.
 *
 * Staging files that were not committed are removed on destruction.
 */
class StagedFiles {
public:
    StagedFiles() = default;
    ~StagedFiles();
    StagedFiles(const StagedFiles&)            = delete;
    StagedFiles& operator=(const StagedFiles&) = delete;

    //! Writes the facts of g to the staging file of target.
    /*!
     * 	hrows std::invalid_argument if target does not name a file in an existing directory.
     * 	hrows std::runtime_error if the staging file can't be written.
     */
    void add(const std::string& target, const Graph& g, const FactFormat& format);
    //! Replaces all targets with their staging files and reports each written file.
    /*!
     * 	hrows std::runtime_error if a target can't be replaced. In that case,
     *         all targets are restored and no staging file is left.
     */
    void commit(EventHandler* handler = nullptr);
    //! Removes all staging files.
    void discard() noexcept;

    [[nodiscard]] StringVec   targets() const;
    [[nodiscard]] std::size_t size() const { return files_.size(); }
    [[nodiscard]] bool        empty() const { return files_.empty(); }

    [[nodiscard]] static std::string stagingName(const std::string& target);
    [[nodiscard]] static std::string backupName(const std::string& target);

private:
    struct File {
        std::string target;
        uint32_t    nodes;
        uint32_t    edges;
        bool        backup;
        bool        installed;
    };
    void rollback() noexcept;

    std::vector<File> files_;
};

//! Reads the graph stored in the given file.
/*!
 * \throws std::runtime_error if the file can't be read or, in strict mode,
 *         contains an invalid line.
 */
Graph graphFromFile(const std::string& fname, std::string_view edgePredicate,
                    const ParserOptions& opts = ParserOptions(), EventHandler* handler = nullptr);

//! Writes the facts of g to the given file.
/*!
 * The file is first written to a staging file which then replaces the target.
 * Hence, the target is either completely written or not touched at all.
 */
void graphToFile(const Graph& g, const std::string& fname, const FactFormat& format = FactFormat(),
                 EventHandler* handler = nullptr);

//! Returns the target template used for splitting fname if none is given.
/*!
 * The template is <stem>_{}<ext> in the directory of fname.
 */
std::string defaultSplitTemplate(const std::string& fname);

//! Checks that tmpl contains "{}" exactly once and names a file in an existing directory.
/*!
 * \throws std::invalid_argument if tmpl is not a valid target template.
 */
void checkSplitTemplate(std::string_view tmpl);

//! Writes each connected component of g to its own file.
/*!
 * The i-th component is written to tmpl with "{}" replaced by i. Components
 * are ordered by their first node. The files are replaced through StagedFiles.
 * Hence, either all component files are written or none is.
 * \return The names of the written files.
 * \throws std::invalid_argument if tmpl or format is invalid.
 */
StringVec splitByComponents(const Graph& g, const std::string& tmpl, const FactFormat& format = FactFormat(),
                            EventHandler* handler = nullptr);

//! Reads the graph in fname and writes each of its connected components to its own file.
/*!
 * If tmpl is empty, defaultSplitTemplate(fname) is used. The template is
 * checked before fname is read.
 */
StringVec splitByComponents(const std::string& fname, const std::string& tmpl,
                            const SplitOptions& opts = SplitOptions(), EventHandler* handler = nullptr);

//! Rewrites the graph in fname in canonical form to target.
/*!
 * If target is empty, fname is rewritten in place. Normalizing a normalized
 * file does not change it.
 */
void normalize(const std::string& fname, const std::string& target, const NormalizeOptions& opts = NormalizeOptions(),
               EventHandler* handler = nullptr);

//! Computes summary statistics for g.
GraphInfo graphInfo(const Graph& g);

} // namespace Grasp
