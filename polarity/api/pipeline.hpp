/*******************************************************************************
 * polarity/api/pipeline.hpp
 *
 * Driver of the classify -> group -> aggregate pipeline.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_API_PIPELINE_HEADER
#define POLARITY_API_PIPELINE_HEADER

#include <polarity/api/config.hpp>
#include <polarity/core/metric.hpp>
#include <polarity/core/word_set.hpp>
#include <polarity/vfs/file_io.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace polarity {
namespace api {

//! Counters of one pipeline run.
struct PipelineStats {
    //! number of input lines read
    size_t lines_read = 0;
    //! lines which emitted metrics
    size_t lines_classified = 0;
    //! lines without sentiment words, emitted nothing
    size_t lines_dropped = 0;
    //! number of bytes read from input files
    size_t bytes_read = 0;

    PipelineStats& operator += (const PipelineStats& b) {
        lines_read += b.lines_read;
        lines_classified += b.lines_classified;
        lines_dropped += b.lines_dropped;
        bytes_read += b.bytes_read;
        return *this;
    }

    friend std::ostream& operator << (std::ostream& os, const PipelineStats& s) {
        return os << "lines_read=" << s.lines_read
                  << " lines_classified=" << s.lines_classified
                  << " lines_dropped=" << s.lines_dropped
                  << " bytes_read=" << s.bytes_read;
    }
};

/*!
 * Pipeline runs the sentiment job on local worker threads.
 *
 * Setup() loads the two word lists once. Run() splits the input files into
 * one byte range per worker, and each worker classifies the lines of its range
 * into a private table of values grouped by metric key. After all workers
 * finished, every key with at least one value is aggregated by one job
 * reading that key's values from all tables in a single pass. With
 * Config::use_combiner the workers instead fold their values into partial
 * sums, which are merged afterwards. Both modes deliver the same averages.
 *
\code
Pipeline pipeline(Config::FromEnvironment());
pipeline.Setup();
Pipeline::Write("output", pipeline.Run({ "input/records" }));
\endcode
 */
class Pipeline
{
    static constexpr bool debug = false;

public:
    explicit Pipeline(const Config& config);

    //! Load both word lists. Throws common::ResourceError if one is
    //! unreadable, nothing is classified then.
    void Setup();

    //! Use already built word sets instead of loading the lists.
    void Setup(core::WordSet positive, core::WordSet negative);

    //! whether Setup() completed
    bool is_setup() const { return is_setup_; }

    /*!
     * Classify all lines of the files matched by the input globs and return the
     * rounded average of each metric which received values, sorted by metric
     * name. Throws common::SystemException if no file matches, and rethrows the
     * first error raised by a worker.
     */
    std::vector<core::MetricAverage> Run(const std::vector<std::string>& globs);

    //! Run the pipeline on an already listed set of files.
    std::vector<core::MetricAverage> Run(const vfs::FileList& files);

    //! Classify lines held in memory, one record per string.
    std::vector<core::MetricAverage> RunLines(
        const std::vector<std::string>& lines);

    //! Replace the output directory by one holding the results in part-00000
    //! and an empty _SUCCESS marker.
    static void Write(const std::string& output_dir,
                      const std::vector<core::MetricAverage>& results);

    //! Format one result line: "Key<TAB>average" with two decimal digits.
    static std::string FormatResult(const core::MetricAverage& result);

    //! counters of the last Run()
    const PipelineStats& stats() const { return stats_; }

    const Config& config() const { return config_; }

    const core::WordSet& positive() const { return positive_; }
    const core::WordSet& negative() const { return negative_; }

private:
    Config config_;

    core::WordSet positive_;
    core::WordSet negative_;
    bool is_setup_ = false;

    PipelineStats stats_;

    //! Run with a per-worker line source:
    //! source(worker, PipelineStats& stats, handle(const std::string& line)).
    template <typename LineSource>
    std::vector<core::MetricAverage> RunWorkers(const LineSource& source);
};

} // namespace api
} // namespace polarity

#endif // !POLARITY_API_PIPELINE_HEADER

/******************************************************************************/
