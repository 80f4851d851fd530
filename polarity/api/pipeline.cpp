/*******************************************************************************
 * polarity/api/pipeline.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/api/pipeline.hpp>

#include <polarity/common/logger.hpp>
#include <polarity/common/math.hpp>
#include <polarity/common/string.hpp>
#include <polarity/common/system_exception.hpp>
#include <polarity/core/aggregator.hpp>
#include <polarity/core/classifier.hpp>
#include <polarity/core/group_table.hpp>
#include <polarity/vfs/line_reader.hpp>

#include <tlx/string/join.hpp>
#include <tlx/thread_pool.hpp>

#include <array>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace polarity {
namespace api {

using core::MetricAverage;
using core::MetricKey;

Pipeline::Pipeline(const Config& config)
    : config_(config) {
    if (config_.num_workers == 0) config_.num_workers = 1;
}

void Pipeline::Setup() {
    // both sets are required: the first failure aborts the setup.
    core::WordSet positive = core::WordSet::FromFile(config_.positive_path);
    core::WordSet negative = core::WordSet::FromFile(config_.negative_path);
    Setup(std::move(positive), std::move(negative));
}

void Pipeline::Setup(core::WordSet positive, core::WordSet negative) {
    positive_ = std::move(positive);
    negative_ = std::move(negative);
    is_setup_ = true;

    sLOG << "Pipeline: word sets ready with" << positive_.size()
         << "positive and" << negative_.size() << "negative words";
}

template <typename LineSource>
std::vector<MetricAverage> Pipeline::RunWorkers(const LineSource& source) {
    if (!is_setup_)
        throw std::logic_error("Pipeline::Run() called before Setup()");

    const size_t num_workers = config_.num_workers;
    const core::Classifier classifier(positive_, negative_);

    // private state of each worker: no locking needed
    std::vector<core::MetricGroupTable> tables(num_workers);
    std::vector<core::AccumulatorTable> partials(num_workers);
    std::vector<PipelineStats> worker_stats(num_workers);
    std::vector<std::exception_ptr> errors(num_workers);

    tlx::ThreadPool pool(
        num_workers,
        [](size_t i) {
            common::NameThisThread("worker " + std::to_string(i));
        });

    /*************************************************************************/
    // Map: classify lines of each worker's part of the input

    for (size_t w = 0; w < num_workers; ++w) {
        pool.enqueue(
            [&, w]() {
                try {
                    PipelineStats& stats = worker_stats[w];
                    source(w, stats, [&](const std::string& line) {
                               stats.lines_read++;
                               bool emitted;
                               if (config_.use_combiner) {
                                   emitted = classifier.Classify(
                                       line, [&](const core::MetricPair& p) {
                                           partials[w].Insert(p);
                                       });
                               }
                               else {
                                   emitted = classifier.Classify(
                                       line, [&](const core::MetricPair& p) {
                                           tables[w].Insert(p);
                                       });
                               }
                               if (emitted)
                                   stats.lines_classified++;
                               else
                                   stats.lines_dropped++;
                           });
                    sLOG << "Pipeline: classified" << stats.lines_read
                         << "lines";
                }
                catch (...) {
                    errors[w] = std::current_exception();
                }
            });
    }

    pool.loop_until_empty();

    stats_ = PipelineStats();
    for (size_t w = 0; w < num_workers; ++w) {
        if (errors[w]) std::rethrow_exception(errors[w]);
        stats_ += worker_stats[w];
    }

    LOG << "Pipeline: map phase done, " << stats_;

    /*************************************************************************/
    // Reduce: one aggregation per key which received values

    const std::array<MetricKey, core::kNumMetricKeys>& keys =
        core::MetricKeysByName();

    std::vector<MetricAverage> results;

    if (config_.use_combiner) {
        core::AccumulatorTable total;
        for (const core::AccumulatorTable& t : partials)
            total.Combine(t);

        for (const MetricKey& key : keys) {
            if (total[key].empty()) continue;
            results.push_back(MetricAverage { key, total[key].Average() });
        }
        return results;
    }

    std::array<MetricAverage, core::kNumMetricKeys> averages;
    std::array<bool, core::kNumMetricKeys> has_values;
    has_values.fill(false);

    for (size_t k = 0; k < keys.size(); ++k) {
        const MetricKey key = keys[k];
        for (const core::MetricGroupTable& t : tables)
            has_values[k] = has_values[k] || !t.Values(key).empty();
        if (!has_values[k]) continue;

        pool.enqueue(
            [&, k, key]() {
                core::GroupValueReader reader(tables, key);
                averages[k] = core::Aggregate(key, reader);
            });
    }

    pool.loop_until_empty();

    for (size_t k = 0; k < keys.size(); ++k) {
        if (has_values[k]) results.push_back(averages[k]);
    }

    return results;
}

std::vector<MetricAverage> Pipeline::Run(const std::vector<std::string>& globs) {
    vfs::FileList files = vfs::Glob(globs);

    if (files.size() == 0) {
        throw common::SystemException(
                  "Pipeline: no files found in globs: " + tlx::join(" ", globs));
    }

    sLOG << "Pipeline: creating for" << globs.size() << "globs"
         << "matching" << files.size() << "files";

    return Run(files);
}

std::vector<MetricAverage> Pipeline::Run(const vfs::FileList& files) {
    const size_t num_workers = config_.num_workers;

    return RunWorkers(
        [&](size_t worker, PipelineStats& stats,
            const std::function<void(const std::string&)>& handle) {
            vfs::LineReader reader(
                files, common::CalculateLocalRange(
                    files.total_size, num_workers, worker));
            while (reader.HasNext())
                handle(reader.Next());
            stats.bytes_read += reader.total_bytes();
        });
}

std::vector<MetricAverage> Pipeline::RunLines(
    const std::vector<std::string>& lines) {
    const size_t num_workers = config_.num_workers;

    return RunWorkers(
        [&](size_t worker, PipelineStats& stats,
            const std::function<void(const std::string&)>& handle) {
            common::Range range = common::CalculateLocalRange(
                lines.size(), num_workers, worker);
            for (size_t i = range.begin; i < range.end; ++i) {
                stats.bytes_read += lines[i].size();
                handle(lines[i]);
            }
        });
}

std::string Pipeline::FormatResult(const MetricAverage& result) {
    return std::string(core::MetricName(result.key)) + '\t' +
           common::FormatFixed2(result.average);
}

void Pipeline::Write(const std::string& output_dir,
                     const std::vector<MetricAverage>& results) {
    if (vfs::PathExists(output_dir)) {
        LOG << "Pipeline: removing existing output " << output_dir;
        vfs::RemoveAll(output_dir);
    }
    vfs::MakeDirectory(output_dir);

    std::vector<std::string> lines;
    for (const MetricAverage& r : results)
        lines.emplace_back(FormatResult(r));

    vfs::WriteLines(output_dir + "/part-00000", lines);
    vfs::WriteLines(output_dir + "/_SUCCESS", std::vector<std::string>());
}

} // namespace api
} // namespace polarity

/******************************************************************************/
