/*******************************************************************************
 * examples/sentiment/sentiment.hpp
 *
 * Command line handling of the sentiment tool: maps arguments and environment
 * to an api::Config, runs the pipeline and translates errors to exit codes.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_EXAMPLES_SENTIMENT_SENTIMENT_HEADER
#define POLARITY_EXAMPLES_SENTIMENT_SENTIMENT_HEADER

#include <polarity/api/config.hpp>
#include <polarity/api/pipeline.hpp>
#include <polarity/common/logger.hpp>
#include <polarity/common/system_exception.hpp>

#include <tlx/cmdline_parser.hpp>

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace examples {
namespace sentiment {

using namespace polarity; // NOLINT

//! raw values given on the command line
struct SentimentArgs {
    std::string input;
    std::string output;
    std::string positive_path;
    std::string negative_path;
    size_t workers = 0;
    bool combine = false;
};

//! Parse the command line, returns false on a usage error.
static inline bool ParseSentimentArgs(
    int argc, const char* const* argv, SentimentArgs* args) {

    tlx::CmdlineParser clp;
    clp.set_description(
        "Scores each input line against a positive and a negative word list "
        "and writes the average of every sentiment metric to the output "
        "directory.");

    clp.add_param_string("input", args->input,
                         "input file, directory or glob pattern");

    clp.add_param_string("output", args->output,
                         "output directory, replaced if it exists");

    clp.add_opt_param_string("positive_wordlist", args->positive_path,
                             "positive word list, default: "
                             "$POSITIVE_WORDLIST_PATH or input/positive.txt");

    clp.add_opt_param_string("negative_wordlist", args->negative_path,
                             "negative word list, default: "
                             "$NEGATIVE_WORDLIST_PATH or input/negative.txt");

    clp.add_size_t('w', "workers", args->workers,
                   "number of worker threads, default: "
                   "$POLARITY_WORKERS or number of cores");

    clp.add_bool('c', "combine", args->combine,
                 "pre-combine metric values into partial sums in the workers");

    if (!clp.process(argc, argv))
        return false;

    clp.print_result();
    return true;
}

//! Resolve the configuration: command line values win over the environment.
//! Throws common::ConfigError on an invalid environment value.
static inline api::Config MakeSentimentConfig(const SentimentArgs& args) {
    api::Config config = api::Config::FromEnvironment();
    config.OverridePositivePath(args.positive_path)
    .OverrideNegativePath(args.negative_path)
    .OverrideWorkers(args.workers);
    config.use_combiner = args.combine;
    return config;
}

static inline void RunSentiment(const api::Config& config,
                                const std::string& input,
                                const std::string& output) {
    auto start = std::chrono::steady_clock::now();

    api::Pipeline pipeline(config);
    pipeline.Setup();

    std::vector<core::MetricAverage> results =
        pipeline.Run(std::vector<std::string>{ input });

    api::Pipeline::Write(output, results);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    const api::PipelineStats& stats = pipeline.stats();
    LOG1 << "RESULT"
         << " benchmark=sentiment"
         << " time=" << elapsed.count()
         << " lines=" << stats.lines_read
         << " classified=" << stats.lines_classified
         << " dropped=" << stats.lines_dropped
         << " bytes=" << stats.bytes_read
         << " workers=" << pipeline.config().num_workers
         << " keys=" << results.size();
}

//! Whole tool: returns 0 on success, -1 on a usage error, and 1 if the
//! configuration or the pipeline failed.
static inline int RunSentimentMain(int argc, const char* const* argv) {
    SentimentArgs args;
    if (!ParseSentimentArgs(argc, argv, &args))
        return -1;

    try {
        api::Config config = MakeSentimentConfig(args);
        LOG1 << "sentiment: " << config;

        RunSentiment(config, args.input, args.output);
        return 0;
    }
    catch (const common::ResourceError& e) {
        LOG1 << "sentiment: word list error: " << e.what();
        return 1;
    }
    catch (const std::exception& e) {
        LOG1 << "sentiment: " << e.what();
        return 1;
    }
}

} // namespace sentiment
} // namespace examples

#endif // !POLARITY_EXAMPLES_SENTIMENT_SENTIMENT_HEADER

/******************************************************************************/
