/*******************************************************************************
 * polarity/api/config.hpp
 *
 * Explicit configuration of a sentiment pipeline run.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_API_CONFIG_HEADER
#define POLARITY_API_CONFIG_HEADER

#include <cstddef>
#include <ostream>
#include <string>

namespace polarity {
namespace api {

/*!
 * Configuration of a pipeline run. The environment is consulted only by
 * FromEnvironment(), everything downstream receives this object.
 *
 * Word list paths are resolved as: explicit override > environment variable
 * (POSITIVE_WORDLIST_PATH, NEGATIVE_WORDLIST_PATH) > built-in default. The
 * number of workers as: explicit override > POLARITY_WORKERS > hardware
 * concurrency.
 */
struct Config {
    //! built-in default of the positive word list
    static constexpr const char* default_positive_path = "input/positive.txt";
    //! built-in default of the negative word list
    static constexpr const char* default_negative_path = "input/negative.txt";

    //! path of the positive word list
    std::string positive_path = default_positive_path;
    //! path of the negative word list
    std::string negative_path = default_negative_path;
    //! number of worker threads classifying and aggregating
    size_t num_workers = 1;
    //! pre-combine values into partial sums inside the workers
    bool use_combiner = false;

    //! Resolve the configuration from the given environment values, which
    //! may be nullptr or empty if unset. Throws common::ConfigError on an
    //! invalid worker count.
    static Config Resolve(const char* env_positive_path,
                          const char* env_negative_path,
                          const char* env_workers);

    //! Resolve the configuration from the process environment.
    static Config FromEnvironment();

    //! replace the positive word list path, if path is not empty.
    Config& OverridePositivePath(const std::string& path);
    //! replace the negative word list path, if path is not empty.
    Config& OverrideNegativePath(const std::string& path);
    //! replace the number of workers, if num_workers is not zero.
    Config& OverrideWorkers(size_t num_workers);

    friend std::ostream& operator << (std::ostream& os, const Config& c);
};

//! Pick the override if set, else the environment value if set, else the
//! default.
std::string ResolvePath(const std::string& override_path,
                        const char* env_value, const char* default_path);

} // namespace api
} // namespace polarity

#endif // !POLARITY_API_CONFIG_HEADER

/******************************************************************************/
