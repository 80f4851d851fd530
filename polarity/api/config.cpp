/*******************************************************************************
 * polarity/api/config.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/api/config.hpp>

#include <polarity/common/system_exception.hpp>

#include <cstdlib>
#include <string>
#include <thread>

namespace polarity {
namespace api {

constexpr const char* Config::default_positive_path;
constexpr const char* Config::default_negative_path;

std::string ResolvePath(const std::string& override_path,
                        const char* env_value, const char* default_path) {
    if (!override_path.empty())
        return override_path;
    if (env_value && *env_value)
        return env_value;
    return default_path;
}

Config Config::Resolve(const char* env_positive_path,
                       const char* env_negative_path,
                       const char* env_workers) {
    Config config;
    config.positive_path =
        ResolvePath(std::string(), env_positive_path, default_positive_path);
    config.negative_path =
        ResolvePath(std::string(), env_negative_path, default_negative_path);

    if (env_workers && *env_workers) {
        // parse envvar only if it exists.
        char* endptr;
        unsigned long workers = std::strtoul(env_workers, &endptr, 10);

        if (!endptr || *endptr != 0 || workers == 0 || *env_workers == '-') {
            throw common::ConfigError(
                      "environment variable POLARITY_WORKERS=" +
                      std::string(env_workers) +
                      " is not a valid number of workers.");
        }
        config.num_workers = workers;
    }
    else {
        config.num_workers = std::thread::hardware_concurrency();
        if (config.num_workers == 0) config.num_workers = 1;
    }

    return config;
}

Config Config::FromEnvironment() {
    return Resolve(getenv("POSITIVE_WORDLIST_PATH"),
                   getenv("NEGATIVE_WORDLIST_PATH"),
                   getenv("POLARITY_WORKERS"));
}

Config& Config::OverridePositivePath(const std::string& path) {
    positive_path = ResolvePath(path, nullptr, positive_path.c_str());
    return *this;
}

Config& Config::OverrideNegativePath(const std::string& path) {
    negative_path = ResolvePath(path, nullptr, negative_path.c_str());
    return *this;
}

Config& Config::OverrideWorkers(size_t workers) {
    if (workers != 0) num_workers = workers;
    return *this;
}

std::ostream& operator << (std::ostream& os, const Config& c) {
    return os << "positive_path=" << c.positive_path
              << " negative_path=" << c.negative_path
              << " num_workers=" << c.num_workers
              << " use_combiner=" << c.use_combiner;
}

} // namespace api
} // namespace polarity

/******************************************************************************/
