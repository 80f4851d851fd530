/*******************************************************************************
 * tests/api/config_test.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/api/config.hpp>
#include <polarity/common/system_exception.hpp>
#include <gtest/gtest.h>

#include <stdlib.h>

#include <string>

using namespace polarity;
using api::Config;

TEST(Config, Defaults) {
    Config config = Config::Resolve(nullptr, nullptr, nullptr);
    ASSERT_EQ("input/positive.txt", config.positive_path);
    ASSERT_EQ("input/negative.txt", config.negative_path);
    ASSERT_GE(config.num_workers, 1u);
    ASSERT_FALSE(config.use_combiner);

    // empty values count as unset
    config = Config::Resolve("", "", "");
    ASSERT_EQ("input/positive.txt", config.positive_path);
    ASSERT_EQ("input/negative.txt", config.negative_path);
    ASSERT_GE(config.num_workers, 1u);
}

TEST(Config, EnvironmentValues) {
    Config config = Config::Resolve("/lists/pos.txt", "/lists/neg.txt", "3");
    ASSERT_EQ("/lists/pos.txt", config.positive_path);
    ASSERT_EQ("/lists/neg.txt", config.negative_path);
    ASSERT_EQ(3u, config.num_workers);
}

TEST(Config, OverridesWin) {
    Config config = Config::Resolve("/lists/pos.txt", nullptr, "3");
    config.OverridePositivePath("my-pos.txt")
    .OverrideNegativePath("my-neg.txt")
    .OverrideWorkers(5);

    ASSERT_EQ("my-pos.txt", config.positive_path);
    ASSERT_EQ("my-neg.txt", config.negative_path);
    ASSERT_EQ(5u, config.num_workers);

    // empty overrides keep the resolved values
    config = Config::Resolve("/lists/pos.txt", nullptr, "3");
    config.OverridePositivePath("").OverrideNegativePath("").OverrideWorkers(0);
    ASSERT_EQ("/lists/pos.txt", config.positive_path);
    ASSERT_EQ("input/negative.txt", config.negative_path);
    ASSERT_EQ(3u, config.num_workers);
}

TEST(Config, ResolvePath) {
    ASSERT_EQ("a", api::ResolvePath("a", "b", "c"));
    ASSERT_EQ("b", api::ResolvePath("", "b", "c"));
    ASSERT_EQ("c", api::ResolvePath("", "", "c"));
    ASSERT_EQ("c", api::ResolvePath("", nullptr, "c"));
}

TEST(Config, InvalidWorkers) {
    ASSERT_THROW(Config::Resolve(nullptr, nullptr, "abc"), common::ConfigError);
    ASSERT_THROW(Config::Resolve(nullptr, nullptr, "0"), common::ConfigError);
    ASSERT_THROW(Config::Resolve(nullptr, nullptr, "-2"), common::ConfigError);
    ASSERT_THROW(Config::Resolve(nullptr, nullptr, "4x"), common::ConfigError);
}

TEST(Config, FromEnvironment) {
    setenv("POSITIVE_WORDLIST_PATH", "/env/pos.txt", 1);
    setenv("NEGATIVE_WORDLIST_PATH", "/env/neg.txt", 1);
    setenv("POLARITY_WORKERS", "7", 1);

    Config config = Config::FromEnvironment();
    ASSERT_EQ("/env/pos.txt", config.positive_path);
    ASSERT_EQ("/env/neg.txt", config.negative_path);
    ASSERT_EQ(7u, config.num_workers);

    unsetenv("POSITIVE_WORDLIST_PATH");
    unsetenv("NEGATIVE_WORDLIST_PATH");
    unsetenv("POLARITY_WORKERS");

    config = Config::FromEnvironment();
    ASSERT_EQ(Config::default_positive_path, config.positive_path);
    ASSERT_EQ(Config::default_negative_path, config.negative_path);
}

/******************************************************************************/
