/*******************************************************************************
 * tests/examples/sentiment_run_test.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <examples/sentiment/sentiment.hpp>

#include <polarity/vfs/file_io.hpp>
#include <polarity/vfs/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <stdlib.h>

#include <string>
#include <vector>

using namespace polarity;
using namespace examples::sentiment;

//! argv vector for the parser, the program name comes first
static std::vector<const char*> Argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back("polarity_sentiment");
    for (const std::string& a : args)
        argv.push_back(a.c_str());
    return argv;
}

static int RunMain(const std::vector<std::string>& args) {
    std::vector<const char*> argv = Argv(args);
    return RunSentimentMain(static_cast<int>(argv.size()), argv.data());
}

class SentimentRunTest : public ::testing::Test
{
protected:
    void SetUp() override {
        unsetenv("POSITIVE_WORDLIST_PATH");
        unsetenv("NEGATIVE_WORDLIST_PATH");
        unsetenv("POLARITY_WORKERS");

        positive_ = tmpdir_.WriteFile(
            "positive.txt", { "good", "excellent", "awesome", "great" });
        negative_ = tmpdir_.WriteFile(
            "negative.txt", { "bad", "terrible", "awful", "horrible" });
        input_ = tmpdir_.WriteFile(
            "input.txt", {
                "This is good and excellent content",
                "This is bad and terrible content",
                "This has good and bad parts"
            });
        output_ = tmpdir_.path("output");
    }

    void TearDown() override {
        unsetenv("POSITIVE_WORDLIST_PATH");
        unsetenv("NEGATIVE_WORDLIST_PATH");
        unsetenv("POLARITY_WORKERS");
    }

    vfs::TemporaryDirectory tmpdir_;
    std::string positive_, negative_, input_, output_;
};

TEST_F(SentimentRunTest, ParseAllArguments) {
    std::vector<std::string> args = {
        "-w", "3", "-c", "in/*.txt", "out", "pos.txt", "neg.txt"
    };
    std::vector<const char*> argv = Argv(args);

    SentimentArgs parsed;
    ASSERT_TRUE(ParseSentimentArgs(
                    static_cast<int>(argv.size()), argv.data(), &parsed));

    ASSERT_EQ("in/*.txt", parsed.input);
    ASSERT_EQ("out", parsed.output);
    ASSERT_EQ("pos.txt", parsed.positive_path);
    ASSERT_EQ("neg.txt", parsed.negative_path);
    ASSERT_EQ(3u, parsed.workers);
    ASSERT_TRUE(parsed.combine);

    api::Config config = MakeSentimentConfig(parsed);
    ASSERT_EQ("pos.txt", config.positive_path);
    ASSERT_EQ("neg.txt", config.negative_path);
    ASSERT_EQ(3u, config.num_workers);
    ASSERT_TRUE(config.use_combiner);
}

TEST_F(SentimentRunTest, MissingArguments) {
    ASSERT_EQ(-1, RunMain({ }));
    ASSERT_EQ(-1, RunMain({ input_ }));
    ASSERT_FALSE(vfs::PathExists(output_));
}

TEST_F(SentimentRunTest, EnvironmentWordLists) {
    setenv("POSITIVE_WORDLIST_PATH", positive_.c_str(), 1);
    setenv("NEGATIVE_WORDLIST_PATH", negative_.c_str(), 1);
    setenv("POLARITY_WORKERS", "2", 1);

    SentimentArgs args;
    args.input = input_;
    args.output = output_;

    api::Config config = MakeSentimentConfig(args);
    ASSERT_EQ(positive_, config.positive_path);
    ASSERT_EQ(negative_, config.negative_path);
    ASSERT_EQ(2u, config.num_workers);
    ASSERT_FALSE(config.use_combiner);

    ASSERT_EQ(0, RunMain({ input_, output_ }));
    ASSERT_TRUE(vfs::PathExists(output_ + "/_SUCCESS"));
}

TEST_F(SentimentRunTest, PositionalWordListsOverrideEnvironment) {
    setenv("POSITIVE_WORDLIST_PATH", tmpdir_.path("missing-pos.txt").c_str(), 1);
    setenv("NEGATIVE_WORDLIST_PATH", tmpdir_.path("missing-neg.txt").c_str(), 1);

    ASSERT_EQ(0, RunMain({ "-w", "2", input_, output_, positive_, negative_ }));

    ASSERT_EQ("NegativeScore\t50.00\n"
              "NegativeWordCount\t1.00\n"
              "PositiveScore\t50.00\n"
              "PositiveWordCount\t1.00\n"
              "SentimentRatio\t0.00\n",
              vfs::ReadFileContents(output_ + "/part-00000"));
}

TEST_F(SentimentRunTest, MissingWordListFails) {
    ASSERT_EQ(1, RunMain({ input_, output_,
                           tmpdir_.path("missing.txt"), negative_ }));
    ASSERT_FALSE(vfs::PathExists(output_));
}

TEST_F(SentimentRunTest, InvalidWorkersFails) {
    setenv("POLARITY_WORKERS", "many", 1);
    ASSERT_EQ(1, RunMain({ input_, output_, positive_, negative_ }));
}

TEST_F(SentimentRunTest, NoInputFails) {
    ASSERT_EQ(1, RunMain({ tmpdir_.path("nothing-*"), output_,
                           positive_, negative_ }));
}

/******************************************************************************/
