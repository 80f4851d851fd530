/*******************************************************************************
 * examples/sentiment/sentiment_run.cpp
 *
 * Command line driver of the sentiment pipeline: classifies all lines of the
 * input files and writes the averaged metrics into the output directory.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <examples/sentiment/sentiment.hpp>

#include <polarity/common/logger.hpp>

int main(int argc, char* argv[]) {
    polarity::common::NameThisThread("main");
    return examples::sentiment::RunSentimentMain(argc, argv);
}

/******************************************************************************/
