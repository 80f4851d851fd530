/*******************************************************************************
 * polarity/core/classifier.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/core/classifier.hpp>

#include <string>

namespace polarity {
namespace core {

SentimentCounts Classifier::Count(const std::string& line) const {
    SentimentCounts counts;
    Tokenize(line, [&](const std::string& word) {
                 if (positive_.Contains(word)) counts.positive++;
                 if (negative_.Contains(word)) counts.negative++;
             });
    return counts;
}

MetricRecord Classifier::Score(const SentimentCounts& counts) {
    int total = counts.total();
    if (total == 0)
        return MetricRecord();

    // percentages are computed in double precision and truncated toward zero,
    // not rounded.
    double dtotal = static_cast<double>(total);
    int ratio = static_cast<int>(
        static_cast<double>(counts.positive - counts.negative) / dtotal * 100);
    int positive_score = static_cast<int>(
        static_cast<double>(counts.positive) / dtotal * 100);
    int negative_score = static_cast<int>(
        static_cast<double>(counts.negative) / dtotal * 100);

    return MetricRecord(counts.positive, counts.negative,
                        positive_score, negative_score, ratio);
}

} // namespace core
} // namespace polarity

/******************************************************************************/
