/*******************************************************************************
 * polarity/core/classifier.hpp
 *
 * Map phase: counts the sentiment words of one line and derives its metrics.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_CORE_CLASSIFIER_HEADER
#define POLARITY_CORE_CLASSIFIER_HEADER

#include <polarity/core/metric.hpp>
#include <polarity/core/word_set.hpp>

#include <string>

namespace polarity {
namespace core {

//! Number of positive and negative words found in one line.
struct SentimentCounts {
    int positive = 0;
    int negative = 0;

    int total() const { return positive + negative; }
};

/*!
 * Classifier scores one line of free-form text against a positive and a
 * negative WordSet.
 *
 * The line is lowercased and split at whitespace. From each token all
 * characters outside [a-z0-9-+] are removed, and the cleaned token is looked
 * up in both sets independently: a word listed in both sets counts as positive
 * AND as negative.
 *
 * Lines without any sentiment word emit nothing. All other lines emit exactly
 * five MetricPairs, where the percentages are truncated toward zero:
 *
 * - PositiveWordCount = pos
 * - NegativeWordCount = neg
 * - PositiveScore     = trunc(pos / (pos + neg) * 100)
 * - NegativeScore     = trunc(neg / (pos + neg) * 100)
 * - SentimentRatio    = trunc((pos - neg) / (pos + neg) * 100)
 *
 * The classifier only holds const references to the two sets and has no
 * mutable state, hence one instance can be used from many threads.
 */
class Classifier
{
public:
    //! the word sets must outlive the Classifier.
    Classifier(const WordSet& positive, const WordSet& negative)
        : positive_(positive), negative_(negative) { }

    /*!
     * Split line into cleaned tokens and call callback(const std::string&)
     * for each non-empty one.
     */
    template <typename Callback>
    static void Tokenize(const std::string& line, Callback&& callback) {
        std::string token;
        for (const char& c : line) {
            if (IsDelimiter(c)) {
                if (!token.empty()) {
                    callback(token);
                    token.clear();
                }
            }
            else if (c >= 'A' && c <= 'Z') {
                token.push_back(static_cast<char>(c - 'A' + 'a'));
            }
            else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                     c == '-' || c == '+') {
                token.push_back(c);
            }
        }
        if (!token.empty())
            callback(token);
    }

    //! count positive and negative words of line.
    SentimentCounts Count(const std::string& line) const;

    //! derive the five metrics from the counts, or an invalid record if no
    //! sentiment word was found.
    static MetricRecord Score(const SentimentCounts& counts);

    //! classify one line into a MetricRecord.
    MetricRecord Classify(const std::string& line) const {
        return Score(Count(line));
    }

    /*!
     * Classify one line and call emit(const MetricPair&) for each of the five
     * metrics in emission order. Returns false and emits nothing if the line
     * contains no sentiment word.
     */
    template <typename Emitter>
    bool Classify(const std::string& line, Emitter&& emit) const {
        MetricRecord record = Classify(line);
        for (const MetricPair& p : record)
            emit(p);
        return record.valid();
    }

private:
    const WordSet& positive_;
    const WordSet& negative_;

    //! token delimiters: space, \t, \n, \r, \f
    static bool IsDelimiter(const char& c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    }
};

} // namespace core
} // namespace polarity

#endif // !POLARITY_CORE_CLASSIFIER_HEADER

/******************************************************************************/
