/*******************************************************************************
 * polarity/core/metric.hpp
 *
 * The closed set of sentiment metric keys and the pairs emitted per record.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_CORE_METRIC_HEADER
#define POLARITY_CORE_METRIC_HEADER

#include <array>
#include <cstddef>
#include <ostream>
#include <string>

namespace polarity {
namespace core {

//! The five metrics derived from each classified record, in emission order.
enum class MetricKey : unsigned {
    PositiveWordCount = 0,
    NegativeWordCount = 1,
    PositiveScore = 2,
    NegativeScore = 3,
    SentimentRatio = 4
};

//! number of metric keys
static constexpr size_t kNumMetricKeys = 5;

//! all metric keys in emission order
static constexpr std::array<MetricKey, kNumMetricKeys> kMetricKeys = { {
    MetricKey::PositiveWordCount, MetricKey::NegativeWordCount,
    MetricKey::PositiveScore, MetricKey::NegativeScore,
    MetricKey::SentimentRatio
} };

//! index of key into arrays of size kNumMetricKeys
static inline size_t MetricIndex(const MetricKey& key) {
    return static_cast<size_t>(key);
}

//! external name of the metric, e.g. "PositiveWordCount".
const char * MetricName(const MetricKey& key);

//! parse an external metric name, returns false for unknown names.
bool ParseMetricKey(const std::string& name, MetricKey* key);

//! metric keys sorted by their external names, the order in which results are
//! written.
const std::array<MetricKey, kNumMetricKeys>& MetricKeysByName();

std::ostream& operator << (std::ostream& os, const MetricKey& key);

/******************************************************************************/

//! One (metric, value) pair emitted by the classifier.
struct MetricPair {
    MetricKey key;
    int       value;

    bool operator == (const MetricPair& b) const {
        return key == b.key && value == b.value;
    }

    friend std::ostream& operator << (std::ostream& os, const MetricPair& p) {
        return os << '(' << p.key << ',' << p.value << ')';
    }
};

//! The averaged value of one metric over all records.
struct MetricAverage {
    MetricKey key;
    double    average;

    friend std::ostream& operator << (std::ostream& os, const MetricAverage& a) {
        return os << '(' << a.key << ',' << a.average << ')';
    }
};

/*!
 * The metrics of one record: either all five pairs or nothing. An invalid
 * (default constructed) record stands for a line without sentiment words.
 */
class MetricRecord
{
public:
    using const_iterator =
        std::array<MetricPair, kNumMetricKeys>::const_iterator;

    //! empty record, nothing is emitted
    MetricRecord() = default;

    //! full record
    MetricRecord(int positive_count, int negative_count,
                 int positive_score, int negative_score, int ratio)
        : valid_(true),
          pairs_ { {
                       { MetricKey::PositiveWordCount, positive_count },
                       { MetricKey::NegativeWordCount, negative_count },
                       { MetricKey::PositiveScore, positive_score },
                       { MetricKey::NegativeScore, negative_score },
                       { MetricKey::SentimentRatio, ratio }
                   } } { }

    //! whether the record carries metrics
    bool valid() const { return valid_; }

    //! number of emitted pairs, either zero or kNumMetricKeys.
    size_t size() const { return valid_ ? kNumMetricKeys : 0; }

    const_iterator begin() const { return pairs_.begin(); }
    const_iterator end() const { return pairs_.begin() + size(); }

    //! value of the given metric, only for valid records.
    int operator [] (const MetricKey& key) const {
        return pairs_[MetricIndex(key)].value;
    }

private:
    bool valid_ = false;
    std::array<MetricPair, kNumMetricKeys> pairs_ { };
};

} // namespace core
} // namespace polarity

#endif // !POLARITY_CORE_METRIC_HEADER

/******************************************************************************/
