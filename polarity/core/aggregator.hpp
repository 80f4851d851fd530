/*******************************************************************************
 * polarity/core/aggregator.hpp
 *
 * Reduce phase: rounded average of all values of one metric.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_CORE_AGGREGATOR_HEADER
#define POLARITY_CORE_AGGREGATOR_HEADER

#include <polarity/core/metric.hpp>

#include <array>
#include <cmath>
#include <cstdint>

namespace polarity {
namespace core {

//! Round to two decimal places, ties toward positive infinity:
//! floor(value * 100 + 0.5) / 100. Positive ties round away from zero,
//! negative ties toward zero (-0.125 becomes -0.12).
static inline double RoundToHundredths(double value) {
    return std::floor(value * 100.0 + 0.5) / 100.0;
}

/*!
 * Running sum and count of the values of one metric. Accumulators of disjoint
 * value sets can be combined in any order, the average only depends on the
 * multiset of values.
 */
class Accumulator
{
public:
    //! add one value
    void Add(int value) {
        sum_ += value;
        ++count_;
    }

    //! merge a partial accumulator of a disjoint value set
    Accumulator& Combine(const Accumulator& other) {
        sum_ += other.sum_;
        count_ += other.count_;
        return *this;
    }

    int64_t sum() const { return sum_; }
    int64_t count() const { return count_; }
    bool empty() const { return count_ == 0; }

    //! average rounded to two decimals, 0.0 if no value was added.
    double Average() const {
        if (count_ == 0) return 0.0;
        return RoundToHundredths(
            static_cast<double>(sum_) / static_cast<double>(count_));
    }

private:
    int64_t sum_ = 0;
    int64_t count_ = 0;
};

/*!
 * Aggregate all values of one metric key. The ValueReader is consumed in a
 * single forward pass via bool HasNext() and int Next(), nothing besides the
 * running sum and count is kept. An empty reader yields an average of 0.0.
 */
template <typename ValueReader>
MetricAverage Aggregate(const MetricKey& key, ValueReader& values) {
    Accumulator acc;
    while (values.HasNext())
        acc.Add(values.Next());
    return MetricAverage { key, acc.Average() };
}

/*!
 * One Accumulator per metric key, used by workers to pre-combine their values
 * before the partial sums are merged.
 */
class AccumulatorTable
{
public:
    void Insert(const MetricPair& p) {
        table_[MetricIndex(p.key)].Add(p.value);
    }

    AccumulatorTable& Combine(const AccumulatorTable& other) {
        for (size_t i = 0; i < kNumMetricKeys; ++i)
            table_[i].Combine(other.table_[i]);
        return *this;
    }

    const Accumulator& operator [] (const MetricKey& key) const {
        return table_[MetricIndex(key)];
    }

private:
    std::array<Accumulator, kNumMetricKeys> table_;
};

} // namespace core
} // namespace polarity

#endif // !POLARITY_CORE_AGGREGATOR_HEADER

/******************************************************************************/
