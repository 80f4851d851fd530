/*******************************************************************************
 * polarity/core/group_table.hpp
 *
 * Grouping of emitted metric pairs by key, standing in for the shuffle between
 * classification and aggregation.
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef POLARITY_CORE_GROUP_TABLE_HEADER
#define POLARITY_CORE_GROUP_TABLE_HEADER

#include <polarity/core/metric.hpp>

#include <tlx/die.hpp>

#include <array>
#include <vector>

namespace polarity {
namespace core {

/*!
 * Per-worker table which collects emitted values in one bucket per metric key.
 * Each worker owns its table exclusively, no locking is needed.
 */
class MetricGroupTable
{
public:
    using Bucket = std::vector<int>;

    void Insert(const MetricPair& p) {
        buckets_[MetricIndex(p.key)].push_back(p.value);
        ++size_;
    }

    //! values of one key, in insertion order
    const Bucket& Values(const MetricKey& key) const {
        return buckets_[MetricIndex(key)];
    }

    //! total number of values in all buckets
    size_t size() const { return size_; }

private:
    std::array<Bucket, kNumMetricKeys> buckets_;
    size_t size_ = 0;
};

/*!
 * GroupValueReader delivers all values of one key collected by a list of
 * MetricGroupTables, one table after another. Like the framework's value
 * iterators it can be consumed exactly once: there is no rewind and no random
 * access.
 */
class GroupValueReader
{
public:
    using Bucket = MetricGroupTable::Bucket;

    //! reader over the key's buckets of all tables
    GroupValueReader(const std::vector<MetricGroupTable>& tables,
                     const MetricKey& key) {
        for (const MetricGroupTable& t : tables) {
            if (!t.Values(key).empty())
                buckets_.push_back(&t.Values(key));
        }
    }

    //! non-copyable: delete copy-constructor
    GroupValueReader(const GroupValueReader&) = delete;
    //! non-copyable: delete assignment operator
    GroupValueReader& operator = (const GroupValueReader&) = delete;
    //! move-constructor: default
    GroupValueReader(GroupValueReader&&) = default;
    //! move-assignment operator: default
    GroupValueReader& operator = (GroupValueReader&&) = default;

    bool HasNext() const {
        return bucket_ < buckets_.size();
    }

    int Next() {
        die_unless(HasNext());
        int value = (*buckets_[bucket_])[index_];
        if (++index_ >= buckets_[bucket_]->size()) {
            ++bucket_;
            index_ = 0;
        }
        return value;
    }

private:
    //! non-empty buckets to read
    std::vector<const Bucket*> buckets_;
    //! current bucket
    size_t bucket_ = 0;
    //! next index in current bucket
    size_t index_ = 0;
};

} // namespace core
} // namespace polarity

#endif // !POLARITY_CORE_GROUP_TABLE_HEADER

/******************************************************************************/
