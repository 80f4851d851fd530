/*******************************************************************************
 * polarity/core/metric.cpp
 *
 * Part of Project Polarity
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <polarity/core/metric.hpp>

#include <algorithm>
#include <cstring>

namespace polarity {
namespace core {

static const char* s_metric_names[kNumMetricKeys] = {
    "PositiveWordCount",
    "NegativeWordCount",
    "PositiveScore",
    "NegativeScore",
    "SentimentRatio"
};

const char * MetricName(const MetricKey& key) {
    return s_metric_names[MetricIndex(key)];
}

bool ParseMetricKey(const std::string& name, MetricKey* key) {
    for (const MetricKey& k : kMetricKeys) {
        if (name == s_metric_names[MetricIndex(k)]) {
            *key = k;
            return true;
        }
    }
    return false;
}

const std::array<MetricKey, kNumMetricKeys>& MetricKeysByName() {
    static const std::array<MetricKey, kNumMetricKeys> sorted = [] {
        std::array<MetricKey, kNumMetricKeys> keys = kMetricKeys;
        std::sort(keys.begin(), keys.end(),
                  [](const MetricKey& a, const MetricKey& b) {
                      return std::strcmp(MetricName(a), MetricName(b)) < 0;
                  });
        return keys;
    } ();
    return sorted;
}

std::ostream& operator << (std::ostream& os, const MetricKey& key) {
    return os << MetricName(key);
}

} // namespace core
} // namespace polarity

/******************************************************************************/
