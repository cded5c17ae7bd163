/*
 * histogram.cpp - Fixed-bucket latency histogram implementation
 */

#include "histogram.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

Histogram::Histogram(std::vector<int64_t> thresholds_ms)
    : thresholds_(std::move(thresholds_ms)) {
    if (!valid_thresholds(thresholds_)) {
        throw std::invalid_argument(
            "histogram thresholds must be positive and strictly ascending");
    }
    buckets_.assign(thresholds_.size(), 0);
}

void Histogram::update(Latency latency) {
    for (size_t i = 0; i < thresholds_.size(); ++i) {
        if (latency <= std::chrono::milliseconds(thresholds_[i])) {
            buckets_[i]++;
            break;
        }
    }

    total_++;
}

uint64_t Histogram::overflow() const {
    uint64_t bucketed = std::accumulate(buckets_.begin(), buckets_.end(), uint64_t{0});
    return total_ - bucketed;
}

uint64_t Histogram::max_bucket() const {
    if (buckets_.empty()) return 0;
    return *std::max_element(buckets_.begin(), buckets_.end());
}

std::vector<int64_t> Histogram::default_thresholds() {
    return {1, 2, 5, 10, 20, 50, 100, 200, 500, 1000};
}

bool Histogram::valid_thresholds(const std::vector<int64_t>& thresholds_ms) {
    if (thresholds_ms.empty()) {
        return false;
    }

    for (size_t i = 0; i < thresholds_ms.size(); ++i) {
        if (thresholds_ms[i] <= 0) {
            return false;
        }
        if (i > 0 && thresholds_ms[i] <= thresholds_ms[i - 1]) {
            return false;
        }
    }
    return true;
}
