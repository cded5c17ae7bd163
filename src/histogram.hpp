/*
 * histogram.hpp - Fixed-bucket latency histogram
 *
 * Buckets are defined by ascending upper bounds in milliseconds. A sample is
 * counted in the first bucket whose bound it does not exceed. Samples above
 * the last bound only increase the total.
 */

#pragma once

#include "sample_parser.hpp"
#include <cstdint>
#include <vector>

class Histogram {
public:
    // Throws std::invalid_argument unless thresholds are positive and ascending
    explicit Histogram(std::vector<int64_t> thresholds_ms);

    void update(Latency latency);

    const std::vector<int64_t>& thresholds() const { return thresholds_; }
    const std::vector<uint64_t>& buckets() const { return buckets_; }
    uint64_t total() const { return total_; }

    // Samples above the largest threshold
    uint64_t overflow() const;
    uint64_t max_bucket() const;

    static std::vector<int64_t> default_thresholds();
    static bool valid_thresholds(const std::vector<int64_t>& thresholds_ms);

private:
    std::vector<int64_t> thresholds_;
    std::vector<uint64_t> buckets_;
    uint64_t total_ = 0;
};
