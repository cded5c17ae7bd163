/*
 * window.hpp - Latency accumulator over a span of samples
 *
 * Tracks min, max, sum and count of the latencies routed to it. An empty
 * window reports zero for every field, including the average.
 */

#pragma once

#include "sample_parser.hpp"
#include <cstdint>
#include <string>

// Whole-millisecond view of a window, as shown on screen
struct WindowSummary {
    int64_t min_ms = 0;
    int64_t max_ms = 0;
    int64_t avg_ms = 0;
    uint64_t count = 0;

    std::string format() const;
};

class Window {
public:
    void update(Latency latency);
    void reset();

    Latency min() const { return min_; }
    Latency max() const { return max_; }
    Latency sum() const { return sum_; }
    uint64_t count() const { return count_; }
    bool empty() const { return count_ == 0; }

    // Integer division of sum by count, zero when empty
    Latency average() const;

    WindowSummary summary() const;

private:
    Latency min_{0};
    Latency max_{0};
    Latency sum_{0};
    uint64_t count_ = 0;
};
