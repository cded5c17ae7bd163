/*
 * latency_stats.hpp - Latency statistics engine
 *
 * Owns the current window, the last completed window, the lifetime totals
 * and the histogram. Every sample goes to all four. After a sample, if the
 * current window has been open longer than the configured span, it becomes
 * the last completed window and a fresh one is opened.
 *
 * Rollover is only checked when a sample arrives: with no traffic, the
 * current window stays open no matter how much time passes.
 *
 * Not thread-safe. Only the consumer loop may call update().
 */

#pragma once

#include "histogram.hpp"
#include "window.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

// Read-only copy of the engine state for rendering
struct StatsSnapshot {
    WindowSummary last_window;
    WindowSummary totals;
    WindowSummary current;
    std::vector<int64_t> thresholds;
    std::vector<uint64_t> buckets;
    uint64_t total = 0;
    uint64_t overflow = 0;
    uint64_t rollovers = 0;
    std::chrono::seconds window_span{0};
};

class LatencyStats {
public:
    using Clock = std::chrono::steady_clock;

    LatencyStats(std::chrono::seconds window_span,
                 std::vector<int64_t> thresholds_ms,
                 Clock::time_point opened_at = Clock::now());

    void update(Latency latency);
    void update(Latency latency, Clock::time_point now);

    StatsSnapshot snapshot() const;

    const Window& current_window() const { return window_; }
    const Window& last_window() const { return last_window_; }
    const Window& totals() const { return totals_; }
    const Histogram& histogram() const { return histogram_; }
    uint64_t rollovers() const { return rollovers_; }

private:
    std::chrono::seconds window_span_;
    Clock::time_point window_opened_;
    Window window_;
    Window last_window_;
    Window totals_;
    Histogram histogram_;
    uint64_t rollovers_ = 0;
};
