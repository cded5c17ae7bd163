/*
 * latency_stats.cpp - Latency statistics engine implementation
 */

#include "latency_stats.hpp"
#include "log.hpp"

LatencyStats::LatencyStats(std::chrono::seconds window_span,
                           std::vector<int64_t> thresholds_ms,
                           Clock::time_point opened_at)
    : window_span_(window_span),
      window_opened_(opened_at),
      histogram_(std::move(thresholds_ms)) {}

void LatencyStats::update(Latency latency) {
    update(latency, Clock::now());
}

void LatencyStats::update(Latency latency, Clock::time_point now) {
    window_.update(latency);
    totals_.update(latency);
    histogram_.update(latency);

    if (now - window_opened_ > window_span_) {
        last_window_ = window_;
        window_.reset();
        window_opened_ = now;
        rollovers_++;

        Log::debug("window rolled over: " + last_window_.summary().format());
    }
}

StatsSnapshot LatencyStats::snapshot() const {
    StatsSnapshot s;
    s.last_window = last_window_.summary();
    s.totals = totals_.summary();
    s.current = window_.summary();
    s.thresholds = histogram_.thresholds();
    s.buckets = histogram_.buckets();
    s.total = histogram_.total();
    s.overflow = histogram_.overflow();
    s.rollovers = rollovers_;
    s.window_span = window_span_;
    return s;
}
