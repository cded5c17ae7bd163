/*
 * monitor.hpp - Consumer loop over probe events
 *
 * Drains the EventQueue into LatencyStats, one event per poll(). Samples are
 * applied in arrival order. The first outcome or cancellation ends the run;
 * after that poll() consumes nothing and always returns false.
 *
 * The Monitor and the LatencyStats it updates belong to one thread.
 */

#pragma once

#include "event_queue.hpp"
#include "latency_stats.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

class Monitor {
public:
    Monitor(EventQueue& events, LatencyStats& stats);

    // Wait up to timeout for one event and apply it.
    // Returns true while the run continues.
    bool poll(std::chrono::milliseconds timeout);

    bool is_running() const { return !outcome_.has_value(); }
    uint64_t samples_seen() const { return samples_seen_; }

    // Valid once the run has ended
    const std::optional<Outcome>& outcome() const { return outcome_; }

    // Process exit code: 0 for cancellation or while running, 1 otherwise
    int exit_code() const;

private:
    EventQueue& events_;
    LatencyStats& stats_;
    std::optional<Outcome> outcome_;
    uint64_t samples_seen_ = 0;
};
