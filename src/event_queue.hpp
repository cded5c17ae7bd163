/*
 * event_queue.hpp - Probe event channel
 *
 * The single channel between the sample producer and the consumer loop.
 * Samples and the terminal outcome share one FIFO so they are consumed in
 * arrival order. A cancellation request jumps the queue: once requested,
 * wait_next() reports it before anything else.
 *
 * The producer side closes when the first outcome is pushed. Later samples
 * and outcomes are discarded, so exactly one outcome is ever delivered.
 */

#pragma once

#include "sample_parser.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

enum class OutcomeKind {
    CANCELLED,      // Stop requested before the probe exited
    START_FAILED,   // Probe process could not be launched
    STREAM_FAILED,  // Reading the probe output failed
    EXIT_FAILED,    // Probe exited with an error status or signal
    EXITED          // Probe exited cleanly
};

const char* outcome_kind_name(OutcomeKind kind);

struct Outcome {
    OutcomeKind kind = OutcomeKind::CANCELLED;
    std::string message;

    bool is_error() const { return kind != OutcomeKind::CANCELLED; }
    std::string describe() const;
};

struct ProbeEvent {
    enum class Type { SAMPLE, OUTCOME, CANCEL };

    Type type = Type::SAMPLE;
    Latency latency{0};
    Outcome outcome;
};

class EventQueue {
public:
    EventQueue() = default;

    // Non-copyable
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Producer side. Both return false once an outcome has been delivered.
    bool push_sample(Latency latency);
    bool push_outcome(Outcome outcome);

    // External stop notification, idempotent
    void request_cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Consumer side. Returns std::nullopt on timeout.
    std::optional<ProbeEvent> wait_next(std::chrono::milliseconds timeout);

    bool is_closed() const;
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProbeEvent> events_;
    bool closed_ = false;
    std::atomic<bool> cancelled_{false};
};
