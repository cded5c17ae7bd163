/*
 * monitor.cpp - Consumer loop implementation
 */

#include "monitor.hpp"
#include "log.hpp"

Monitor::Monitor(EventQueue& events, LatencyStats& stats)
    : events_(events), stats_(stats) {}

bool Monitor::poll(std::chrono::milliseconds timeout) {
    if (outcome_) {
        return false;
    }

    auto event = events_.wait_next(timeout);
    if (!event) {
        return true;
    }

    switch (event->type) {
        case ProbeEvent::Type::SAMPLE:
            stats_.update(event->latency);
            samples_seen_++;
            return true;

        case ProbeEvent::Type::OUTCOME:
            outcome_ = event->outcome;
            break;

        case ProbeEvent::Type::CANCEL: {
            Outcome cancelled;
            cancelled.kind = OutcomeKind::CANCELLED;
            outcome_ = cancelled;
            break;
        }
    }

    Log::info("run ended after " + std::to_string(samples_seen_) +
              " samples: " + outcome_->describe());
    return false;
}

int Monitor::exit_code() const {
    if (!outcome_ || !outcome_->is_error()) {
        return 0;
    }
    return 1;
}
