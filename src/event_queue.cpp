/*
 * event_queue.cpp - Probe event channel implementation
 */

#include "event_queue.hpp"

const char* outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::CANCELLED:     return "cancelled";
        case OutcomeKind::START_FAILED:  return "start failed";
        case OutcomeKind::STREAM_FAILED: return "output stream failed";
        case OutcomeKind::EXIT_FAILED:   return "probe exited with error";
        case OutcomeKind::EXITED:        return "probe exited";
    }
    return "unknown";
}

std::string Outcome::describe() const {
    std::string text = outcome_kind_name(kind);
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

bool EventQueue::push_sample(Latency latency) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        ProbeEvent event;
        event.type = ProbeEvent::Type::SAMPLE;
        event.latency = latency;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

bool EventQueue::push_outcome(Outcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        closed_ = true;

        ProbeEvent event;
        event.type = ProbeEvent::Type::OUTCOME;
        event.outcome = std::move(outcome);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

void EventQueue::request_cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

std::optional<ProbeEvent> EventQueue::wait_next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait_for(lock, timeout, [this]() {
        return cancelled_.load() || !events_.empty();
    });

    if (cancelled_.load()) {
        ProbeEvent event;
        event.type = ProbeEvent::Type::CANCEL;
        return event;
    }

    if (events_.empty()) {
        return std::nullopt;
    }

    ProbeEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool EventQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
