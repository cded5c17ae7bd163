/*
 * window.cpp - Latency window implementation
 */

#include "window.hpp"
#include <algorithm>
#include <sstream>

namespace {

int64_t to_ms(Latency latency) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(latency).count();
}

}  // namespace

std::string WindowSummary::format() const {
    std::ostringstream oss;
    oss << "Min: " << min_ms << "ms, Max: " << max_ms << "ms, Avg: " << avg_ms << "ms";
    return oss.str();
}

void Window::update(Latency latency) {
    if (count_ == 0) {
        min_ = latency;
        max_ = latency;
        sum_ = latency;
        count_ = 1;
        return;
    }

    min_ = std::min(min_, latency);
    max_ = std::max(max_, latency);
    sum_ += latency;
    count_++;
}

void Window::reset() {
    min_ = Latency{0};
    max_ = Latency{0};
    sum_ = Latency{0};
    count_ = 0;
}

Latency Window::average() const {
    if (count_ == 0) {
        return Latency{0};
    }
    return Latency(sum_.count() / static_cast<Latency::rep>(count_));
}

WindowSummary Window::summary() const {
    WindowSummary s;
    s.min_ms = to_ms(min_);
    s.max_ms = to_ms(max_);
    s.avg_ms = to_ms(average());
    s.count = count_;
    return s;
}
