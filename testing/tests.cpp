/*
 * tests.cpp - Unit tests for latency-monitor
 *
 * Uses the attest.h single-header testing framework. Covers the line
 * parser, the window/histogram accumulators, the statistics engine, the
 * event channel, the consumer loop, the probe subprocess supervisor (with
 * /bin/sh and sleep standing in for ping), and the settings layer.
 */

#define ATTEST_IMPLEMENTATION
#include "attest.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Include project headers
#include "../src/config.hpp"
#include "../src/event_queue.hpp"
#include "../src/histogram.hpp"
#include "../src/latency_stats.hpp"
#include "../src/log.hpp"
#include "../src/monitor.hpp"
#include "../src/panels/distribution.hpp"
#include "../src/sample_parser.hpp"
#include "../src/sample_producer.hpp"
#include "../src/settings.hpp"
#include "../src/ui.hpp"
#include "../src/window.hpp"

using namespace std::chrono_literals;

namespace {

Latency ms(double value) {
    return Latency(static_cast<Latency::rep>(value * 1000.0));
}

std::string reply_line(int seq, const std::string& time) {
    return "64 bytes from 1.2.3.4: icmp_seq=" + std::to_string(seq) +
           " ttl=64 time=" + time + " ms";
}

// Collect events until the outcome arrives or the limit passes
std::vector<ProbeEvent> drain_until_outcome(EventQueue& events,
                                            std::chrono::milliseconds limit) {
    std::vector<ProbeEvent> seen;
    auto deadline = std::chrono::steady_clock::now() + limit;

    while (std::chrono::steady_clock::now() < deadline) {
        auto event = events.wait_next(50ms);
        if (!event) {
            continue;
        }
        seen.push_back(*event);
        if (event->type != ProbeEvent::Type::SAMPLE) {
            break;
        }
    }
    return seen;
}

bool process_gone(pid_t pid) {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

}  // namespace

// =============================================================================
// PingLineParser Tests
// =============================================================================

REGISTER_TEST(parser_reply_line)
{
    PingLineParser parser;
    ParsedLine parsed = parser.parse("64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=23.4 ms");
    ATTEST_TRUE(parsed.kind == LineKind::DATA);
    ATTEST_TRUE(parsed.latency.count() == 23400);
}

REGISTER_TEST(parser_sub_millisecond_precision)
{
    PingLineParser parser;
    ParsedLine parsed = parser.parse(reply_line(7, "0.042"));
    ATTEST_TRUE(parsed.kind == LineKind::DATA);
    ATTEST_TRUE(parsed.latency.count() == 42);
}

REGISTER_TEST(parser_integer_time)
{
    PingLineParser parser;
    ParsedLine parsed = parser.parse(reply_line(3, "123"));
    ATTEST_TRUE(parsed.kind == LineKind::DATA);
    ATTEST_TRUE(parsed.latency.count() == 123000);
}

REGISTER_TEST(parser_carriage_return)
{
    PingLineParser parser;
    ParsedLine parsed = parser.parse(reply_line(1, "5.0") + "\r");
    ATTEST_TRUE(parsed.kind == LineKind::DATA);
    ATTEST_TRUE(parsed.latency.count() == 5000);
}

REGISTER_TEST(parser_banner_and_blank_are_ignorable)
{
    PingLineParser parser;
    ATTEST_TRUE(parser.parse("PING google.co.uk (142.250.187.227) 56(84) bytes of data.").kind ==
                LineKind::IGNORABLE);
    ATTEST_TRUE(parser.parse("").kind == LineKind::IGNORABLE);
    ATTEST_TRUE(parser.parse("   \t").kind == LineKind::IGNORABLE);
    ATTEST_TRUE(parser.dropped_lines() == 0);
}

REGISTER_TEST(parser_noise_is_dropped_and_counted)
{
    PingLineParser parser;
    const char* noise[] = {
        "Request timeout for icmp_seq 5",
        "From 10.0.0.1 icmp_seq=1 Destination Host Unreachable",
        "64 bytes from ::1: icmp_seq=1 ttl=64 time=0.1 ms",
        "--- google.co.uk ping statistics ---",
        "64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=abc ms",
    };

    for (const char* line : noise) {
        ATTEST_TRUE(parser.parse(line).kind == LineKind::UNRECOGNIZED);
    }
    ATTEST_TRUE(parser.dropped_lines() == 5);
}

REGISTER_TEST(parser_rejects_time_beyond_range)
{
    PingLineParser parser;
    ParsedLine parsed = parser.parse(reply_line(1, "99999999999999999999.0"));
    ATTEST_TRUE(parsed.kind == LineKind::UNRECOGNIZED);
    ATTEST_TRUE(parsed.latency.count() == 0);
    ATTEST_TRUE(parser.dropped_lines() == 1);

    Latency out{0};
    ATTEST_FALSE(PingLineParser::parse_milliseconds("9223372036854775.807", out));
    ATTEST_TRUE(PingLineParser::parse_milliseconds("9223372036854.0", out));
    ATTEST_TRUE(out.count() > 0);
}

REGISTER_TEST(parser_parse_milliseconds_rejects_garbage)
{
    Latency out{0};
    ATTEST_FALSE(PingLineParser::parse_milliseconds("", out));
    ATTEST_FALSE(PingLineParser::parse_milliseconds("abc", out));
    ATTEST_FALSE(PingLineParser::parse_milliseconds("1.5x", out));
    ATTEST_TRUE(PingLineParser::parse_milliseconds("1.5", out));
    ATTEST_TRUE(out.count() == 1500);
}

// =============================================================================
// Window Tests
// =============================================================================

REGISTER_TEST(window_empty_is_all_zero)
{
    Window w;
    ATTEST_TRUE(w.empty());
    ATTEST_TRUE(w.min().count() == 0);
    ATTEST_TRUE(w.max().count() == 0);
    ATTEST_TRUE(w.sum().count() == 0);
    ATTEST_TRUE(w.average().count() == 0);
    ATTEST_EQUAL(w.summary().format(), "Min: 0ms, Max: 0ms, Avg: 0ms");
}

REGISTER_TEST(window_tracks_min_max_average)
{
    Window w;
    w.update(ms(5));
    w.update(ms(1));
    w.update(ms(3));

    ATTEST_TRUE(w.count() == 3);
    ATTEST_TRUE(w.min() == ms(1));
    ATTEST_TRUE(w.max() == ms(5));
    ATTEST_TRUE(w.sum() == ms(9));
    ATTEST_TRUE(w.average() == ms(3));
    ATTEST_EQUAL(w.summary().format(), "Min: 1ms, Max: 5ms, Avg: 3ms");
}

REGISTER_TEST(window_average_truncates)
{
    Window w;
    w.update(ms(1));
    w.update(ms(2));

    WindowSummary s = w.summary();
    ATTEST_TRUE(s.avg_ms == 1);
    ATTEST_TRUE(w.average().count() == 1500);
}

REGISTER_TEST(window_first_sample_zero_latency)
{
    Window w;
    w.update(ms(0));
    w.update(ms(4));

    ATTEST_TRUE(w.count() == 2);
    ATTEST_TRUE(w.min().count() == 0);
    ATTEST_TRUE(w.max() == ms(4));
}

REGISTER_TEST(window_reset)
{
    Window w;
    w.update(ms(10));
    w.reset();

    ATTEST_TRUE(w.empty());
    ATTEST_TRUE(w.min().count() == 0);
    ATTEST_TRUE(w.max().count() == 0);
    ATTEST_TRUE(w.sum().count() == 0);
}

// =============================================================================
// Histogram Tests
// =============================================================================

REGISTER_TEST(histogram_default_thresholds)
{
    std::vector<int64_t> expected = {1, 2, 5, 10, 20, 50, 100, 200, 500, 1000};
    ATTEST_TRUE(Histogram::default_thresholds() == expected);
}

REGISTER_TEST(histogram_threshold_is_inclusive)
{
    Histogram h(Histogram::default_thresholds());
    h.update(ms(5));
    h.update(ms(5.001));
    h.update(ms(0.5));

    ATTEST_TRUE(h.buckets()[0] == 1);  // 1ms
    ATTEST_TRUE(h.buckets()[2] == 1);  // 5ms
    ATTEST_TRUE(h.buckets()[3] == 1);  // 10ms
    ATTEST_TRUE(h.total() == 3);
    ATTEST_TRUE(h.overflow() == 0);
}

REGISTER_TEST(histogram_overflow_counts_only_in_total)
{
    Histogram h(Histogram::default_thresholds());
    h.update(ms(1500));
    h.update(ms(20));

    uint64_t bucketed = 0;
    for (auto count : h.buckets()) bucketed += count;

    ATTEST_TRUE(h.total() == 2);
    ATTEST_TRUE(bucketed == 1);
    ATTEST_TRUE(h.overflow() == 1);
    ATTEST_TRUE(h.max_bucket() == 1);
}

REGISTER_TEST(histogram_rejects_bad_thresholds)
{
    const std::vector<std::vector<int64_t>> bad = {
        {},
        {1, 1, 2},
        {5, 2},
        {0, 1},
        {-1, 10},
    };

    for (const auto& thresholds : bad) {
        bool threw = false;
        try {
            Histogram h(thresholds);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ATTEST_TRUE(threw);
    }
}

// =============================================================================
// LatencyStats Tests
// =============================================================================

REGISTER_TEST(stats_routes_every_sample_everywhere)
{
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(5s, Histogram::default_thresholds(), t0);

    stats.update(ms(3), t0 + 1s);

    ATTEST_TRUE(stats.current_window().count() == 1);
    ATTEST_TRUE(stats.totals().count() == 1);
    ATTEST_TRUE(stats.histogram().total() == 1);
    ATTEST_TRUE(stats.last_window().empty());
}

REGISTER_TEST(stats_rollover_after_span)
{
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(5s, Histogram::default_thresholds(), t0);

    stats.update(ms(10), t0 + 1s);
    stats.update(ms(30), t0 + 3s);
    ATTEST_TRUE(stats.rollovers() == 0);

    // The sample that trips the rollover belongs to the window it closes
    stats.update(ms(20), t0 + 6s);

    ATTEST_TRUE(stats.rollovers() == 1);
    ATTEST_TRUE(stats.current_window().empty());
    ATTEST_TRUE(stats.last_window().count() == 3);
    ATTEST_TRUE(stats.last_window().min() == ms(10));
    ATTEST_TRUE(stats.last_window().max() == ms(30));
    ATTEST_TRUE(stats.last_window().average() == ms(20));
    ATTEST_TRUE(stats.totals().count() == 3);

    // Next window opens at the rollover time
    stats.update(ms(40), t0 + 10s);
    ATTEST_TRUE(stats.rollovers() == 1);
    ATTEST_TRUE(stats.current_window().count() == 1);
    ATTEST_TRUE(stats.last_window().count() == 3);
}

REGISTER_TEST(stats_no_rollover_exactly_at_span)
{
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(5s, Histogram::default_thresholds(), t0);

    stats.update(ms(1), t0 + 5s);
    ATTEST_TRUE(stats.rollovers() == 0);
    ATTEST_TRUE(stats.current_window().count() == 1);
}

REGISTER_TEST(stats_no_rollover_without_traffic)
{
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(1s, Histogram::default_thresholds(), t0);

    stats.update(ms(2), t0 + 100ms);
    StatsSnapshot before = stats.snapshot();

    // Time passing on its own changes nothing
    std::this_thread::sleep_for(1200ms);
    StatsSnapshot after = stats.snapshot();

    ATTEST_TRUE(after.rollovers == 0);
    ATTEST_TRUE(after.current.count == before.current.count);
    ATTEST_TRUE(after.last_window.count == 0);

    // The first sample after the span closes the idle window in one step
    stats.update(ms(4), t0 + 100s);
    ATTEST_TRUE(stats.rollovers() == 1);
    ATTEST_TRUE(stats.last_window().count() == 2);
}

REGISTER_TEST(stats_snapshot_does_not_mutate)
{
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(5s, {10, 100}, t0);
    stats.update(ms(7), t0 + 1s);
    stats.update(ms(70), t0 + 2s);
    stats.update(ms(700), t0 + 3s);

    StatsSnapshot a = stats.snapshot();
    StatsSnapshot b = stats.snapshot();

    ATTEST_TRUE(a.buckets == b.buckets);
    ATTEST_TRUE(a.total == 3);
    ATTEST_TRUE(a.overflow == 1);
    ATTEST_TRUE(a.totals.min_ms == 7);
    ATTEST_TRUE(a.totals.max_ms == 700);
    ATTEST_TRUE(a.totals.avg_ms == 259);
    ATTEST_TRUE(a.window_span == 5s);
    ATTEST_TRUE(stats.current_window().count() == 3);
}

REGISTER_TEST(end_to_end_three_lines)
{
    PingLineParser parser;
    auto t0 = LatencyStats::Clock::now();
    LatencyStats stats(5s, Histogram::default_thresholds(), t0);

    const std::string lines[] = {
        reply_line(1, "1.0"),
        reply_line(2, "3.0"),
        reply_line(3, "5.0"),
    };

    for (const auto& line : lines) {
        ParsedLine parsed = parser.parse(line);
        ATTEST_TRUE(parsed.kind == LineKind::DATA);
        stats.update(parsed.latency, t0 + 1s);
    }

    StatsSnapshot snap = stats.snapshot();
    ATTEST_TRUE(snap.totals.min_ms == 1);
    ATTEST_TRUE(snap.totals.max_ms == 5);
    ATTEST_TRUE(snap.totals.avg_ms == 3);
    ATTEST_TRUE(snap.totals.count == 3);

    // 1.0 -> 1ms bucket, 3.0 and 5.0 -> 5ms bucket
    ATTEST_TRUE(snap.buckets[0] == 1);
    ATTEST_TRUE(snap.buckets[1] == 0);
    ATTEST_TRUE(snap.buckets[2] == 2);
    ATTEST_TRUE(snap.total == 3);
}

// =============================================================================
// EventQueue Tests
// =============================================================================

REGISTER_TEST(event_queue_preserves_order)
{
    EventQueue events;
    ATTEST_TRUE(events.push_sample(ms(1)));
    ATTEST_TRUE(events.push_sample(ms(2)));
    ATTEST_TRUE(events.push_sample(ms(3)));

    for (int i = 1; i <= 3; ++i) {
        auto event = events.wait_next(10ms);
        ATTEST_TRUE(event.has_value());
        ATTEST_TRUE(event->type == ProbeEvent::Type::SAMPLE);
        ATTEST_TRUE(event->latency == ms(i));
    }

    ATTEST_FALSE(events.wait_next(10ms).has_value());
}

REGISTER_TEST(event_queue_single_outcome)
{
    EventQueue events;
    Outcome exited;
    exited.kind = OutcomeKind::EXITED;
    Outcome failed;
    failed.kind = OutcomeKind::EXIT_FAILED;

    ATTEST_TRUE(events.push_outcome(exited));
    ATTEST_FALSE(events.push_outcome(failed));
    ATTEST_FALSE(events.push_sample(ms(1)));
    ATTEST_TRUE(events.is_closed());
    ATTEST_TRUE(events.pending() == 1);

    auto event = events.wait_next(10ms);
    ATTEST_TRUE(event.has_value());
    ATTEST_TRUE(event->type == ProbeEvent::Type::OUTCOME);
    ATTEST_TRUE(event->outcome.kind == OutcomeKind::EXITED);
}

REGISTER_TEST(event_queue_cancel_jumps_the_queue)
{
    EventQueue events;
    events.push_sample(ms(1));
    events.push_sample(ms(2));
    events.request_cancel();
    events.request_cancel();

    auto event = events.wait_next(10ms);
    ATTEST_TRUE(event.has_value());
    ATTEST_TRUE(event->type == ProbeEvent::Type::CANCEL);
    ATTEST_TRUE(events.is_cancelled());
}

REGISTER_TEST(event_queue_cancel_wakes_waiter)
{
    EventQueue events;

    std::thread canceller([&events]() {
        std::this_thread::sleep_for(50ms);
        events.request_cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto event = events.wait_next(5000ms);
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    ATTEST_TRUE(event.has_value());
    ATTEST_TRUE(event->type == ProbeEvent::Type::CANCEL);
    ATTEST_TRUE(waited < 2s);
}

REGISTER_TEST(outcome_describe)
{
    Outcome outcome;
    outcome.kind = OutcomeKind::EXIT_FAILED;
    outcome.message = "exit status 2";
    ATTEST_EQUAL(outcome.describe(), "probe exited with error: exit status 2");
    ATTEST_TRUE(outcome.is_error());

    Outcome cancelled;
    ATTEST_FALSE(cancelled.is_error());
    ATTEST_EQUAL(cancelled.describe(), "cancelled");
}

// =============================================================================
// Monitor Tests
// =============================================================================

REGISTER_TEST(monitor_applies_samples_then_stops_on_outcome)
{
    EventQueue events;
    LatencyStats stats(5s, Histogram::default_thresholds());
    Monitor monitor(events, stats);

    events.push_sample(ms(4));
    events.push_sample(ms(8));
    Outcome failed;
    failed.kind = OutcomeKind::EXIT_FAILED;
    failed.message = "exit status 1";
    events.push_outcome(failed);

    ATTEST_TRUE(monitor.poll(10ms));
    ATTEST_TRUE(monitor.poll(10ms));
    ATTEST_FALSE(monitor.poll(10ms));
    ATTEST_FALSE(monitor.poll(10ms));

    ATTEST_TRUE(monitor.samples_seen() == 2);
    ATTEST_TRUE(stats.totals().count() == 2);
    ATTEST_TRUE(monitor.outcome().has_value());
    ATTEST_TRUE(monitor.outcome()->kind == OutcomeKind::EXIT_FAILED);
    ATTEST_TRUE(monitor.exit_code() == 1);
}

REGISTER_TEST(monitor_timeout_keeps_running)
{
    EventQueue events;
    LatencyStats stats(5s, Histogram::default_thresholds());
    Monitor monitor(events, stats);

    ATTEST_TRUE(monitor.poll(10ms));
    ATTEST_TRUE(monitor.is_running());
    ATTEST_TRUE(monitor.exit_code() == 0);
}

REGISTER_TEST(monitor_cancel_stops_before_queued_samples)
{
    EventQueue events;
    LatencyStats stats(5s, Histogram::default_thresholds());
    Monitor monitor(events, stats);

    events.push_sample(ms(4));
    events.request_cancel();

    ATTEST_FALSE(monitor.poll(10ms));
    ATTEST_TRUE(stats.totals().count() == 0);
    ATTEST_TRUE(monitor.outcome()->kind == OutcomeKind::CANCELLED);
    ATTEST_TRUE(monitor.exit_code() == 0);
}

// =============================================================================
// SampleProducer Tests
// =============================================================================

REGISTER_TEST(probe_command_ping)
{
    ProbeCommand command = ProbeCommand::ping("example.com", 2);
    std::vector<std::string> expected = {"ping", "example.com", "-i", "2"};
    ATTEST_TRUE(command.argv == expected);
    ATTEST_EQUAL(command.to_string(), "ping example.com -i 2");
}

REGISTER_TEST(producer_start_failure)
{
    EventQueue events;
    PingLineParser parser;
    LatencyStats stats(5s, Histogram::default_thresholds());
    SampleProducer producer(events, parser);

    ProbeCommand command;
    command.argv = {"/nonexistent/latency-monitor-probe", "host"};

    ATTEST_FALSE(producer.start(command));
    ATTEST_FALSE(producer.is_running());
    ATTEST_FALSE(producer.get_error().empty());

    Monitor monitor(events, stats);
    ATTEST_FALSE(monitor.poll(100ms));
    ATTEST_TRUE(monitor.outcome()->kind == OutcomeKind::START_FAILED);
    ATTEST_TRUE(monitor.samples_seen() == 0);
    ATTEST_TRUE(stats.totals().empty());
    ATTEST_TRUE(stats.current_window().empty());
    ATTEST_TRUE(stats.histogram().total() == 0);
    ATTEST_TRUE(monitor.exit_code() == 1);
}

REGISTER_TEST(producer_empty_command)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    ATTEST_FALSE(producer.start(ProbeCommand{}));

    auto event = events.wait_next(10ms);
    ATTEST_TRUE(event.has_value());
    ATTEST_TRUE(event->outcome.kind == OutcomeKind::START_FAILED);
}

REGISTER_TEST(producer_emits_samples_in_order_then_exit)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    ProbeCommand command;
    command.argv = {
        "/bin/sh", "-c",
        "echo 'PING host (1.2.3.4) 56(84) bytes of data.'; "
        "echo '64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=23.4 ms'; "
        "echo 'not a reply'; "
        "echo; "
        "echo '64 bytes from 1.2.3.4: icmp_seq=2 ttl=64 time=1.5 ms'; "
        "printf '64 bytes from 1.2.3.4: icmp_seq=3 ttl=64 time=7.0 ms'"
    };

    ATTEST_TRUE(producer.start(command));

    auto seen = drain_until_outcome(events, 5000ms);
    producer.stop();

    ATTEST_TRUE(seen.size() == 4);
    ATTEST_TRUE(seen[0].type == ProbeEvent::Type::SAMPLE);
    ATTEST_TRUE(seen[0].latency.count() == 23400);
    ATTEST_TRUE(seen[1].latency.count() == 1500);
    ATTEST_TRUE(seen[2].latency.count() == 7000);
    ATTEST_TRUE(seen[3].type == ProbeEvent::Type::OUTCOME);
    ATTEST_TRUE(seen[3].outcome.kind == OutcomeKind::EXITED);
    ATTEST_TRUE(parser.dropped_lines() == 1);
    ATTEST_TRUE(producer.lines_read() == 6);
    ATTEST_FALSE(producer.is_running());
}

REGISTER_TEST(producer_exit_failure)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    ProbeCommand command;
    command.argv = {"/bin/sh", "-c", "echo 'ping: unknown host' >&2; exit 3"};

    ATTEST_TRUE(producer.start(command));

    auto seen = drain_until_outcome(events, 5000ms);
    producer.stop();

    ATTEST_TRUE(seen.size() == 1);
    ATTEST_TRUE(seen[0].type == ProbeEvent::Type::OUTCOME);
    ATTEST_TRUE(seen[0].outcome.kind == OutcomeKind::EXIT_FAILED);
    ATTEST_TRUE(seen[0].outcome.message.find("exit status 3") != std::string::npos);
    ATTEST_TRUE(seen[0].outcome.message.find("unknown host") != std::string::npos);
}

REGISTER_TEST(producer_exit_with_background_child)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    // The background sleep inherits the output pipe and outlives the shell
    ProbeCommand command;
    command.argv = {
        "/bin/sh", "-c",
        "echo '64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=2.5 ms'; sleep 6 & exit 3"
    };

    auto start = std::chrono::steady_clock::now();
    ATTEST_TRUE(producer.start(command));

    auto seen = drain_until_outcome(events, 5000ms);
    auto waited = std::chrono::steady_clock::now() - start;
    producer.stop();

    ATTEST_TRUE(waited < 3s);
    ATTEST_TRUE(seen.size() == 2);
    ATTEST_TRUE(seen[0].type == ProbeEvent::Type::SAMPLE);
    ATTEST_TRUE(seen[0].latency.count() == 2500);
    ATTEST_TRUE(seen[1].type == ProbeEvent::Type::OUTCOME);
    ATTEST_TRUE(seen[1].outcome.kind == OutcomeKind::EXIT_FAILED);
    ATTEST_TRUE(seen[1].outcome.message.find("exit status 3") != std::string::npos);
    ATTEST_TRUE(producer.pid() == -1);
    ATTEST_FALSE(producer.is_running());
}

REGISTER_TEST(producer_child_sees_only_stdio)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    // One line per descriptor the shell holds open
    ProbeCommand command;
    command.argv = {"/bin/sh", "-c", "for f in /proc/$$/fd/*; do echo \"fd ${f##*/}\"; done"};

    ATTEST_TRUE(producer.start(command));

    auto seen = drain_until_outcome(events, 5000ms);
    producer.stop();

    ATTEST_TRUE(seen.size() == 1);
    ATTEST_TRUE(seen[0].outcome.kind == OutcomeKind::EXITED);
    ATTEST_TRUE(producer.lines_read() == 3);
    ATTEST_TRUE(parser.dropped_lines() == 3);
}

REGISTER_TEST(producer_stop_before_any_sample)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    ProbeCommand command;
    command.argv = {"sleep", "30"};

    ATTEST_TRUE(producer.start(command));
    pid_t pid = producer.pid();
    ATTEST_TRUE(pid > 0);

    auto start = std::chrono::steady_clock::now();
    producer.stop();
    ATTEST_TRUE(std::chrono::steady_clock::now() - start < 5s);

    ATTEST_FALSE(producer.is_running());
    ATTEST_TRUE(producer.pid() == -1);
    ATTEST_TRUE(process_gone(pid));

    auto seen = drain_until_outcome(events, 1000ms);
    ATTEST_TRUE(seen.size() == 1);
    ATTEST_TRUE(seen[0].type == ProbeEvent::Type::OUTCOME);
    ATTEST_TRUE(seen[0].outcome.kind == OutcomeKind::CANCELLED);

    // Idempotent
    producer.stop();
}

REGISTER_TEST(producer_cancel_through_queue)
{
    EventQueue events;
    PingLineParser parser;
    LatencyStats stats(5s, Histogram::default_thresholds());
    SampleProducer producer(events, parser);
    Monitor monitor(events, stats);

    ProbeCommand command;
    command.argv = {"/bin/sh", "-c", "sleep 30; echo '64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=1.0 ms'"};

    ATTEST_TRUE(producer.start(command));
    pid_t pid = producer.pid();

    events.request_cancel();
    ATTEST_FALSE(monitor.poll(100ms));
    ATTEST_TRUE(monitor.outcome()->kind == OutcomeKind::CANCELLED);

    // The supervisor notices the cancellation on its own
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (producer.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    ATTEST_FALSE(producer.is_running());

    producer.stop();
    ATTEST_TRUE(process_gone(pid));
    ATTEST_TRUE(stats.totals().count() == 0);
}

REGISTER_TEST(producer_kills_child_ignoring_sigterm)
{
    EventQueue events;
    PingLineParser parser;
    SampleProducer producer(events, parser);

    ProbeCommand command;
    command.argv = {"/bin/sh", "-c", "trap '' TERM; echo ready; while :; do sleep 1; done"};

    ATTEST_TRUE(producer.start(command));
    pid_t pid = producer.pid();

    // Give the shell time to install the trap
    std::this_thread::sleep_for(300ms);

    producer.stop();
    ATTEST_TRUE(process_gone(pid));
}

// =============================================================================
// Settings Tests
// =============================================================================

REGISTER_TEST(settings_defaults)
{
    Settings settings;
    std::string error;
    ATTEST_EQUAL(settings.host, "google.co.uk");
    ATTEST_TRUE(settings.interval_seconds == 1);
    ATTEST_TRUE(settings.window_seconds == 5);
    ATTEST_TRUE(settings.thresholds_ms == Histogram::default_thresholds());
    ATTEST_TRUE(settings.validate(error));
}

REGISTER_TEST(settings_parse_args)
{
    Settings settings;
    std::string error;
    const char* argv[] = {"latency-monitor", "example.org", "-d", "2", "--window", "30",
                          "--thresholds", "10,50,250"};
    ATTEST_TRUE(settings.parse_args(8, const_cast<char**>(argv), error));

    ATTEST_EQUAL(settings.host, "example.org");
    ATTEST_TRUE(settings.interval_seconds == 2);
    ATTEST_TRUE(settings.window_seconds == 30);
    std::vector<int64_t> expected = {10, 50, 250};
    ATTEST_TRUE(settings.thresholds_ms == expected);

    ProbeCommand command = settings.probe_command();
    ATTEST_EQUAL(command.to_string(), "ping example.org -i 2");
}

REGISTER_TEST(settings_parse_args_host_flag)
{
    Settings settings;
    std::string error;
    const char* argv[] = {"latency-monitor", "--host", "10.0.0.1", "--probe", "/bin/ping"};
    ATTEST_TRUE(settings.parse_args(5, const_cast<char**>(argv), error));
    ATTEST_EQUAL(settings.host, "10.0.0.1");
    ATTEST_EQUAL(settings.probe, "/bin/ping");
}

REGISTER_TEST(settings_parse_args_rejects_bad_input)
{
    std::string error;

    {
        Settings settings;
        const char* argv[] = {"latency-monitor", "-d", "0"};
        ATTEST_FALSE(settings.parse_args(3, const_cast<char**>(argv), error));
        ATTEST_TRUE(settings.interval_seconds == 1);
    }
    {
        Settings settings;
        const char* argv[] = {"latency-monitor", "--window"};
        ATTEST_FALSE(settings.parse_args(2, const_cast<char**>(argv), error));
    }
    {
        Settings settings;
        const char* argv[] = {"latency-monitor", "--thresholds", "5,2"};
        ATTEST_FALSE(settings.parse_args(3, const_cast<char**>(argv), error));
    }
    {
        Settings settings;
        const char* argv[] = {"latency-monitor", "--bogus"};
        ATTEST_FALSE(settings.parse_args(2, const_cast<char**>(argv), error));
        ATTEST_EQUAL(error, "unknown argument: --bogus");
    }
}

REGISTER_TEST(settings_help_flag)
{
    Settings settings;
    std::string error;
    const char* argv[] = {"latency-monitor", "-h"};
    ATTEST_TRUE(settings.parse_args(2, const_cast<char**>(argv), error));
    ATTEST_TRUE(settings.show_help);
}

REGISTER_TEST(settings_load_file)
{
    std::string path = "/tmp/latency-monitor-test-" + std::to_string(getpid()) + ".conf";
    {
        std::ofstream file(path);
        file << "# comment\n"
             << "host: 192.168.1.1\n"
             << "interval: 3\n"
             << "window: -4\n"
             << "thresholds: 1, 10, 100\n"
             << "log: /var/tmp/latency.log\n"
             << "colour: blue\n";
    }

    Settings settings;
    int applied = settings.load(path);
    std::remove(path.c_str());

    ATTEST_TRUE(applied == 4);
    ATTEST_EQUAL(settings.host, "192.168.1.1");
    ATTEST_TRUE(settings.interval_seconds == 3);
    ATTEST_TRUE(settings.window_seconds == 5);
    std::vector<int64_t> expected = {1, 10, 100};
    ATTEST_TRUE(settings.thresholds_ms == expected);
    ATTEST_EQUAL(settings.log_path, "/var/tmp/latency.log");
    ATTEST_TRUE(settings.warnings.size() == 2);
}

REGISTER_TEST(settings_load_missing_file)
{
    Settings settings;
    ATTEST_TRUE(settings.load("/nonexistent/latency-monitor.conf") == 0);
    ATTEST_TRUE(settings.warnings.empty());
}

// =============================================================================
// Config::parse_fields Tests
// =============================================================================

REGISTER_TEST(config_parse_fields_basic)
{
    std::vector<std::string> fields = Config::parse_fields("host:example.com", ':');
    ATTEST_EQUAL(fields.size(), 2u);
    ATTEST_EQUAL(fields[0], "host");
    ATTEST_EQUAL(fields[1], "example.com");
}

REGISTER_TEST(config_parse_fields_escaped_delimiter)
{
    std::vector<std::string> fields = Config::parse_fields("log:C\\:/tmp", ':');
    ATTEST_EQUAL(fields.size(), 2u);
    ATTEST_EQUAL(fields[1], "C:/tmp");
}

REGISTER_TEST(config_parse_fields_custom_delimiter)
{
    std::vector<std::string> fields = Config::parse_fields("1,2,5", ',');
    ATTEST_EQUAL(fields.size(), 3u);
    ATTEST_EQUAL(fields[2], "5");
}

REGISTER_TEST(config_dir_follows_xdg)
{
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    Config::reset_cache();
    ATTEST_EQUAL(Config::get_config_dir(), "/tmp/xdg-test/latency-monitor");
    ATTEST_EQUAL(Config::get_config_path("latency-monitor.conf"),
                 "/tmp/xdg-test/latency-monitor/latency-monitor.conf");
    unsetenv("XDG_CONFIG_HOME");
    Config::reset_cache();
}

// =============================================================================
// Log Tests
// =============================================================================

REGISTER_TEST(log_format_line)
{
    std::string line = Log::format_line(Log::Level::WARN, "probe ignored SIGTERM");
    ATTEST_TRUE(line.find(" | WARN | probe ignored SIGTERM") != std::string::npos);
    // "YYYY-mm-dd HH:MM:SS" prefix
    ATTEST_TRUE(line.size() > 19 && line[4] == '-' && line[13] == ':');
}

REGISTER_TEST(log_parse_level)
{
    Log::Level level = Log::Level::INFO;
    ATTEST_TRUE(Log::parse_level("DEBUG", level));
    ATTEST_TRUE(level == Log::Level::DEBUG);
    ATTEST_TRUE(Log::parse_level("warning", level));
    ATTEST_TRUE(level == Log::Level::WARN);
    ATTEST_FALSE(Log::parse_level("loud", level));
}

REGISTER_TEST(log_writes_to_file)
{
    std::string path = "/tmp/latency-monitor-log-" + std::to_string(getpid()) + ".log";
    Log::set_file(path);
    Log::set_level(Log::Level::INFO);
    Log::debug("hidden");
    Log::error("shown");
    Log::set_file("");

    std::ifstream file(path);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::remove(path.c_str());

    ATTEST_TRUE(contents.find("| ERROR | shown") != std::string::npos);
    ATTEST_TRUE(contents.find("hidden") == std::string::npos);
}

// =============================================================================
// Formatting Helper Tests
// =============================================================================

REGISTER_TEST(ui_format_count)
{
    ATTEST_EQUAL(UI::format_count(0), "0");
    ATTEST_EQUAL(UI::format_count(999), "999");
    ATTEST_EQUAL(UI::format_count(1234567), "1,234,567");
}

REGISTER_TEST(ui_format_latency)
{
    ATTEST_EQUAL(UI::format_latency(23), "23ms");
    ATTEST_EQUAL(UI::format_latency(12000), "12s");
}

REGISTER_TEST(ui_truncate)
{
    ATTEST_EQUAL(UI::truncate("google.co.uk", 20), "google.co.uk");
    ATTEST_EQUAL(UI::truncate("google.co.uk", 8), "googl...");
}

REGISTER_TEST(ui_latency_color)
{
    ATTEST_TRUE(UI::latency_color(50, 200) == COLOR_FAST);
    ATTEST_TRUE(UI::latency_color(100, 200) == COLOR_MEDIUM);
    ATTEST_TRUE(UI::latency_color(150, 200) == COLOR_SLOW);
}

REGISTER_TEST(distribution_bar_length)
{
    ATTEST_TRUE(DistributionPanel::bar_length(0, 0, 50) == 0);
    ATTEST_TRUE(DistributionPanel::bar_length(10, 10, 50) == 50);
    ATTEST_TRUE(DistributionPanel::bar_length(5, 10, 50) == 25);
    ATTEST_TRUE(DistributionPanel::bar_length(1, 3, 50) == 16);
}
