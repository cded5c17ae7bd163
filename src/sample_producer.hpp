/*
 * sample_producer.hpp - Probe subprocess supervision
 *
 * Launches the external probe (normally `ping <host> -i <interval>`), reads
 * its output in a background thread, runs every line through a SampleParser
 * and pushes the resulting samples to the EventQueue in arrival order.
 *
 * Exactly one outcome is pushed per run: start failure, stream failure,
 * exit failure, clean exit, or cancellation. Cancellation comes from either
 * EventQueue::request_cancel() or stop(); the child's process group is then
 * sent SIGTERM, and SIGKILL if it is still alive after KILL_TIMEOUT. The
 * child is always reaped before the supervisor thread ends.
 *
 * Usage: construct with the queue and parser, call start() with a command,
 * consume events from the queue, call stop() (or destroy) to shut down.
 */

#pragma once

#include "event_queue.hpp"
#include "sample_parser.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

struct ProbeCommand {
    std::vector<std::string> argv;

    // `<program> <host> -i <interval_seconds>`
    static ProbeCommand ping(const std::string& host, int interval_seconds,
                             const std::string& program = "ping");

    std::string to_string() const;
};

class SampleProducer {
public:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};
    static constexpr std::chrono::milliseconds KILL_TIMEOUT{2000};
    static constexpr int MAX_DRAIN_READS = 64;

    SampleProducer(EventQueue& events, const SampleParser& parser);
    ~SampleProducer();

    // Non-copyable
    SampleProducer(const SampleProducer&) = delete;
    SampleProducer& operator=(const SampleProducer&) = delete;

    // Launch the probe. On failure a START_FAILED outcome has been pushed
    // and get_error() describes it.
    bool start(const ProbeCommand& command);

    // Cancel the run and wait until the child is reaped. Idempotent.
    void stop();

    // State queries
    bool is_running() const { return running_.load(); }
    pid_t pid() const { return pid_.load(); }
    std::string get_error() const { return error_; }
    uint64_t lines_read() const { return lines_read_.load(); }

private:
    void supervise();
    bool collect_exited_child(int& status);
    void drain_output(std::string& buffer);
    void consume(std::string& buffer, const char* data, size_t length);
    void handle_line(const std::string& line);
    bool cancel_requested() const;

    void fail_start(const std::string& message);
    void signal_child(int sig);
    void terminate_child();
    Outcome exit_outcome(int status) const;

    EventQueue& events_;
    const SampleParser& parser_;

    std::atomic<pid_t> pid_{-1};
    int output_fd_ = -1;
    std::string command_line_;
    std::string error_;
    std::string last_noise_;  // Last unrecognized line, used in exit messages

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> lines_read_{0};
    std::thread supervisor_;
};
