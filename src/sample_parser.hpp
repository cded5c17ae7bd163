/*
 * sample_parser.hpp - Probe output line classification
 *
 * Turns one line of probe output into either a latency sample, an ignorable
 * line (blank or the startup banner), or an unrecognized line. Unrecognized
 * lines are counted and dropped; they never stop the pipeline.
 *
 * SampleParser is the seam for other probe dialects. PingLineParser handles
 * the standard `ping` reply format:
 *   64 bytes from 1.2.3.4: icmp_seq=1 ttl=64 time=23.4 ms
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <regex>
#include <string>

using Latency = std::chrono::microseconds;

enum class LineKind { IGNORABLE, DATA, UNRECOGNIZED };

struct ParsedLine {
    LineKind kind = LineKind::IGNORABLE;
    Latency latency{0};  // Only meaningful for DATA
};

class SampleParser {
public:
    virtual ~SampleParser() = default;

    virtual ParsedLine parse(const std::string& line) const = 0;

    // Lines classified as UNRECOGNIZED since construction
    uint64_t dropped_lines() const { return dropped_.load(); }

protected:
    void count_dropped() const { dropped_.fetch_add(1); }

private:
    mutable std::atomic<uint64_t> dropped_{0};
};

class PingLineParser : public SampleParser {
public:
    PingLineParser();

    ParsedLine parse(const std::string& line) const override;

    // Convert a decimal millisecond string ("23.4") to a Latency
    static bool parse_milliseconds(const std::string& text, Latency& out);

private:
    std::regex reply_regex_;
};
