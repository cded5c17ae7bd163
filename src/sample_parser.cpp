/*
 * sample_parser.cpp - Probe output line classification implementation
 *
 * Matches reply lines with a compiled regex and extracts the trailing time
 * field. Everything else is either ignorable or counted as dropped.
 */

#include "sample_parser.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>

PingLineParser::PingLineParser()
    : reply_regex_(
          R"(^\d+ bytes from \d+\.\d+\.\d+\.\d+: icmp_seq=\d+ ttl=\d+ time=(\d+(?:\.\d+)?) ms$)",
          std::regex::optimize) {}

ParsedLine PingLineParser::parse(const std::string& line) const {
    ParsedLine result;

    // Tolerate CRLF output
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    if (text.find_first_not_of(" \t") == std::string::npos) {
        result.kind = LineKind::IGNORABLE;
        return result;
    }

    // Startup banner: "PING host (addr) 56(84) bytes of data."
    if (text.compare(0, 4, "PING") == 0) {
        result.kind = LineKind::IGNORABLE;
        return result;
    }

    std::smatch match;
    if (!std::regex_match(text, match, reply_regex_) ||
        !parse_milliseconds(match[1].str(), result.latency)) {
        count_dropped();
        result.kind = LineKind::UNRECOGNIZED;
        return result;
    }

    result.kind = LineKind::DATA;
    return result;
}

bool PingLineParser::parse_milliseconds(const std::string& text, Latency& out) {
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    double ms = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(ms) || ms < 0.0) {
        return false;
    }

    // Values beyond the microsecond range cannot be represented
    double us = ms * 1000.0;
    if (us >= static_cast<double>(std::numeric_limits<Latency::rep>::max())) {
        return false;
    }

    out = Latency(static_cast<Latency::rep>(std::llround(us)));
    return true;
}
