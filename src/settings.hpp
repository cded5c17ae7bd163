/*
 * settings.hpp - Run settings from the config file and command line
 *
 * Defaults are overridden by latency-monitor.conf in the config directory,
 * which is in turn overridden by command-line flags:
 *
 *   latency-monitor [host] [--host <h>] [-d|--interval <s>] [-w|--window <s>]
 *                   [--thresholds 1,2,5,...] [--probe <path>]
 *                   [--log <path>] [--log-level <level>] [-h|--help]
 */

#pragma once

#include "log.hpp"
#include "sample_producer.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct Settings {
    static constexpr const char* CONFIG_FILE = "latency-monitor.conf";
    static constexpr const char* LOG_FILE = "latency-monitor.log";

    std::string host = "google.co.uk";
    int interval_seconds = 1;
    int window_seconds = 5;
    std::vector<int64_t> thresholds_ms;
    std::string probe = "ping";
    std::string log_path;  // Empty: LOG_FILE in the config directory
    Log::Level log_level = Log::Level::INFO;
    bool show_help = false;

    // Problems found while loading the config file (not fatal)
    std::vector<std::string> warnings;

    Settings();

    // Apply "key: value" lines from a config file
    // Returns the number of keys applied, 0 if the file is missing
    int load(const std::string& filepath);
    int load_default();

    // Apply one setting; false with error set if the key or value is bad
    bool apply(const std::string& key, const std::string& value, std::string& error);

    // Apply command-line flags; false with error set on bad input
    bool parse_args(int argc, char** argv, std::string& error);

    bool validate(std::string& error) const;

    ProbeCommand probe_command() const;
    std::string resolved_log_path() const;

    static bool parse_positive(const std::string& text, int& out);
    static bool parse_thresholds(const std::string& text, std::vector<int64_t>& out);
    static std::string usage();
};
