/*
 * log.hpp - Application log file
 *
 * Appends timestamped lines to a log file, by default latency-monitor.log in
 * the config directory. The terminal belongs to ncurses while the dashboard
 * runs, so nothing is written to stdout or stderr. Logging is disabled until
 * set_file() is called.
 *
 * Safe to call from the producer's supervisor thread and the UI thread.
 *
 * Line format: 2024-01-31 12:00:00 | INFO | probe started (pid 1234)
 */

#pragma once

#include <mutex>
#include <string>

class Log {
public:
    enum class Level { DEBUG, INFO, WARN, ERROR };

    static void set_file(const std::string& filepath);
    static void set_level(Level level);

    static void debug(const std::string& message) { write(Level::DEBUG, message); }
    static void info(const std::string& message) { write(Level::INFO, message); }
    static void warn(const std::string& message) { write(Level::WARN, message); }
    static void error(const std::string& message) { write(Level::ERROR, message); }

    static void write(Level level, const std::string& message);

    static const char* level_name(Level level);
    static bool parse_level(const std::string& name, Level& out);

    // Format a single line without writing it
    static std::string format_line(Level level, const std::string& message);

private:
    static std::mutex mutex_;
    static std::string filepath_;
    static Level level_;
};
