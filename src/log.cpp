/*
 * log.cpp - Application log file implementation
 *
 * Opens the file in append mode for every line, so the log survives crashes
 * and external rotation without extra bookkeeping.
 */

#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

std::mutex Log::mutex_;
std::string Log::filepath_;
Log::Level Log::level_ = Log::Level::INFO;

void Log::set_file(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(mutex_);
    filepath_ = filepath;
}

void Log::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Log::write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (filepath_.empty() || level < level_) {
        return;
    }

    std::ofstream file(filepath_, std::ios::app);
    if (file.is_open()) {
        file << format_line(level, message) << "\n";
    }
}

const char* Log::level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "INFO";
}

bool Log::parse_level(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") {
        out = Level::DEBUG;
    } else if (lower == "info") {
        out = Level::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = Level::WARN;
    } else if (lower == "error") {
        out = Level::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Log::format_line(Level level, const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << " | " << level_name(level);
    oss << " | " << message;
    return oss.str();
}
