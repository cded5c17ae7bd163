/*
 * settings.cpp - Run settings implementation
 */

#include "settings.hpp"
#include "config.hpp"
#include "histogram.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool parse_int64(const std::string& text, int64_t& out) {
    std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    errno = 0;
    long long value = std::strtoll(t.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

}  // namespace

Settings::Settings() : thresholds_ms(Histogram::default_thresholds()) {}

int Settings::load(const std::string& filepath) {
    auto lines = Config::read_config_lines(filepath);

    int applied = 0;
    for (const auto& line : lines) {
        auto fields = Config::parse_fields(line, ':');
        if (fields.size() < 2) {
            warnings.push_back(filepath + ": expected 'key: value', got '" + line + "'");
            continue;
        }

        // Values may contain ':' (paths), rejoin everything after the key
        std::string value = fields[1];
        for (size_t i = 2; i < fields.size(); ++i) {
            value += ":" + fields[i];
        }

        std::string error;
        if (apply(trim(fields[0]), trim(value), error)) {
            applied++;
        } else {
            warnings.push_back(filepath + ": " + error);
        }
    }

    return applied;
}

int Settings::load_default() {
    return load(Config::get_config_path(CONFIG_FILE));
}

bool Settings::apply(const std::string& key, const std::string& value, std::string& error) {
    std::string lower_key = key;
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_key == "host") {
        if (value.empty()) {
            error = "host must not be empty";
            return false;
        }
        host = value;
    } else if (lower_key == "interval") {
        if (!parse_positive(value, interval_seconds)) {
            error = "interval must be a positive whole number of seconds: '" + value + "'";
            return false;
        }
    } else if (lower_key == "window") {
        if (!parse_positive(value, window_seconds)) {
            error = "window must be a positive whole number of seconds: '" + value + "'";
            return false;
        }
    } else if (lower_key == "thresholds") {
        if (!parse_thresholds(value, thresholds_ms)) {
            error = "thresholds must be ascending positive milliseconds: '" + value + "'";
            return false;
        }
    } else if (lower_key == "probe") {
        if (value.empty()) {
            error = "probe must not be empty";
            return false;
        }
        probe = value;
    } else if (lower_key == "log") {
        log_path = value;
    } else if (lower_key == "log_level") {
        if (!Log::parse_level(value, log_level)) {
            error = "unknown log level: '" + value + "'";
            return false;
        }
    } else {
        error = "unknown setting: '" + key + "'";
        return false;
    }

    return true;
}

bool Settings::parse_args(int argc, char** argv, std::string& error) {
    bool have_positional_host = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto value_for = [&](const char* key) -> bool {
            if (i + 1 >= argc) {
                error = "missing value for " + a;
                return false;
            }
            return apply(key, argv[++i], error);
        };

        if (a == "-h" || a == "--help") {
            show_help = true;
        } else if (a == "--host") {
            if (!value_for("host")) return false;
        } else if (a == "-d" || a == "--interval") {
            if (!value_for("interval")) return false;
        } else if (a == "-w" || a == "--window") {
            if (!value_for("window")) return false;
        } else if (a == "--thresholds") {
            if (!value_for("thresholds")) return false;
        } else if (a == "--probe") {
            if (!value_for("probe")) return false;
        } else if (a == "--log") {
            if (!value_for("log")) return false;
        } else if (a == "--log-level") {
            if (!value_for("log_level")) return false;
        } else if (!a.empty() && a[0] != '-' && !have_positional_host) {
            host = a;
            have_positional_host = true;
        } else {
            error = "unknown argument: " + a;
            return false;
        }
    }

    return true;
}

bool Settings::validate(std::string& error) const {
    if (host.empty()) {
        error = "no host given";
        return false;
    }
    if (interval_seconds <= 0) {
        error = "interval must be positive";
        return false;
    }
    if (window_seconds <= 0) {
        error = "window must be positive";
        return false;
    }
    if (!Histogram::valid_thresholds(thresholds_ms)) {
        error = "histogram thresholds must be ascending positive milliseconds";
        return false;
    }
    return true;
}

ProbeCommand Settings::probe_command() const {
    return ProbeCommand::ping(host, interval_seconds, probe);
}

std::string Settings::resolved_log_path() const {
    if (!log_path.empty()) {
        return log_path;
    }
    return Config::get_config_path(LOG_FILE);
}

bool Settings::parse_positive(const std::string& text, int& out) {
    int64_t value = 0;
    if (!parse_int64(text, value) || value <= 0 || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool Settings::parse_thresholds(const std::string& text, std::vector<int64_t>& out) {
    std::vector<int64_t> parsed;

    for (const auto& field : Config::parse_fields(text, ',')) {
        int64_t value = 0;
        if (!parse_int64(field, value)) {
            return false;
        }
        parsed.push_back(value);
    }

    if (!Histogram::valid_thresholds(parsed)) {
        return false;
    }

    out = std::move(parsed);
    return true;
}

std::string Settings::usage() {
    std::ostringstream oss;
    oss << "Usage: latency-monitor [host] [options]\n"
        << "\n"
        << "Options:\n"
        << "  --host <host>          Host to ping (default google.co.uk)\n"
        << "  -d, --interval <s>     Seconds between probes (default 1)\n"
        << "  -w, --window <s>       Statistics window in seconds (default 5)\n"
        << "  --thresholds <list>    Histogram bounds in ms (default 1,2,5,10,20,50,100,200,500,1000)\n"
        << "  --probe <path>         Probe executable (default ping)\n"
        << "  --log <path>           Log file (default " << Config::get_config_path(LOG_FILE) << ")\n"
        << "  --log-level <level>    debug, info, warn or error (default info)\n"
        << "  -h, --help             Show this help\n"
        << "\n"
        << "Settings are also read from " << Config::get_config_path(CONFIG_FILE) << "\n";
    return oss.str();
}
