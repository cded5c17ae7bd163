/*
 * config.cpp - Configuration file utilities implementation
 *
 * The config directory is resolved once and cached; reset_cache() forgets it
 * so tests can point XDG_CONFIG_HOME somewhere else.
 */

#include "config.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

std::optional<std::string> Config::cached_config_dir_;
std::optional<std::string> Config::cached_data_dir_;

namespace {

const char* const APP_DIR = "latency-monitor";

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// $HOME, falling back to the password database for daemons and sudo
std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "";
}

std::string executable_dir() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return "";
    }

    std::string path(buf, static_cast<size_t>(len));
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string strip(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

std::string Config::get_config_dir() {
    if (!cached_config_dir_) {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        std::string home = home_dir();

        if (xdg && xdg[0] != '\0') {
            cached_config_dir_ = std::string(xdg) + "/" + APP_DIR;
        } else if (!home.empty()) {
            cached_config_dir_ = home + "/.config/" + APP_DIR;
        } else {
            cached_config_dir_ = ".";
        }
    }
    return *cached_config_dir_;
}

bool Config::ensure_config_dir() {
    const std::string dir = get_config_dir();

    // Walk the path creating one component at a time
    for (size_t pos = dir.find('/', 1); ; pos = dir.find('/', pos + 1)) {
        std::string part = dir.substr(0, pos);

        if (mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
        if (pos == std::string::npos) {
            break;
        }
    }

    return is_directory(dir);
}

std::string Config::get_config_path(const std::string& filename) {
    return get_config_dir() + "/" + filename;
}

std::vector<std::string> Config::read_config_lines(const std::string& filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);

    for (std::string raw; std::getline(file, raw);) {
        std::string line = strip(raw);
        if (!line.empty() && line[0] != '#') {
            lines.push_back(line);
        }
    }

    return lines;
}

std::vector<std::string> Config::parse_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields(1);

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            fields.back() += line[++i];
        } else if (c == delimiter) {
            fields.emplace_back();
        } else {
            fields.back() += c;
        }
    }

    return fields;
}

std::string Config::get_data_dir() {
    if (cached_data_dir_) {
        return *cached_data_dir_;
    }

    // Source tree first, so a development build never picks up an installed copy
    std::vector<std::string> candidates;
    std::string exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        candidates.push_back(exe_dir + "/../data");
        candidates.push_back(exe_dir + "/data");
        candidates.push_back(exe_dir + "/../share/" + APP_DIR);
    }
    candidates.push_back("./data");
    candidates.push_back(std::string("/usr/local/share/") + APP_DIR);
    candidates.push_back(std::string("/usr/share/") + APP_DIR);

    cached_data_dir_ = "./data";
    for (const auto& dir : candidates) {
        if (is_directory(dir)) {
            cached_data_dir_ = dir;
            break;
        }
    }
    return *cached_data_dir_;
}

bool Config::install_default_config(const std::string& filename) {
    const std::string dest = get_config_path(filename);
    if (is_file(dest)) {
        return true;
    }

    std::ifstream src(get_data_dir() + "/" + filename, std::ios::binary);
    if (!src.is_open() || !ensure_config_dir()) {
        return false;
    }

    std::ofstream dst(dest, std::ios::binary);
    dst << src.rdbuf();
    return dst.good();
}

void Config::reset_cache() {
    cached_config_dir_.reset();
    cached_data_dir_.reset();
}
