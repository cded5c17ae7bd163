/*
 * config.hpp - Configuration file utilities
 *
 * Locates the configuration directory (XDG Base Directory layout) and reads
 * line-based config files. Lines are "key:value" style, '#' starts a
 * comment, and "\:" escapes a delimiter inside a field.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

class Config {
public:
    // $XDG_CONFIG_HOME/latency-monitor, else ~/.config/latency-monitor
    static std::string get_config_dir();

    // Create the configuration directory and any missing parents
    static bool ensure_config_dir();

    static std::string get_config_path(const std::string& filename);

    // Read lines from a config file, stripping comments and empty lines
    // Returns empty vector if file doesn't exist
    static std::vector<std::string> read_config_lines(const std::string& filepath);

    // Parse a delimited line into fields
    // Handles escaped delimiters (\:) within fields
    static std::vector<std::string> parse_fields(const std::string& line, char delimiter = ':');

    // Directory holding the bundled default config
    static std::string get_data_dir();

    // Copy bundled file to config dir if it doesn't exist
    static bool install_default_config(const std::string& filename);

    // Forget cached directories (environment changed)
    static void reset_cache();

private:
    static std::optional<std::string> cached_config_dir_;
    static std::optional<std::string> cached_data_dir_;
};
