/*
 * ui.hpp - ncurses wrapper
 *
 * Screen setup and teardown, non-blocking input, colour pairs and the small
 * drawing and formatting helpers shared by the panels.
 */

#pragma once

#include <cstdint>
#include <ncurses.h>
#include <string>

// Color pair IDs
enum ColorPair {
    COLOR_DEFAULT = 0,
    COLOR_FAST = 1,
    COLOR_MEDIUM = 2,
    COLOR_SLOW = 3,
    COLOR_ACTIVE_BORDER = 4,
    COLOR_ERROR = 5
};

class UI {
public:
    void init();
    void shutdown();

    // Input handling
    int poll_input();  // Non-blocking, returns ERR if no input
    void set_input_timeout(int ms);

    // Screen info
    int get_max_y() const;
    int get_max_x() const;

    // Color support
    bool has_colors() const { return has_colors_; }
    void set_color(WINDOW* win, ColorPair pair);
    void unset_color(WINDOW* win, ColorPair pair);

    // Window utilities
    static void draw_box(WINDOW* win, bool active = false);
    static void clear_window(WINDOW* win);
    static void print_centered(WINDOW* win, int y, const std::string& text);
    static void print_right_aligned(WINDOW* win, int y, const std::string& text);

    // Formatting helpers
    static std::string format_latency(int64_t ms);
    static std::string format_count(uint64_t count);
    static std::string truncate(const std::string& str, size_t max_len);

    // Colour for a latency relative to the histogram range
    static ColorPair latency_color(int64_t ms, int64_t slow_ms);

private:
    void init_colors();
    bool has_colors_ = false;
    bool initialised_ = false;
};
