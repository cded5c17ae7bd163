/*
 * ui.cpp - ncurses wrapper implementation
 */

#include "ui.hpp"
#include <sstream>

void UI::init()
{
    if (initialised_) {
        return;
    }

    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    set_input_timeout(0);

    init_colors();
    initialised_ = true;
}

void UI::init_colors()
{
    has_colors_ = ::has_colors();
    if (!has_colors_) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_FAST, COLOR_GREEN, -1);
    init_pair(COLOR_MEDIUM, COLOR_YELLOW, -1);
    init_pair(COLOR_SLOW, COLOR_RED, -1);
    init_pair(COLOR_ACTIVE_BORDER, COLOR_CYAN, -1);
    init_pair(COLOR_ERROR, COLOR_WHITE, COLOR_RED);
}

void UI::shutdown()
{
    if (!initialised_) {
        return;
    }

    endwin();
    initialised_ = false;
}

int UI::poll_input()
{
    return getch();
}

void UI::set_input_timeout(int ms)
{
    timeout(ms);
}

int UI::get_max_y() const
{
    return getmaxy(stdscr);
}

int UI::get_max_x() const
{
    return getmaxx(stdscr);
}

void UI::set_color(WINDOW* win, ColorPair pair)
{
    if (has_colors_ && pair != COLOR_DEFAULT) {
        wattron(win, COLOR_PAIR(pair));
    }
}

void UI::unset_color(WINDOW* win, ColorPair pair)
{
    if (has_colors_ && pair != COLOR_DEFAULT) {
        wattroff(win, COLOR_PAIR(pair));
    }
}

void UI::draw_box(WINDOW* win, bool active)
{
    bool colour = active && ::has_colors();

    if (colour) {
        wattron(win, COLOR_PAIR(COLOR_ACTIVE_BORDER) | A_BOLD);
    }
    box(win, 0, 0);
    if (colour) {
        wattroff(win, COLOR_PAIR(COLOR_ACTIVE_BORDER) | A_BOLD);
    }
}

void UI::clear_window(WINDOW* win)
{
    werase(win);
}

void UI::print_centered(WINDOW* win, int y, const std::string& text)
{
    int width = getmaxx(win);
    std::string shown = truncate(text, width > 2 ? static_cast<size_t>(width - 2) : 0);
    int x = (width - static_cast<int>(shown.length())) / 2;
    if (x < 1) x = 1;
    mvwprintw(win, y, x, "%s", shown.c_str());
}

void UI::print_right_aligned(WINDOW* win, int y, const std::string& text)
{
    int width = getmaxx(win);
    std::string shown = truncate(text, width > 4 ? static_cast<size_t>(width - 4) : 0);
    int x = width - 2 - static_cast<int>(shown.length());
    if (x < 1) x = 1;
    mvwprintw(win, y, x, "%s", shown.c_str());
}

std::string UI::format_latency(int64_t ms)
{
    std::ostringstream oss;
    if (ms >= 10000) {
        oss << ms / 1000 << "s";
    } else {
        oss << ms << "ms";
    }
    return oss.str();
}

std::string UI::format_count(uint64_t count)
{
    // Thousands separators: 1234567 -> 1,234,567
    std::string digits = std::to_string(count);
    std::string result;
    int n = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (n > 0 && n % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        n++;
    }
    return result;
}

std::string UI::truncate(const std::string& str, size_t max_len)
{
    if (str.length() <= max_len) {
        return str;
    }
    if (max_len <= 3) {
        return str.substr(0, max_len);
    }
    return str.substr(0, max_len - 3) + "...";
}

ColorPair UI::latency_color(int64_t ms, int64_t slow_ms)
{
    if (slow_ms <= 0) {
        return COLOR_DEFAULT;
    }
    if (ms * 4 >= slow_ms * 3) {
        return COLOR_SLOW;
    }
    if (ms * 2 >= slow_ms) {
        return COLOR_MEDIUM;
    }
    return COLOR_FAST;
}
