/*
 * distribution.cpp - Latency distribution panel implementation
 *
 * Rows read "   5ms : ######" with the bar coloured by bucket position:
 * the lower third fast, the middle third medium, the rest slow.
 */

#include "distribution.hpp"
#include <algorithm>
#include <cstdio>

DistributionPanel::DistributionPanel(const LatencyStats& stats, const RunInfo& info, UI& ui)
    : Panel("Histogram", stats, info, ui) {}

void DistributionPanel::render(WINDOW* win) {
    UI::clear_window(win);

    int max_y = getmaxy(win);
    int max_x = getmaxx(win);

    StatsSnapshot snap = stats_.snapshot();

    wattron(win, A_BOLD);
    mvwprintw(win, 1, 2, "Histogram, Total: %llu", static_cast<unsigned long long>(snap.total));
    wattroff(win, A_BOLD);

    UI::print_right_aligned(win, 1, show_percent_ ? "[p] Show counts" : "[p] Show percent");

    mvwhline(win, 2, 1, ACS_HLINE, max_x - 2);

    // "%5lldms : " label, then the bar, then the value column
    int bar_width = max_x - 2 - 10 - 12;
    if (bar_width < 10) {
        mvwprintw(win, 3, 2, "(Window too small for histogram)");
        UI::draw_box(win, active_);
        wrefresh(win);
        return;
    }

    uint64_t max_count = *std::max_element(snap.buckets.begin(), snap.buckets.end());
    max_count = std::max(max_count, snap.overflow);

    size_t n = snap.thresholds.size();
    int y = 3;
    for (size_t i = 0; i < n && y < max_y - 1; ++i, ++y) {
        char label[32];
        snprintf(label, sizeof(label), "%5lldms", static_cast<long long>(snap.thresholds[i]));

        ColorPair color = COLOR_FAST;
        if (i * 3 >= n * 2) {
            color = COLOR_SLOW;
        } else if (i * 3 >= n) {
            color = COLOR_MEDIUM;
        }

        render_row(win, y, label, snap.buckets[i], max_count, snap.total, bar_width, color);
    }

    if (y < max_y - 1) {
        render_row(win, y, "slower", snap.overflow, max_count, snap.total, bar_width, COLOR_SLOW);
    }

    UI::draw_box(win, active_);
    wrefresh(win);
}

void DistributionPanel::render_row(WINDOW* win, int y, const std::string& label, uint64_t count,
                                uint64_t max_count, uint64_t total, int bar_width,
                                ColorPair color) {
    mvwprintw(win, y, 2, "%7s : ", label.c_str());

    int length = bar_length(count, max_count, bar_width);

    ui_.set_color(win, color);
    for (int i = 0; i < length; ++i) {
        mvwaddch(win, y, 12 + i, ACS_BLOCK);
    }
    ui_.unset_color(win, color);

    int value_x = 12 + bar_width + 1;
    if (show_percent_) {
        double percent = total > 0 ? static_cast<double>(count) * 100.0 / total : 0.0;
        mvwprintw(win, y, value_x, "%5.1f%%", percent);
    } else {
        mvwprintw(win, y, value_x, "%llu", static_cast<unsigned long long>(count));
    }
}

int DistributionPanel::bar_length(uint64_t count, uint64_t max_count, int width) {
    if (max_count == 0 || width <= 0) {
        return 0;
    }
    int length = static_cast<int>(static_cast<double>(count) / max_count * width);
    return std::min(length, width);
}

bool DistributionPanel::handle_key(int key) {
    switch (key) {
        case 'p':
        case 'P':
            show_percent_ = !show_percent_;
            return true;

        default:
            return false;
    }
}
