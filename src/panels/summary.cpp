/*
 * summary.cpp - Latency summary panel implementation
 *
 * The window lines follow the "Min: 1ms, Max: 5ms, Avg: 3ms" layout, with
 * each value coloured by how slow it is.
 */

#include "summary.hpp"

SummaryPanel::SummaryPanel(const LatencyStats& stats, const RunInfo& info, UI& ui)
    : Panel("Summary", stats, info, ui) {}

void SummaryPanel::render(WINDOW* win) {
    UI::clear_window(win);

    int max_x = getmaxx(win);
    StatsSnapshot snap = stats_.snapshot();

    int y = 1;

    wattron(win, A_BOLD);
    mvwprintw(win, y, 2, "PING: %s (interval: %ds)",
              UI::truncate(info_.host, static_cast<size_t>(max_x > 30 ? max_x - 30 : 1)).c_str(),
              info_.interval_seconds);
    wattroff(win, A_BOLD);
    y += 2;

    // Probe counters, then one blank row above the rule
    y = render_probe(win, y, snap);
    y += 1;

    mvwhline(win, y, 1, ACS_HLINE, max_x - 2);
    y += 1;

    wattron(win, A_BOLD);
    mvwprintw(win, y, 2, "Latency (%llds window):",
              static_cast<long long>(snap.window_span.count()));
    wattroff(win, A_BOLD);
    y += 2;

    if (snap.totals.count == 0) {
        mvwprintw(win, y, 2, "(Waiting for replies...)");
    } else {
        render_window_line(win, y++, "Window", snap.last_window);
        render_window_line(win, y++, "Totals", snap.totals);
        y++;
        mvwprintw(win, y++, 2, "Current window: %llu samples, %llu rollovers",
                  static_cast<unsigned long long>(snap.current.count),
                  static_cast<unsigned long long>(snap.rollovers));
    }

    UI::draw_box(win, active_);
    wrefresh(win);
}

int SummaryPanel::render_probe(WINDOW* win, int y, const StatsSnapshot& snap) {
    mvwprintw(win, y, 2, "Replies:       ");
    wattron(win, A_BOLD);
    mvwprintw(win, y, 17, "%s", UI::format_count(snap.total).c_str());
    wattroff(win, A_BOLD);
    y++;

    mvwprintw(win, y, 2, "Probe lines:   ");
    mvwprintw(win, y, 17, "%s", UI::format_count(info_.lines_read).c_str());
    y++;

    // Lines the parser could not read; nonzero usually means another ping dialect
    mvwprintw(win, y, 2, "Dropped lines: ");
    if (info_.dropped_lines > 0) {
        ui_.set_color(win, COLOR_MEDIUM);
    }
    mvwprintw(win, y, 17, "%s", UI::format_count(info_.dropped_lines).c_str());
    if (info_.dropped_lines > 0) {
        ui_.unset_color(win, COLOR_MEDIUM);
    }
    y++;

    mvwprintw(win, y, 2, "Probe pid:     ");
    if (info_.probe_pid > 0) {
        mvwprintw(win, y, 17, "%d", info_.probe_pid);
    } else {
        mvwprintw(win, y, 17, "-");
    }
    y++;

    return y;
}

void SummaryPanel::render_window_line(WINDOW* win, int y, const char* label,
                                      const WindowSummary& w) {
    mvwprintw(win, y, 2, "%-6s - ", label);

    const struct {
        const char* name;
        int64_t value;
    } fields[] = {
        {"Min", w.min_ms},
        {"Max", w.max_ms},
        {"Avg", w.avg_ms},
    };

    int x = 11;
    for (size_t i = 0; i < 3; ++i) {
        if (i > 0) {
            mvwprintw(win, y, x, ", ");
            x += 2;
        }

        std::string value = UI::format_latency(fields[i].value);
        mvwprintw(win, y, x, "%s: ", fields[i].name);
        x += 5;

        ColorPair color = UI::latency_color(fields[i].value, SLOW_LATENCY_MS);
        ui_.set_color(win, color);
        wattron(win, A_BOLD);
        mvwprintw(win, y, x, "%s", value.c_str());
        wattroff(win, A_BOLD);
        ui_.unset_color(win, color);
        x += static_cast<int>(value.length());
    }
}

bool SummaryPanel::handle_key(int key) {
    // Nothing to interact with
    (void)key;
    return false;
}
