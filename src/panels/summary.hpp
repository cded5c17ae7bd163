/*
 * summary.hpp - Latency summary panel (F1)
 *
 * Shows the probe target, the last completed window, the lifetime totals
 * and the progress of the window currently being filled.
 */

#pragma once

#include "../panel.hpp"

class SummaryPanel : public Panel {
public:
    // Latencies at or above this are drawn in the slow colour
    static constexpr int64_t SLOW_LATENCY_MS = 200;

    SummaryPanel(const LatencyStats& stats, const RunInfo& info, UI& ui);

    void render(WINDOW* win) override;
    bool handle_key(int key) override;

private:
    // Draws the probe counters from row y; returns the row after the last one
    int render_probe(WINDOW* win, int y, const StatsSnapshot& snap);
    void render_window_line(WINDOW* win, int y, const char* label, const WindowSummary& w);
};
