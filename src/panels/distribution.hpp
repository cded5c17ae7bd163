/*
 * distribution.hpp - Latency distribution panel (F2)
 *
 * One bar per bucket, scaled to the fullest bucket, plus a row for replies
 * slower than the last bound. 'p' toggles between counts and percentages.
 */

#pragma once

#include "../panel.hpp"

class DistributionPanel : public Panel {
public:
    DistributionPanel(const LatencyStats& stats, const RunInfo& info, UI& ui);

    void render(WINDOW* win) override;
    bool handle_key(int key) override;

    // Bar length for a bucket, scaled so the largest bucket fills width
    static int bar_length(uint64_t count, uint64_t max_count, int width);

private:
    bool show_percent_ = false;

    void render_row(WINDOW* win, int y, const std::string& label, uint64_t count,
                    uint64_t max_count, uint64_t total, int bar_width, ColorPair color);
};
