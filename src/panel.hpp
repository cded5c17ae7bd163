/*
 * panel.hpp - Base class for UI panels
 *
 * Abstract base class for the main content panels (Summary, Histogram).
 * Provides the common interface for rendering, keyboard handling and active
 * state. Panels read the statistics engine through a const reference and
 * take a snapshot per frame; they never modify it.
 *
 * Panels are displayed in the main window area and switched via F1-F2 keys.
 */

#pragma once

#include "latency_stats.hpp"
#include "ui.hpp"
#include <cstdint>
#include <ncurses.h>
#include <string>

// Run details shown alongside the statistics, refreshed by App every frame
struct RunInfo {
    std::string host;
    int interval_seconds = 0;
    int probe_pid = -1;
    uint64_t samples = 0;
    uint64_t lines_read = 0;
    uint64_t dropped_lines = 0;
};

class Panel {
public:
    Panel(const std::string& title, const LatencyStats& stats, const RunInfo& info, UI& ui);
    virtual ~Panel() = default;

    // Render the panel content
    virtual void render(WINDOW* win) = 0;

    // Handle keyboard input (return true if handled)
    virtual bool handle_key(int key) = 0;

    // Panel state
    void set_active(bool active) { active_ = active; }

    const std::string& get_title() const { return title_; }

protected:
    std::string title_;
    const LatencyStats& stats_;
    const RunInfo& info_;
    UI& ui_;
    bool active_ = false;
};
