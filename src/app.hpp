/*
 * app.hpp - Main application controller
 *
 * Orchestrates the measurement pipeline and the dashboard: starts the probe
 * through SampleProducer, runs the Monitor consumer loop that feeds
 * LatencyStats, and renders the panels between events.
 *
 * The event loop waits up to 100ms for a probe event, then polls the
 * keyboard (non-blocking) and redraws. q, Esc and Ctrl-C request
 * cancellation; F1/F2 and Tab switch panels. The loop ends on the first
 * probe outcome or cancellation, and shutdown() reaps the probe before the
 * screen is restored.
 */

#pragma once

#include "event_queue.hpp"
#include "latency_stats.hpp"
#include "monitor.hpp"
#include "panel.hpp"
#include "sample_parser.hpp"
#include "sample_producer.hpp"
#include "settings.hpp"
#include "ui.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <optional>

class App {
public:
    explicit App(const Settings& settings);
    ~App();

    // Non-copyable
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Main lifecycle
    bool init();
    void run();
    void shutdown();

    // Valid after run() returns
    const std::optional<Outcome>& outcome() const { return monitor_.outcome(); }
    int exit_code() const { return monitor_.exit_code(); }
    StatsSnapshot final_snapshot() const { return stats_.snapshot(); }

    // Set from the SIGINT handler
    static void request_interrupt();

private:
    static constexpr std::chrono::milliseconds FRAME_INTERVAL{100};

    // Core components
    Settings settings_;
    UI ui_;
    EventQueue events_;
    LatencyStats stats_;
    PingLineParser parser_;
    SampleProducer producer_;
    Monitor monitor_;
    RunInfo info_;

    // Panels
    std::array<std::unique_ptr<Panel>, 2> panels_;
    size_t active_panel_ = 0;

    // Windows
    WINDOW* top_bar_ = nullptr;
    WINDOW* main_win_ = nullptr;
    WINDOW* status_bar_ = nullptr;

    // State
    bool shut_down_ = false;
    std::chrono::steady_clock::time_point started_at_;

    // Event handling
    void handle_key(int key);
    void handle_resize();
    void check_interrupt();

    // Rendering
    void create_windows();
    void destroy_windows();
    void render();
    void render_top_bar();
    void render_status_bar();

    // Panel switching
    void switch_panel(size_t index);
};
