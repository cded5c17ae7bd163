/*
 * app.cpp - Main application controller implementation
 *
 * Implements the main event loop, window layout management, and coordination
 * between the probe pipeline and the panels. The loop blocks on the event
 * queue for at most 100ms, so the screen refreshes at about 10 FPS even
 * when the probe is silent.
 */

#include "app.hpp"
#include "config.hpp"
#include "log.hpp"
#include "panels/distribution.hpp"
#include "panels/summary.hpp"
#include <csignal>
#include <sstream>

namespace {

volatile std::sig_atomic_t interrupted = 0;

constexpr int KEY_ESCAPE = 27;

}  // namespace

void App::request_interrupt() {
    interrupted = 1;
}

App::App(const Settings& settings)
    : settings_(settings),
      stats_(std::chrono::seconds(settings.window_seconds), settings.thresholds_ms),
      producer_(events_, parser_),
      monitor_(events_, stats_) {
    info_.host = settings_.host;
    info_.interval_seconds = settings_.interval_seconds;
}

App::~App() {
    shutdown();
}

bool App::init() {
    // Logging goes to a file; the terminal is about to belong to ncurses
    if (settings_.log_path.empty() && !Config::ensure_config_dir()) {
        Log::set_file("");
    } else {
        Log::set_file(settings_.resolved_log_path());
    }
    Log::set_level(settings_.log_level);

    for (const auto& warning : settings_.warnings) {
        Log::warn(warning);
    }
    Log::info("monitoring " + settings_.host + " every " +
              std::to_string(settings_.interval_seconds) + "s, window " +
              std::to_string(settings_.window_seconds) + "s");

    ui_.init();

    panels_[0] = std::make_unique<SummaryPanel>(stats_, info_, ui_);
    panels_[1] = std::make_unique<DistributionPanel>(stats_, info_, ui_);

    create_windows();
    panels_[active_panel_]->set_active(true);

    // A failed start leaves its outcome in the queue for the first poll
    if (!producer_.start(settings_.probe_command())) {
        Log::error("unable to start probe: " + producer_.get_error());
    }

    started_at_ = std::chrono::steady_clock::now();
    return true;
}

void App::create_windows() {
    int max_y = ui_.get_max_y();
    int max_x = ui_.get_max_x();

    constexpr int TOP_BAR_HEIGHT = 3;
    constexpr int STATUS_BAR_HEIGHT = 3;

    int main_height = max_y - TOP_BAR_HEIGHT - STATUS_BAR_HEIGHT;
    if (main_height < 3) main_height = 3;

    top_bar_ = newwin(TOP_BAR_HEIGHT, max_x, 0, 0);
    main_win_ = newwin(main_height, max_x, TOP_BAR_HEIGHT, 0);
    status_bar_ = newwin(STATUS_BAR_HEIGHT, max_x, TOP_BAR_HEIGHT + main_height, 0);

    // Enable keypad for function keys
    keypad(top_bar_, TRUE);
    keypad(main_win_, TRUE);
    keypad(status_bar_, TRUE);
}

void App::destroy_windows() {
    if (top_bar_) { delwin(top_bar_); top_bar_ = nullptr; }
    if (main_win_) { delwin(main_win_); main_win_ = nullptr; }
    if (status_bar_) { delwin(status_bar_); status_bar_ = nullptr; }
}

void App::run() {
    bool running = true;

    while (running) {
        running = monitor_.poll(FRAME_INTERVAL);

        check_interrupt();

        int key;
        while ((key = ui_.poll_input()) != ERR) {
            handle_key(key);
        }

        info_.samples = monitor_.samples_seen();
        info_.lines_read = producer_.lines_read();
        info_.dropped_lines = parser_.dropped_lines();
        info_.probe_pid = producer_.pid();

        render();
    }
}

void App::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Reap the probe before giving the terminal back
    producer_.stop();
    destroy_windows();
    ui_.shutdown();
}

void App::check_interrupt() {
    if (interrupted) {
        interrupted = 0;
        Log::info("interrupted");
        events_.request_cancel();
    }
}

void App::handle_key(int key) {
    if (key == KEY_RESIZE) {
        handle_resize();
        return;
    }

    switch (key) {
        case 'q':
        case 'Q':
        case KEY_ESCAPE:
            events_.request_cancel();
            return;

        case KEY_F(1):
            switch_panel(0);
            return;

        case KEY_F(2):
            switch_panel(1);
            return;

        case '\t':
            switch_panel((active_panel_ + 1) % panels_.size());
            return;
    }

    panels_[active_panel_]->handle_key(key);
}

void App::handle_resize() {
    destroy_windows();
    clear();
    refresh();
    create_windows();
}

void App::render() {
    if (!top_bar_ || !main_win_ || !status_bar_) {
        return;
    }

    render_top_bar();
    panels_[active_panel_]->render(main_win_);
    render_status_bar();

    refresh();
}

void App::render_top_bar() {
    UI::clear_window(top_bar_);

    int max_x = getmaxx(top_bar_);

    wattron(top_bar_, A_BOLD);
    mvwprintw(top_bar_, 1, 2, "Latency Monitor");
    wattroff(top_bar_, A_BOLD);

    int x = max_x - 30;
    if (x < 20) x = 20;

    for (size_t i = 0; i < panels_.size(); ++i) {
        std::string tab = "F" + std::to_string(i + 1) + ":" + panels_[i]->get_title();
        int attrs = i == active_panel_ ? (A_REVERSE | A_BOLD) : A_NORMAL;

        wattron(top_bar_, attrs);
        mvwprintw(top_bar_, 1, x, " %s ", tab.c_str());
        wattroff(top_bar_, attrs);
        x += static_cast<int>(tab.length()) + 3;
    }

    UI::draw_box(top_bar_, false);
    wrefresh(top_bar_);
}

void App::render_status_bar() {
    UI::clear_window(status_bar_);

    int max_x = getmaxx(status_bar_);

    const auto& outcome = monitor_.outcome();

    if (!outcome) {
        ui_.set_color(status_bar_, COLOR_FAST);
        mvwprintw(status_bar_, 1, 2, "[PINGING: %s]",
                  UI::truncate(settings_.host, static_cast<size_t>(max_x / 3)).c_str());
        ui_.unset_color(status_bar_, COLOR_FAST);
    } else if (outcome->is_error()) {
        ui_.set_color(status_bar_, COLOR_ERROR);
        mvwprintw(status_bar_, 1, 2, " %s ",
                  UI::truncate(outcome->describe(), static_cast<size_t>(max_x - 36)).c_str());
        ui_.unset_color(status_bar_, COLOR_ERROR);
    } else {
        mvwprintw(status_bar_, 1, 2, "[STOPPED]");
    }

    if (!outcome) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started_at_).count();
        std::ostringstream oss;
        oss << "up " << elapsed / 3600 << "h " << (elapsed / 60) % 60 << "m "
            << elapsed % 60 << "s";
        UI::print_centered(status_bar_, 1, oss.str());
    }

    mvwprintw(status_bar_, 1, max_x - 31, "Tab:Panel p:Percent q:Quit");

    UI::draw_box(status_bar_, false);
    wrefresh(status_bar_);
}

void App::switch_panel(size_t index) {
    if (index >= panels_.size()) return;

    panels_[active_panel_]->set_active(false);
    active_panel_ = index;
    panels_[active_panel_]->set_active(true);
}
