/*
 * main.cpp - latency-monitor entry point
 *
 * Loads settings, runs the dashboard, and reports how the run ended:
 * exit 0 after a user quit (with the final statistics printed), exit 1 with
 * the probe error after any probe failure, exit 2 on bad arguments.
 */

#include "app.hpp"
#include "config.hpp"
#include "settings.hpp"
#include <csignal>
#include <exception>
#include <iostream>

namespace {

void handle_sigint(int) {
    App::request_interrupt();
}

}  // namespace

int main(int argc, char** argv)
{
    Settings settings;

    if (!Config::install_default_config(Settings::CONFIG_FILE)) {
        settings.warnings.push_back("no default config installed in " + Config::get_config_dir());
    }
    settings.load_default();

    std::string error;
    if (!settings.parse_args(argc, argv, error)) {
        std::cerr << "latency-monitor: " << error << "\n\n" << Settings::usage();
        return 2;
    }

    if (settings.show_help) {
        std::cout << Settings::usage();
        return 0;
    }

    if (!settings.validate(error)) {
        std::cerr << "latency-monitor: " << error << "\n";
        return 2;
    }

    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    try {
        App app(settings);

        if (!app.init()) {
            app.shutdown();
            std::cerr << "latency-monitor: unable to initialise the terminal\n";
            return 1;
        }

        app.run();
        app.shutdown();

        const auto& outcome = app.outcome();
        if (outcome && outcome->is_error()) {
            std::cerr << "latency-monitor: " << outcome->describe() << "\n";
            return app.exit_code();
        }

        StatsSnapshot snap = app.final_snapshot();
        std::cout << "PING: " << settings.host << " (" << snap.total << " replies)\n"
                  << "Window - " << snap.last_window.format() << "\n"
                  << "Totals - " << snap.totals.format() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "latency-monitor: " << e.what() << "\n";
        return 1;
    }
}
