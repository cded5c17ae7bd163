/*
 * panel.cpp - Base panel class implementation
 *
 * Provides the constructor for the abstract Panel base class.
 * Derived panels (Summary, Histogram) implement render() and handle_key().
 */

#include "panel.hpp"

Panel::Panel(const std::string& title, const LatencyStats& stats, const RunInfo& info, UI& ui)
    : title_(title), stats_(stats), info_(info), ui_(ui) {}
