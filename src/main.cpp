// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief thumbgrid entry point
 *
 * Browses the images of a directory in a virtualized thumbnail grid. See Application for the
 * startup sequence.
 */

#include "application.h"

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char** argv) {
    try {
        thumbgrid::Application app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("[main] Unhandled exception: {}", e.what());
        spdlog::dump_backtrace();
        return 1;
    }
}
