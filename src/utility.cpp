/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static std::atomic<bool> progress_enabled{false};
    static std::atomic<bool> quiet{false};

    // worker threads may log while folding
    static std::mutex output_mutex;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::tm local_time{};
        localtime_r(&current_time, &local_time);
        std::stringstream ss;
        ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        if (quiet) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "[REFINEQC] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        if (quiet) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << YELLOW << "[REFINEQC] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        if (quiet) return;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << RED << "[REFINEQC] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void progress(const std::string& message) {
        if (!progress_enabled) return;
        info(message);
    }

    void set_progress_enabled(bool enabled) {
        progress_enabled = enabled;
    }

    void set_quiet(bool enabled) {
        quiet = enabled;
    }
}
