/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("o,output-dir", "Output directory for results (default: current directory)",
            cxxopts::value<std::string>())
        ("t,threads", "Number of threads used to fold per-read reports",
            cxxopts::value<uint32_t>()->default_value("1"))
        ("progress", "Show progress output")
        ("q,quiet", "Suppress log output")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }
    if (args.count("quiet")) {
        logging::set_quiet(true);
    }
}

std::filesystem::path subcall::resolve_output_dir(const cxxopts::ParseResult& args) const {
    std::filesystem::path dir;

    if (args.count("output-dir")) {
        dir = args["output-dir"].as<std::string>();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir;
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

} // namespace subcall
