/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/manifest_template.hpp"

#include <filesystem>

#include "sample_manifest.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options manifest_template::parse_args(int argc, char** argv) {
    cxxopts::Options options("refineqc template",
        "Write a sample manifest template");

    options.add_options("Output")
        ("o,output", "Output manifest path",
            cxxopts::value<std::string>()->default_value("manifest.tsv"))
        ("no-examples", "Write the header only")
        ("q,quiet", "Suppress log output")
        ("h,help", "Show help message")
        ;

    return options;
}

void manifest_template::validate(const cxxopts::ParseResult& args) {
    std::filesystem::path output = args["output"].as<std::string>();
    auto parent = output.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory not found: " + parent.string());
    }
}

void manifest_template::execute(const cxxopts::ParseResult& args) {
    std::string output = args["output"].as<std::string>();
    sample_manifest::write_template(output, !args.count("no-examples"));
    logging::info("Manifest template written to: " + output);
}

} // namespace subcall
