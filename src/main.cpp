/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <iostream>
#include <memory>
#include <string>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "utility.hpp"
#include "subcall/refine.hpp"
#include "subcall/manifest_template.hpp"

void showVersion(std::ostream& _str) {
    _str << "refineqc v" << refineqc_VERSION_MAJOR;
    _str << "." << refineqc_VERSION_MINOR << ".";
    _str << refineqc_VERSION_PATCH << " - ";
    _str << "Per-sample statistics for Iso-Seq refine reports";
    _str << std::endl;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: refineqc <subcommand> [options]" << std::endl << std::endl;
    _str << "Subcommands:" << std::endl;
    _str << "  refine      Aggregate Iso-Seq refine summaries and per-read reports per sample" << std::endl;
    _str << "  template    Write a sample manifest template" << std::endl << std::endl;
    _str << "Run 'refineqc <subcommand> --help' for subcommand options." << std::endl;
}

std::unique_ptr<subcall::subcall> make_subcall(const std::string& name) {
    if (name == "refine") {
        return std::make_unique<subcall::refine>();
    }
    if (name == "template") {
        return std::make_unique<subcall::manifest_template>();
    }
    return nullptr;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        showUsage(std::cerr);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        showUsage(std::cout);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        showVersion(std::cout);
        return 0;
    }

    auto cmd = make_subcall(command);
    if (!cmd) {
        logging::error("Unknown subcommand: " + command);
        showUsage(std::cerr);
        return 1;
    }

    try {
        // argv[1] becomes the program name of the subcommand
        auto options = cmd->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cmd->run(result);
        return cmd->exit_status();

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
