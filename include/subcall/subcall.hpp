/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SUBCALL_HPP
#define REFINEQC_SUBCALL_HPP

#include <filesystem>
#include <string>

#include <cxxopts.hpp>

namespace subcall {

/**
 * Abstract base class for all refineqc subcommands.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Build the options object for this subcommand.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Execute the subcommand.
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → execute.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add common options shared across all subcommands.
     */
    static void add_common_options(cxxopts::Options& options);

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    // Process exit status after execute()
    virtual int exit_status() const { return 0; }

protected:
    /**
     * Resolve the output directory from --output-dir, falling back to the
     * current directory. Creates the directory if it doesn't exist.
     */
    std::filesystem::path resolve_output_dir(const cxxopts::ParseResult& args) const;

private:
    /**
     * Apply common options (progress, quiet)
     */
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // REFINEQC_SUBCALL_HPP
