/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SUBCALL_REFINE_HPP
#define REFINEQC_SUBCALL_REFINE_HPP

#include "subcall/subcall.hpp"

#include "refine_batch.hpp"
#include "sample_naming.hpp"

namespace subcall {

/**
 * Refine subcommand: aggregate isoseq refine outputs (JSON summary and
 * per-read CSV) per sample and write the report tables.
 */
class refine : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "refine"; }
    std::string description() const override {
        return "Aggregate Iso-Seq refine summaries and per-read reports per sample";
    }

    int exit_status() const override { return status; }

private:
    int status = 0;

    sample_naming make_naming(const cxxopts::ParseResult& args) const;
    void collect_inputs(const cxxopts::ParseResult& args, refine_batch& batch) const;
};

} // namespace subcall

#endif // REFINEQC_SUBCALL_REFINE_HPP
