/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SUBCALL_MANIFEST_TEMPLATE_HPP
#define REFINEQC_SUBCALL_MANIFEST_TEMPLATE_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Template subcommand: write an example sample manifest.
 */
class manifest_template : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "template"; }
    std::string description() const override {
        return "Write a sample manifest template";
    }
};

} // namespace subcall

#endif // REFINEQC_SUBCALL_MANIFEST_TEMPLATE_HPP
