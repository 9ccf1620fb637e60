/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SAMPLE_NAMING_HPP
#define REFINEQC_SAMPLE_NAMING_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "sample_info.hpp"

/**
 * Derives sample ids from refine file names so that the JSON summary and
 * the per-read CSV of one sample end up under the same key:
 *   movie1.flnc.filter_summary.report.json -> movie1
 *   movie1.flnc.report.csv.gz              -> movie1
 */
class sample_naming {
public:
    explicit sample_naming(naming_policy policy = naming_policy::CLEANED,
                           std::vector<std::string> extra_extensions = {});

    std::string derive(const std::filesystem::path& file) const;

    naming_policy policy() const { return policy_; }

    // Strip known suffixes from the file name until none is left
    static std::string clean(const std::filesystem::path& file,
                             const std::vector<std::string>& extra_extensions = {});

    static const std::vector<std::string>& default_extensions();

private:
    naming_policy policy_;
    std::vector<std::string> extra_extensions_;
};

#endif //REFINEQC_SAMPLE_NAMING_HPP
