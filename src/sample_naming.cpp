/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sample_naming.hpp"

std::string to_string(report_kind kind) {
    switch (kind) {
        case report_kind::SUMMARY: return "summary";
        case report_kind::READS:   return "reads";
        default:                   return "unknown";
    }
}

std::string to_string(naming_policy policy) {
    switch (policy) {
        case naming_policy::CLEANED:      return "cleaned file name";
        case naming_policy::RAW_FILENAME: return "raw file name";
        case naming_policy::EXPLICIT:     return "manifest id";
    }
    return "unknown";
}

sample_naming::sample_naming(naming_policy policy, std::vector<std::string> extra_extensions)
    : policy_(policy), extra_extensions_(std::move(extra_extensions)) {}

std::string sample_naming::derive(const std::filesystem::path& file) const {
    if (policy_ == naming_policy::RAW_FILENAME) {
        return file.filename().string();
    }
    return clean(file, extra_extensions_);
}

const std::vector<std::string>& sample_naming::default_extensions() {
    static const std::vector<std::string> extensions = {
        ".gz", ".json", ".csv", ".report", ".filter_summary", ".flnc"
    };
    return extensions;
}

std::string sample_naming::clean(const std::filesystem::path& file,
                                 const std::vector<std::string>& extra_extensions) {
    std::string name = file.filename().string();

    auto strip = [&name](const std::string& ext) {
        if (ext.empty() || name.size() <= ext.size()) {
            return false;
        }
        if (name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
            return false;
        }
        name.erase(name.size() - ext.size());
        return true;
    };

    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const auto& ext : extra_extensions) {
            if (strip(ext)) stripped = true;
        }
        for (const auto& ext : default_extensions()) {
            if (strip(ext)) stripped = true;
        }
    }

    return name;
}
