/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SUMMARY_LOADER_HPP
#define REFINEQC_SUMMARY_LOADER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

// nlohmann
#include <nlohmann/json.hpp>

/**
 * Summary written by `isoseq refine` (*.filter_summary.report.json), e.g.
 * {"num_reads_fl": 1000, "num_reads_flnc": 980, "num_reads_flnc_polya": 950}
 *
 * The payload is kept as-is; only the three counts shown in the general
 * statistics table get typed accessors.
 */
struct sample_summary {
    nlohmann::ordered_json fields = nlohmann::ordered_json::object();

    sample_summary() = default;
    explicit sample_summary(nlohmann::ordered_json payload)
        : fields(std::move(payload)) {}

    std::optional<int64_t> num_reads_fl() const { return get_count("num_reads_fl"); }
    std::optional<int64_t> num_reads_flnc() const { return get_count("num_reads_flnc"); }
    std::optional<int64_t> num_reads_flnc_polya() const { return get_count("num_reads_flnc_polya"); }

    // Integral value of a top-level key, nullopt if absent or not a number
    std::optional<int64_t> get_count(const std::string& key) const;
};

class summary_loader {
public:
    /**
     * Structural check only: the payload must be a JSON object.
     * @throws malformed_record otherwise
     */
    static sample_summary load(const nlohmann::ordered_json& payload);

    /**
     * Decode a summary file (plain or gzipped) and load it.
     * @throws malformed_record on invalid JSON or a non-object payload
     */
    static sample_summary load_file(const std::filesystem::path& path);
};

#endif //REFINEQC_SUMMARY_LOADER_HPP
