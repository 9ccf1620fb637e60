/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SAMPLE_INFO_HPP
#define REFINEQC_SAMPLE_INFO_HPP

#include <filesystem>
#include <string>
#include <utility>

// Which refine output a file carries
enum class report_kind {
    SUMMARY,    // *.filter_summary.report.json
    READS,      // *.report.csv, one row per FLNC read
    UNKNOWN
};

// How the sample id of an input file was derived
enum class naming_policy {
    CLEANED,        // file name with known refine suffixes stripped
    RAW_FILENAME,   // file name used unchanged (--fn-as-s-name)
    EXPLICIT        // given in the manifest "id" column
};

std::string to_string(report_kind kind);
std::string to_string(naming_policy policy);

/**
 * One refine input file and the sample it belongs to
 */
struct sample_info {
    std::string id;                     // sample identifier (join key)
    std::filesystem::path source_file;  // JSON summary or per-read CSV
    report_kind kind = report_kind::UNKNOWN;
    naming_policy naming = naming_policy::CLEANED;

    // Constructors
    sample_info() = default;

    sample_info(std::string sample_id, std::filesystem::path file, report_kind kind,
                naming_policy naming = naming_policy::CLEANED)
        : id(std::move(sample_id)), source_file(std::move(file)), kind(kind), naming(naming) {}
};

#endif //REFINEQC_SAMPLE_INFO_HPP
