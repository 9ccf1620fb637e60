/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_REPORT_WRITER_HPP
#define REFINEQC_REPORT_WRITER_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// nlohmann
#include <nlohmann/json.hpp>

#include "reconciler.hpp"

/**
 * Display metadata of one report column. Passed through to the report
 * host, not interpreted here.
 */
struct column_header {
    std::string key;
    std::string title;
    std::string description;
    std::string scale;
    std::string format;     // empty = host default
};

using merged_map = std::map<std::string, merged_record>;

/**
 * Hand-off files for the report host:
 *   multiqc_isoseq_refine_report.json/.tsv  merged map
 *   isoseq_refine_general_stats.tsv         three summary counts
 *   isoseq_refine_table.tsv                 16 aggregate columns
 *   isoseq_refine_headers.json              column metadata of both tables
 */
class report_writer {
public:
    static constexpr const char* DATA_FILE = "multiqc_isoseq_refine_report";
    static constexpr const char* GENERAL_STATS_FILE = "isoseq_refine_general_stats.tsv";
    static constexpr const char* TABLE_FILE = "isoseq_refine_table.tsv";
    static constexpr const char* HEADERS_FILE = "isoseq_refine_headers.json";
    static constexpr const char* TABLE_ID = "isoseq_refine_table";
    static constexpr const char* NAMESPACE = "refine";
    static constexpr size_t OUTPUT_FILES = 5;

    // num_reads_fl, num_reads_flnc, num_reads_flnc_polya
    static const std::vector<column_header>& general_stats_headers();

    // {min,mean,std,max} x {fivelen,threelen,polyAlen,insertlen}
    static const std::vector<column_header>& table_headers();

    static nlohmann::ordered_json to_json(const merged_map& records);

    // All writers log and return false if the file cannot be created
    static bool write_data_json(const merged_map& records, const std::string& path);
    static bool write_data_tsv(const merged_map& records, const std::string& path);
    static bool write_general_stats_tsv(const merged_map& records, const std::string& path);
    static bool write_table_tsv(const merged_map& records, const std::string& path);
    static bool write_headers_json(const std::string& path);

    /**
     * Write all hand-off files into output_dir (created if missing).
     * @return paths written
     */
    static std::vector<std::string> write_all(const merged_map& records,
                                              const std::filesystem::path& output_dir);
};

#endif // REFINEQC_REPORT_WRITER_HPP
