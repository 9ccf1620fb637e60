/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_SAMPLE_MANIFEST_HPP
#define REFINEQC_SAMPLE_MANIFEST_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "sample_info.hpp"
#include "sample_naming.hpp"

/**
 * Parser for sample manifest files (TSV format)
 *
 * Manifest format (header required, column order free):
 * file    id    type
 * movie1.flnc.filter_summary.report.json    S1    json
 * movie1.flnc.report.csv.gz                 S1    csv
 *
 * - file: required, relative paths are resolved against the manifest directory
 * - id:   optional sample id; derived from the file name when missing
 * - type: optional json|summary|csv|reads; detected from content when missing
 *
 * Empty lines and lines starting with # are skipped, "." means missing.
 */
class sample_manifest {
public:
    /**
     * @param manifest_path Path to manifest TSV file
     * @param naming Naming used for rows without an id
     * @throws std::runtime_error if file cannot be read or is malformed
     */
    explicit sample_manifest(const std::filesystem::path& manifest_path,
                             const sample_naming& naming = sample_naming());

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    std::vector<sample_info>::const_iterator begin() const { return samples_.begin(); }
    std::vector<sample_info>::const_iterator end() const { return samples_.end(); }

    const std::vector<sample_info>& samples() const { return samples_; }

    /**
     * Write a manifest template with all supported columns
     * @param include_examples Add example rows for two samples
     */
    static void write_template(const std::filesystem::path& output_path,
                               bool include_examples = true);

private:
    // positions of the known columns in the header, npos if absent
    struct column_layout {
        size_t file = std::string::npos;
        size_t id = std::string::npos;
        size_t type = std::string::npos;
    };

    std::filesystem::path manifest_path_;
    std::vector<sample_info> samples_;

    static column_layout parse_header(const std::vector<std::string>& header);

    static sample_info parse_row(const std::vector<std::string>& fields,
                                 const column_layout& layout,
                                 const std::filesystem::path& manifest_dir,
                                 const sample_naming& naming);

    static report_kind parse_kind(const std::string& value);

    // tab-separated cells, trimmed
    static std::vector<std::string> split_fields(const std::string& line);
};

#endif //REFINEQC_SAMPLE_MANIFEST_HPP
