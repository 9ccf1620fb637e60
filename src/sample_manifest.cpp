/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sample_manifest.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {
bool is_skipped(const std::string& line) {
    if (line.empty() || line[0] == '#') {
        return true;
    }
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string lowercase(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}
} // anonymous namespace

sample_manifest::sample_manifest(const std::filesystem::path& manifest_path,
                                 const sample_naming& naming)
    : manifest_path_(manifest_path) {

    std::ifstream in(manifest_path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open manifest file: " + manifest_path.string());
    }

    std::string line;
    size_t line_num = 0;
    column_layout layout;
    bool seen_header = false;

    // relative input paths are relative to the manifest itself
    std::filesystem::path base_dir = manifest_path.parent_path();
    if (base_dir.empty()) {
        base_dir = ".";
    }

    while (std::getline(in, line)) {
        line_num++;
        if (is_skipped(line)) {
            continue;
        }

        auto fields = split_fields(line);
        if (!seen_header) {
            layout = parse_header(fields);
            if (layout.file == std::string::npos) {
                throw std::runtime_error("Manifest has no 'file' column: " + manifest_path.string());
            }
            seen_header = true;
            continue;
        }

        try {
            samples_.push_back(parse_row(fields, layout, base_dir, naming));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Error parsing manifest line " +
                std::to_string(line_num) + ": " + e.what());
        }
    }

    if (!seen_header) {
        throw std::runtime_error("Manifest file is empty: " + manifest_path.string());
    }
}

sample_manifest::column_layout sample_manifest::parse_header(
    const std::vector<std::string>& header) {

    column_layout layout;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = lowercase(header[i]);
        if (name == "file") {
            layout.file = i;
        } else if (name == "id") {
            layout.id = i;
        } else if (name == "type") {
            layout.type = i;
        }
    }
    return layout;
}

sample_info sample_manifest::parse_row(
    const std::vector<std::string>& fields,
    const column_layout& layout,
    const std::filesystem::path& manifest_dir,
    const sample_naming& naming) {

    // "." and short rows both mean "not given"
    auto cell = [&fields](size_t index) -> std::string {
        if (index >= fields.size() || fields[index] == ".") {
            return "";
        }
        return fields[index];
    };

    std::string file = cell(layout.file);
    if (file.empty()) {
        throw std::runtime_error("Missing required 'file' field");
    }

    std::filesystem::path source(file);
    if (source.is_relative()) {
        source = manifest_dir / source;
    }
    source = source.lexically_normal();

    report_kind kind = parse_kind(cell(layout.type));

    std::string id = cell(layout.id);
    if (id.empty()) {
        return sample_info(naming.derive(source), source, kind, naming.policy());
    }
    return sample_info(id, source, kind, naming_policy::EXPLICIT);
}

report_kind sample_manifest::parse_kind(const std::string& value) {
    std::string type = lowercase(value);
    if (type.empty()) {
        return report_kind::UNKNOWN;  // detected from content later
    }
    if (type == "json" || type == "summary") {
        return report_kind::SUMMARY;
    }
    if (type == "csv" || type == "reads") {
        return report_kind::READS;
    }
    throw std::runtime_error("Unknown type '" + value + "' (expected json or csv)");
}

std::vector<std::string> sample_manifest::split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        std::string field = line.substr(start, tab == std::string::npos ? std::string::npos : tab - start);

        size_t first = field.find_first_not_of(" \r\n");
        size_t last = field.find_last_not_of(" \r\n");
        fields.push_back(first == std::string::npos ? "" : field.substr(first, last - first + 1));

        if (tab == std::string::npos) {
            break;
        }
        start = tab + 1;
    }
    return fields;
}

void sample_manifest::write_template(const std::filesystem::path& output_path,
                                     bool include_examples) {
    std::ofstream out(output_path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create template file: " + output_path.string());
    }

    out << "file\tid\ttype\n";
    if (!include_examples) {
        return;
    }

    out << "m64012_200101_000000.flnc.filter_summary.report.json\tBrain_rep1\tjson\n"
        << "m64012_200101_000000.flnc.report.csv\tBrain_rep1\tcsv\n";

    // id derived from the file name, type detected from content
    out << "m64012_200202_000000.flnc.filter_summary.report.json\t.\t.\n"
        << "m64012_200202_000000.flnc.report.csv.gz\t.\t.\n";
}
