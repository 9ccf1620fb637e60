/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "report_writer.hpp"

// standard
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <optional>

// class
#include "refine_entries.hpp"
#include "utility.hpp"

namespace {
// what each numeric column measures, used in titles and descriptions
std::string field_label(refine_field field) {
    switch (field) {
        case refine_field::FIVELEN:   return "5' primer length";
        case refine_field::THREELEN:  return "3' primer length";
        case refine_field::POLYALEN:  return "polyA tail length";
        case refine_field::INSERTLEN: return "insert length";
    }
    return "";
}

// one TSV cell of the merged data file
std::string format_cell(const nlohmann::ordered_json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        std::string out;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!out.empty()) out += ";";
            out += it.key() + ":" + format_cell(it.value());
        }
        return out.empty() ? "." : out;
    }
    if (value.is_null()) {
        return ".";
    }
    return value.dump();
}
} // anonymous namespace

const std::vector<column_header>& report_writer::general_stats_headers() {
    static const std::vector<column_header> headers = {
        {"num_reads_fl", "Full-length",
            "Number of CCS where both primers have been detected",
            "GnBu", "{:,.d}"},
        {"num_reads_flnc", "Non-chimeric full-length",
            "Number of non-chimeric CCS where both primers have been detected",
            "RdYlGn", "{:,.d}"},
        {"num_reads_flnc_polya", "Poly(A) free non-chimeric full-length",
            "Number of non-chimeric CCS where both primers have been detected "
            "and the poly(A) tail has been removed",
            "GnBu", "{:,.d}"},
    };
    return headers;
}

const std::vector<column_header>& report_writer::table_headers() {
    static const std::vector<column_header> headers = [] {
        std::vector<column_header> out;
        for (refine_field field : REFINE_FIELDS) {
            std::string name = field_name(field);
            std::string label = field_label(field);
            // only the 5' maximum shares the GnBu scale of min/std
            std::string max_scale = field == refine_field::FIVELEN ? "GnBu" : "RdYlGn";

            out.push_back({"min_" + name, "Min " + label,
                "The minimum " + label + " in base pair", "GnBu", ""});
            out.push_back({"mean_" + name, "Mean " + label,
                "The mean " + label + " in base pair", "RdYlGn", ""});
            out.push_back({"std_" + name, "Std of " + label,
                "The standard deviation of " + label + " in base pair", "GnBu", ""});
            out.push_back({"max_" + name, "Max " + label,
                "The maximum " + label + " in base pair", max_scale, ""});
        }
        return out;
    }();
    return headers;
}

nlohmann::ordered_json report_writer::to_json(const merged_map& records) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [sample_id, record] : records) {
        j[sample_id] = record.to_json();
    }
    return j;
}

bool report_writer::write_data_json(const merged_map& records, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        logging::error("Cannot open data file: " + path);
        return false;
    }

    out << to_json(records).dump(4) << "\n";

    logging::info("Merged data written to: " + path);
    return true;
}

bool report_writer::write_data_tsv(const merged_map& records, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        logging::error("Cannot open data file: " + path);
        return false;
    }

    // Union of keys in first-seen order
    std::vector<std::string> columns;
    std::vector<nlohmann::ordered_json> rows;
    for (const auto& [sample_id, record] : records) {
        rows.push_back(record.to_json());
        for (auto it = rows.back().begin(); it != rows.back().end(); ++it) {
            if (std::find(columns.begin(), columns.end(), it.key()) == columns.end()) {
                columns.push_back(it.key());
            }
        }
    }

    out << "Sample";
    for (const auto& column : columns) {
        out << "\t" << column;
    }
    out << "\n";

    size_t row = 0;
    for (const auto& [sample_id, record] : records) {
        const auto& values = rows[row++];
        out << sample_id;
        for (const auto& column : columns) {
            auto it = values.find(column);
            out << "\t" << (it == values.end() ? "." : format_cell(*it));
        }
        out << "\n";
    }

    logging::info("Merged data written to: " + path);
    return true;
}

bool report_writer::write_general_stats_tsv(const merged_map& records, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        logging::error("Cannot open general statistics file: " + path);
        return false;
    }

    out << "Sample";
    for (const auto& header : general_stats_headers()) {
        out << "\t" << NAMESPACE << "-" << header.key;
    }
    out << "\n";

    for (const auto& [sample_id, record] : records) {
        out << sample_id;
        for (const auto& header : general_stats_headers()) {
            std::optional<int64_t> count;
            if (record.summary) {
                count = record.summary->get_count(header.key);
            }
            if (count) {
                out << "\t" << *count;
            } else {
                out << "\t.";
            }
        }
        out << "\n";
    }

    logging::info("General statistics written to: " + path);
    return true;
}

bool report_writer::write_table_tsv(const merged_map& records, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        logging::error("Cannot open table file: " + path);
        return false;
    }

    out << "Sample";
    for (const auto& header : table_headers()) {
        out << "\t" << header.key;
    }
    out << "\n";

    out << std::fixed << std::setprecision(2);
    for (const auto& [sample_id, record] : records) {
        out << sample_id;
        if (!record.aggregate) {
            for (size_t i = 0; i < table_headers().size(); ++i) {
                out << "\t.";
            }
            out << "\n";
            continue;
        }
        for (refine_field field : REFINE_FIELDS) {
            const auto& fs = (*record.aggregate)[field];
            out << "\t" << fs.min << "\t" << fs.mean << "\t" << fs.stddev << "\t" << fs.max;
        }
        out << "\n";
    }

    logging::info("Iso-Seq refine table written to: " + path);
    return true;
}

bool report_writer::write_headers_json(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        logging::error("Cannot open headers file: " + path);
        return false;
    }

    auto to_json_headers = [](const std::vector<column_header>& headers) {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        for (const auto& header : headers) {
            nlohmann::ordered_json h;
            h["title"] = header.title;
            h["description"] = header.description;
            h["scale"] = header.scale;
            if (!header.format.empty()) {
                h["format"] = header.format;
            }
            j[header.key] = h;
        }
        return j;
    };

    nlohmann::ordered_json j;
    j["general_stats"]["namespace"] = NAMESPACE;
    j["general_stats"]["headers"] = to_json_headers(general_stats_headers());
    j["table"]["id"] = TABLE_ID;
    j["table"]["title"] = "Iso-Seq refine";
    j["table"]["description"] = "Iso-Seq refine statistics";
    j["table"]["headers"] = to_json_headers(table_headers());

    out << j.dump(4) << "\n";
    return true;
}

std::vector<std::string> report_writer::write_all(const merged_map& records,
                                                  const std::filesystem::path& output_dir) {
    std::filesystem::create_directories(output_dir);

    std::vector<std::string> written;
    auto track = [&written](bool ok, const std::filesystem::path& path) {
        if (ok) written.push_back(path.string());
    };

    auto json_path = output_dir / (std::string(DATA_FILE) + ".json");
    track(write_data_json(records, json_path.string()), json_path);

    auto tsv_path = output_dir / (std::string(DATA_FILE) + ".tsv");
    track(write_data_tsv(records, tsv_path.string()), tsv_path);

    auto general_path = output_dir / GENERAL_STATS_FILE;
    track(write_general_stats_tsv(records, general_path.string()), general_path);

    auto table_path = output_dir / TABLE_FILE;
    track(write_table_tsv(records, table_path.string()), table_path);

    auto headers_path = output_dir / HEADERS_FILE;
    track(write_headers_json(headers_path.string()), headers_path);

    return written;
}
