/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "refine_csv_reader.hpp"

// standard
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

// class
#include "malformed_record.hpp"

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c); });
}
} // anonymous namespace

refine_csv_reader::refine_csv_reader(const std::filesystem::path& filepath)
    : filepath{filepath}, reader{filepath}, line_num(0), eof_reached(false),
      column_count(0), strand_column(0), primer_column(0) {

    // First non-blank line is the header; an empty file has no rows at all
    std::string line;
    while (reader.read_line(line)) {
        line_num++;
        if (is_blank(line)) continue;
        parse_header(line);
        return;
    }
    eof_reached = true;
}

void refine_csv_reader::parse_header(const std::string& line) {
    // UTF-8 byte order mark before the first column name
    static const std::string BOM = "\xEF\xBB\xBF";
    auto columns = split_csv(line.compare(0, BOM.size(), BOM) == 0 ? line.substr(BOM.size()) : line);
    column_count = columns.size();

    std::unordered_map<std::string, size_t> indices;
    for (size_t i = 0; i < columns.size(); ++i) {
        indices.emplace(trim(columns[i]), i);
    }

    auto require = [&](const std::string& name) -> size_t {
        auto it = indices.find(name);
        if (it == indices.end()) {
            throw malformed_record("missing required column '" + name + "'", filepath, line_num);
        }
        return it->second;
    };

    for (refine_field field : REFINE_FIELDS) {
        numeric_columns[static_cast<size_t>(field)] = require(field_name(field));
    }
    strand_column = require("strand");
    primer_column = require("primer");

    auto id_it = indices.find("id");
    if (id_it != indices.end()) {
        id_column = id_it->second;
    }
}

bool refine_csv_reader::read_next(refine_entry& entry) {
    if (eof_reached) {
        return false;
    }

    std::string line;
    while (reader.read_line(line)) {
        line_num++;

        // Skip empty lines
        if (is_blank(line)) {
            continue;
        }

        parse_line(line, entry);
        return true;
    }

    eof_reached = true;
    return false;
}

void refine_csv_reader::parse_line(const std::string& line, refine_entry& entry) {
    auto fields = split_csv(line);
    if (fields.size() != column_count) {
        throw malformed_record(
            "expected " + std::to_string(column_count) + " fields, found " +
            std::to_string(fields.size()), filepath, line_num);
    }

    // Clear previous entry
    entry = refine_entry();

    for (refine_field field : REFINE_FIELDS) {
        const std::string& cell = fields[numeric_columns[static_cast<size_t>(field)]];
        auto value = parse_number(cell);
        if (!value) {
            throw malformed_record(
                std::string("invalid value for ") + field_name(field) + ": '" + cell + "'",
                filepath, line_num);
        }
        entry.value(field) = *value;
    }

    entry.strand = trim(fields[strand_column]);
    entry.primer = trim(fields[primer_column]);
    if (entry.strand.empty()) {
        throw malformed_record("empty strand label", filepath, line_num);
    }
    if (entry.primer.empty()) {
        throw malformed_record("empty primer label", filepath, line_num);
    }

    if (id_column) {
        entry.id = fields[*id_column];
    }
}

std::vector<std::string> refine_csv_reader::split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(std::move(field));

    return fields;
}

std::optional<double> refine_csv_reader::parse_number(const std::string& cell) {
    std::string value = trim(cell);
    if (value.empty()) {
        return std::nullopt;
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (end != begin + value.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}
