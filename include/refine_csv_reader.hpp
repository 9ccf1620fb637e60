/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */
#ifndef REFINEQC_REFINE_CSV_READER_HPP
#define REFINEQC_REFINE_CSV_READER_HPP

// standard
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// class
#include "file_reader.hpp"
#include "gz_line_reader.hpp"
#include "refine_entries.hpp"

/**
 * Streaming reader for the per-read report.csv written by `isoseq refine`
 *
 * Format (comma separated, header defines the column order):
 * id,strand,fivelen,threelen,polyAlen,insertlen,primer
 * m64012_.../ccs,+,33,31,24,1823,0--1
 *
 * The header is resolved once into fixed column positions. The four
 * numeric columns plus strand and primer are required; "id" is read when
 * present and any other column is ignored. Rows are parsed into
 * refine_entry one at a time, nothing is buffered.
 *
 * Violations (missing column, wrong field count, unparseable or non-finite
 * number, empty strand/primer) throw malformed_record with file and line.
 */
class refine_csv_reader : public file_reader<refine_entry> {
public:
    explicit refine_csv_reader(const std::filesystem::path& filepath);

    // Read next entry
    bool read_next(refine_entry& entry) override;

    // Check if more entries available
    bool has_next() const override { return !eof_reached; }

    // Get current line number (for error reporting)
    size_t get_current_line() const override { return line_num; }

    const std::filesystem::path& path() const { return filepath; }

    // Split one CSV line, honouring double-quoted fields ("" is an escaped quote)
    static std::vector<std::string> split_csv(const std::string& line);

    // Parse a numeric cell; returns nullopt for anything but a finite number
    static std::optional<double> parse_number(const std::string& cell);

private:
    std::filesystem::path filepath;
    gz_line_reader reader;
    size_t line_num;
    bool eof_reached;

    size_t column_count;
    std::array<size_t, REFINE_FIELD_COUNT> numeric_columns{};
    size_t strand_column;
    size_t primer_column;
    std::optional<size_t> id_column;

    void parse_header(const std::string& line);
    void parse_line(const std::string& line, refine_entry& entry);
};

#endif //REFINEQC_REFINE_CSV_READER_HPP
