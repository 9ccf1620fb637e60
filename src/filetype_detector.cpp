/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "filetype_detector.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

#include <zlib.h>

#include "refine_csv_reader.hpp"

std::tuple<report_kind, bool> filetype_detector::detect_filetype(
    const std::filesystem::path& filepath) {

    std::ifstream file(filepath, std::ios::binary);
    if(!file) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    // Read first few bytes to check magic numbers
    char buffer[4096];
    file.read(buffer, sizeof(buffer));
    std::streamsize bytes_read = file.gcount();
    file.close();

    // Check if the file is gzipped (magic bytes: 0x1f 0x8b)
    bool is_gzipped = (bytes_read >= 2 &&
                       static_cast<unsigned char>(buffer[0]) == 0x1f &&
                       static_cast<unsigned char>(buffer[1]) == 0x8b);

    report_kind kind = report_kind::UNKNOWN;
    if (is_gzipped) {
        // For gzipped files, we need to decompress and check content
        std::tie(kind, std::ignore) = detect_gzipped_filetype(filepath);
    } else {
        kind = detect_plain_filetype(buffer, bytes_read);
    }

    if (kind == report_kind::UNKNOWN) {
        kind = detect_from_extension(filepath);
    }
    return std::make_tuple(kind, is_gzipped);
}

report_kind filetype_detector::detect_plain_filetype(const char* buffer, std::streamsize size) {
    std::streamsize pos = 0;

    // UTF-8 byte order mark
    if (size >= 3 && static_cast<unsigned char>(buffer[0]) == 0xEF &&
        static_cast<unsigned char>(buffer[1]) == 0xBB &&
        static_cast<unsigned char>(buffer[2]) == 0xBF) {
        pos = 3;
    }

    while (pos < size && std::isspace(static_cast<unsigned char>(buffer[pos]))) {
        pos++;
    }
    if (pos >= size) {
        return report_kind::UNKNOWN;
    }

    // JSON summary
    if (buffer[pos] == '{' || buffer[pos] == '[') {
        return report_kind::SUMMARY;
    }

    // CSV: the header line names the refine columns
    std::streamsize end = pos;
    while (end < size && buffer[end] != '\n') {
        end++;
    }
    auto columns = refine_csv_reader::split_csv(std::string(buffer + pos, static_cast<size_t>(end - pos)));
    bool has_strand = false;
    bool has_fivelen = false;
    for (auto& column : columns) {
        if (!column.empty() && column.back() == '\r') column.pop_back();
        if (column == "strand") has_strand = true;
        if (column == "fivelen") has_fivelen = true;
    }
    if (has_strand && has_fivelen) {
        return report_kind::READS;
    }

    return report_kind::UNKNOWN;
}

std::tuple<report_kind, bool> filetype_detector::detect_gzipped_filetype(const std::filesystem::path& filepath) {
    // Open gzipped file
    gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open gzipped file: " + filepath.string());
    }

    // Read decompressed header
    char buffer[4096];
    int bytes_read = gzread(gzfile, buffer, sizeof(buffer));
    gzclose(gzfile);

    if (bytes_read <= 0) {
        return std::make_tuple(report_kind::UNKNOWN, true);
    }

    return std::make_tuple(detect_plain_filetype(buffer, bytes_read), true);
}

report_kind filetype_detector::detect_from_extension(const std::filesystem::path& filepath) {
    std::filesystem::path name = filepath.filename();
    if (name.extension() == ".gz") {
        name = name.stem();
    }

    std::string extension = name.extension().string();
    if (extension == ".json") {
        return report_kind::SUMMARY;
    }
    if (extension == ".csv") {
        return report_kind::READS;
    }
    return report_kind::UNKNOWN;
}
