/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_GZ_LINE_READER_HPP
#define REFINEQC_GZ_LINE_READER_HPP

// standard
#include <filesystem>
#include <string>

// zlib
#include <zlib.h>

/**
 * Line reader on top of zlib. gzread passes uncompressed input through
 * unchanged, so the same reader serves plain and gzipped reports.
 */
class gz_line_reader {
public:
    explicit gz_line_reader(const std::filesystem::path& filepath);
    ~gz_line_reader();

    gz_line_reader(const gz_line_reader&) = delete;
    gz_line_reader& operator=(const gz_line_reader&) = delete;

    // Read one line without the trailing newline (and '\r'). Returns false on EOF.
    bool read_line(std::string& line);

    // Read the remaining content in one go
    std::string read_all();

    const std::filesystem::path& path() const { return filepath; }

private:
    std::filesystem::path filepath;
    gzFile handle;
    char buffer[16384];
};

#endif //REFINEQC_GZ_LINE_READER_HPP
