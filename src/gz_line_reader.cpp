/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "gz_line_reader.hpp"

// standard
#include <cstring>
#include <stdexcept>

gz_line_reader::gz_line_reader(const std::filesystem::path& filepath)
    : filepath{filepath}, handle{nullptr} {

    handle = gzopen(filepath.string().c_str(), "rb");
    if (!handle) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }
}

gz_line_reader::~gz_line_reader() {
    if (handle) {
        gzclose(handle);
    }
}

bool gz_line_reader::read_line(std::string& line) {
    line.clear();
    bool got_data = false;

    // gzgets stops at newline or when the buffer is full
    while (gzgets(handle, buffer, sizeof(buffer)) != nullptr) {
        got_data = true;
        size_t len = std::strlen(buffer);
        if (len > 0 && buffer[len - 1] == '\n') {
            line.append(buffer, len - 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        line.append(buffer, len);
    }

    int errnum = 0;
    const char* msg = gzerror(handle, &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw std::runtime_error("Failed to read " + filepath.string() + ": " + msg);
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return got_data;
}

std::string gz_line_reader::read_all() {
    std::string content;
    int bytes_read = 0;
    while ((bytes_read = gzread(handle, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(bytes_read));
    }

    if (bytes_read < 0) {
        int errnum = 0;
        const char* msg = gzerror(handle, &errnum);
        throw std::runtime_error("Failed to read " + filepath.string() + ": " + msg);
    }
    return content;
}
