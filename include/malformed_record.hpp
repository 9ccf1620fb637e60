/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_MALFORMED_RECORD_HPP
#define REFINEQC_MALFORMED_RECORD_HPP

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * Raised when a refine input cannot be turned into a typed record:
 * a numeric column that does not parse (or is not finite), a missing
 * column, an empty label, or a summary payload that is not a JSON object.
 *
 * Scoped to one sample; the batch loader catches it and keeps going.
 */
class malformed_record : public std::runtime_error {
public:
    explicit malformed_record(const std::string& message)
        : std::runtime_error(message) {}

    malformed_record(const std::string& message,
                     std::filesystem::path file,
                     size_t line = 0)
        : std::runtime_error(format(message, file, line)),
          file_(std::move(file)), line_(line) {}

    const std::filesystem::path& file() const { return file_; }

    // 1-based line number, 0 when not line-specific
    size_t line() const { return line_; }

private:
    std::filesystem::path file_;
    size_t line_ = 0;

    static std::string format(const std::string& message,
                              const std::filesystem::path& file,
                              size_t line) {
        std::string where = file.string();
        if (line > 0) {
            where += ":" + std::to_string(line);
        }
        return where.empty() ? message : where + ": " + message;
    }
};

#endif //REFINEQC_MALFORMED_RECORD_HPP
