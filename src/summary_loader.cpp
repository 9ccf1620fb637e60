/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "summary_loader.hpp"

#include <cmath>
#include <limits>

#include "gz_line_reader.hpp"
#include "malformed_record.hpp"

std::optional<int64_t> sample_summary::get_count(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_number_float()) {
        // 2^63 is exactly representable; anything at or above it overflows
        double value = it->get<double>();
        if (std::isfinite(value) && value == std::floor(value) &&
            value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
            return static_cast<int64_t>(value);
        }
    }
    return std::nullopt;
}

sample_summary summary_loader::load(const nlohmann::ordered_json& payload) {
    if (!payload.is_object()) {
        throw malformed_record(std::string("summary payload is not a mapping (found ") +
            payload.type_name() + ")");
    }
    return sample_summary(payload);
}

sample_summary summary_loader::load_file(const std::filesystem::path& path) {
    gz_line_reader reader(path);
    std::string content = reader.read_all();

    nlohmann::ordered_json payload;
    try {
        payload = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw malformed_record(std::string("invalid JSON: ") + e.what(), path);
    }

    if (!payload.is_object()) {
        throw malformed_record(std::string("summary payload is not a mapping (found ") +
            payload.type_name() + ")", path);
    }
    return sample_summary(std::move(payload));
}
