/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "refine_stats.hpp"

// standard
#include <algorithm>
#include <cmath>

// class
#include "refine_csv_reader.hpp"

void field_accumulator::add(double value) {
    count++;
    sum += value;
    sum_sq += value * value;
    min = std::min(min, value);
    max = std::max(max, value);
}

void field_accumulator::merge(const field_accumulator& other) {
    count += other.count;
    sum += other.sum;
    sum_sq += other.sum_sq;
    min = std::min(min, other.min);
    max = std::max(max, other.max);
}

void running_aggregate::add(const refine_entry& entry) {
    for (refine_field field : REFINE_FIELDS) {
        fields[static_cast<size_t>(field)].add(entry.value(field));
    }
    strand[entry.strand]++;
    primer[entry.primer]++;
    record_count++;
}

void running_aggregate::merge(const running_aggregate& other) {
    for (size_t i = 0; i < fields.size(); ++i) {
        fields[i].merge(other.fields[i]);
    }
    for (const auto& [label, count] : other.strand) {
        strand[label] += count;
    }
    for (const auto& [label, count] : other.primer) {
        primer[label] += count;
    }
    record_count += other.record_count;
}

std::optional<sample_aggregate> running_aggregate::finalize() const {
    if (record_count == 0) {
        return std::nullopt;
    }

    sample_aggregate result;
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& acc = fields[i];
        auto& out = result.fields[i];

        double n = static_cast<double>(acc.count);
        double mean = acc.sum / n;
        // cancellation can push the variance slightly below zero
        double variance = acc.sum_sq / n - mean * mean;

        out.min = acc.min;
        out.mean = mean;
        out.stddev = variance > 0 ? std::sqrt(variance) : 0.0;
        out.max = acc.max;
    }
    result.strand_counts = strand;
    result.primer_counts = primer;
    result.records = record_count;

    return result;
}

nlohmann::ordered_json sample_aggregate::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (refine_field field : REFINE_FIELDS) {
        const auto& fs = (*this)[field];
        std::string name = field_name(field);
        j["min_" + name] = fs.min;
        j["mean_" + name] = fs.mean;
        j["std_" + name] = fs.stddev;
        j["max_" + name] = fs.max;
    }
    j["strand_counts"] = strand_counts;
    j["primer_counts"] = primer_counts;
    return j;
}

std::optional<sample_aggregate> aggregator::fold(file_reader<refine_entry>& reader) {
    running_aggregate running;
    refine_entry entry;
    while (reader.read_next(entry)) {
        running.add(entry);
    }
    return running.finalize();
}

std::optional<sample_aggregate> aggregator::fold_file(const std::filesystem::path& path) {
    refine_csv_reader reader(path);
    return fold(reader);
}
