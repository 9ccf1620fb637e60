/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_REFINE_STATS_HPP
#define REFINEQC_REFINE_STATS_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <string>

// nlohmann
#include <nlohmann/json.hpp>

#include "file_reader.hpp"
#include "refine_entries.hpp"

// label -> occurrences (strand, primer)
using label_counts = std::map<std::string, uint64_t>;

/**
 * Sufficient statistics for one numeric column.
 * Starts at the identity (count 0, sum 0, min +inf, max -inf).
 */
struct field_accumulator {
    uint64_t count = 0;
    double sum = 0;
    double sum_sq = 0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void add(double value);
    void merge(const field_accumulator& other);
};

/**
 * Finalized statistics for one numeric column (population std).
 */
struct field_summary {
    double min = 0;
    double mean = 0;
    double stddev = 0;
    double max = 0;
};

/**
 * Per-sample aggregate of a refine report.csv.
 * Only ever built from a non-empty stream, see running_aggregate::finalize().
 */
struct sample_aggregate {
    std::array<field_summary, REFINE_FIELD_COUNT> fields;
    label_counts strand_counts;
    label_counts primer_counts;
    uint64_t records = 0;

    const field_summary& operator[](refine_field field) const {
        return fields[static_cast<size_t>(field)];
    }

    /**
     * Flattened view: min_<field>, mean_<field>, std_<field>, max_<field>
     * for every numeric column, then strand_counts and primer_counts.
     */
    nlohmann::ordered_json to_json() const;
};

/**
 * Single-pass fold state for one sample. Memory does not grow with the
 * number of rows, only with the number of distinct strand/primer labels.
 */
class running_aggregate {
public:
    running_aggregate() = default;

    void add(const refine_entry& entry);

    // Combine with a partial aggregate of the same sample
    void merge(const running_aggregate& other);

    uint64_t records() const { return record_count; }
    bool empty() const { return record_count == 0; }

    const field_accumulator& accumulator(refine_field field) const {
        return fields[static_cast<size_t>(field)];
    }

    /**
     * Compute min/mean/std/max per column.
     * @return nullopt when no record was folded
     */
    std::optional<sample_aggregate> finalize() const;

private:
    std::array<field_accumulator, REFINE_FIELD_COUNT> fields{};
    label_counts strand;
    label_counts primer;
    uint64_t record_count = 0;
};

class aggregator {
public:
    /**
     * Drain a reader into a running_aggregate and finalize it.
     * @return nullopt for an empty stream
     * @throws malformed_record if a row cannot be parsed
     */
    static std::optional<sample_aggregate> fold(file_reader<refine_entry>& reader);

    /**
     * Open a refine report.csv (plain or gzipped) and fold it.
     */
    static std::optional<sample_aggregate> fold_file(const std::filesystem::path& path);
};

#endif // REFINEQC_REFINE_STATS_HPP
