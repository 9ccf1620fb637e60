/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_REFINE_ENTRIES_HPP
#define REFINEQC_REFINE_ENTRIES_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

// numeric columns of a refine report.csv, in report order
enum class refine_field : size_t {
    FIVELEN = 0,
    THREELEN,
    POLYALEN,
    INSERTLEN
};

constexpr size_t REFINE_FIELD_COUNT = 4;

constexpr std::array<refine_field, REFINE_FIELD_COUNT> REFINE_FIELDS = {
    refine_field::FIVELEN,
    refine_field::THREELEN,
    refine_field::POLYALEN,
    refine_field::INSERTLEN
};

// column name as it appears in the CSV header and in merged keys
inline const char* field_name(refine_field field) {
    switch (field) {
        case refine_field::FIVELEN:   return "fivelen";
        case refine_field::THREELEN:  return "threelen";
        case refine_field::POLYALEN:  return "polyAlen";
        case refine_field::INSERTLEN: return "insertlen";
    }
    return "";
}

// represents a single row of a refine report.csv (one FLNC read)
struct refine_entry {
    std::string id;          // optional "id" column, not aggregated
    double fivelen = 0;
    double threelen = 0;
    double polya_len = 0;
    double insert_len = 0;
    std::string strand;
    std::string primer;

    refine_entry() = default;
    refine_entry(double fivelen, double threelen, double polya_len, double insert_len,
        std::string strand, std::string primer)
        : fivelen{fivelen}, threelen{threelen}, polya_len{polya_len}, insert_len{insert_len},
        strand{std::move(strand)}, primer{std::move(primer)} {}

    double value(refine_field field) const {
        switch (field) {
            case refine_field::FIVELEN:   return fivelen;
            case refine_field::THREELEN:  return threelen;
            case refine_field::POLYALEN:  return polya_len;
            case refine_field::INSERTLEN: return insert_len;
        }
        return 0;
    }

    double& value(refine_field field) {
        switch (field) {
            case refine_field::FIVELEN:   return fivelen;
            case refine_field::THREELEN:  return threelen;
            case refine_field::POLYALEN:  return polya_len;
            case refine_field::INSERTLEN: return insert_len;
        }
        throw std::invalid_argument("unknown refine field");
    }
};

#endif //REFINEQC_REFINE_ENTRIES_HPP
