/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_RECONCILER_HPP
#define REFINEQC_RECONCILER_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// nlohmann
#include <nlohmann/json.hpp>

#include "refine_stats.hpp"
#include "sample_info.hpp"
#include "summary_loader.hpp"

/**
 * Summary and aggregate of one sample; either side may be missing when
 * only one of the two refine outputs was found.
 */
struct merged_record {
    std::optional<sample_summary> summary;
    std::optional<sample_aggregate> aggregate;

    bool has_summary() const { return summary.has_value(); }
    bool has_aggregate() const { return aggregate.has_value(); }

    /**
     * Shallow union of the summary keys and the aggregate keys.
     * Aggregate keys win on a name clash.
     */
    nlohmann::ordered_json to_json() const;
};

struct reconcile_warning {
    enum class kind {
        KEY_SET_MISMATCH,           // sample present in only one of the sources
        INCOMPATIBLE_SAMPLE_NAMING  // join key unreliable for the whole batch
    };

    kind type;
    std::string message;
    std::set<std::string> samples;  // symmetric difference for KEY_SET_MISMATCH
};

std::string to_string(reconcile_warning::kind kind);

struct reconcile_result {
    std::map<std::string, merged_record> records;
    std::vector<reconcile_warning> warnings;

    bool has_warning(reconcile_warning::kind kind) const;
};

class reconciler {
public:
    /**
     * Precondition for joining: both sources must derive sample ids the same
     * way, and not from raw file names (JSON and CSV names never agree then).
     * @return INCOMPATIBLE_SAMPLE_NAMING warning when violated
     */
    static std::optional<reconcile_warning> check_sample_naming(naming_policy summary_policy,
                                                                naming_policy aggregate_policy);

    /**
     * Join summaries and aggregates on sample id. Every id of either map is
     * kept; a KEY_SET_MISMATCH warning lists ids found in only one of them.
     */
    static reconcile_result merge(const std::map<std::string, sample_summary>& summaries,
                                  const std::map<std::string, sample_aggregate>& aggregates);

    // Report warnings through logging (naming problems as errors)
    static void log_warnings(const std::vector<reconcile_warning>& warnings);
};

#endif // REFINEQC_RECONCILER_HPP
