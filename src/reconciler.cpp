/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "reconciler.hpp"

// standard
#include <algorithm>
#include <iterator>

// class
#include "utility.hpp"

namespace {
std::string join_ids(const std::set<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

template<typename Map>
std::set<std::string> key_set(const Map& map) {
    std::set<std::string> keys;
    for (const auto& [key, _] : map) {
        keys.insert(key);
    }
    return keys;
}
} // anonymous namespace

nlohmann::ordered_json merged_record::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    if (summary) {
        j = summary->fields;
    }
    if (aggregate) {
        j.update(aggregate->to_json());
    }
    return j;
}

std::string to_string(reconcile_warning::kind kind) {
    switch (kind) {
        case reconcile_warning::kind::KEY_SET_MISMATCH:           return "KeySetMismatch";
        case reconcile_warning::kind::INCOMPATIBLE_SAMPLE_NAMING: return "IncompatibleSampleNaming";
    }
    return "unknown";
}

bool reconcile_result::has_warning(reconcile_warning::kind kind) const {
    return std::any_of(warnings.begin(), warnings.end(),
        [kind](const reconcile_warning& w) { return w.type == kind; });
}

std::optional<reconcile_warning> reconciler::check_sample_naming(naming_policy summary_policy,
                                                                 naming_policy aggregate_policy) {
    if (summary_policy != naming_policy::RAW_FILENAME &&
        aggregate_policy != naming_policy::RAW_FILENAME &&
        summary_policy == aggregate_policy) {
        return std::nullopt;
    }

    reconcile_warning warning;
    warning.type = reconcile_warning::kind::INCOMPATIBLE_SAMPLE_NAMING;
    if (summary_policy == naming_policy::RAW_FILENAME || aggregate_policy == naming_policy::RAW_FILENAME) {
        warning.message = "Iso-Seq refine won't work properly with --fn-as-s-name, as it uses "
            "the file name cleaning patterns to get the sample names from the file names, "
            "and it needs to match JSON and CSV files. Results may be mis-joined";
    } else {
        warning.message = "JSON summaries are named by " + to_string(summary_policy) +
            " but CSV reports by " + to_string(aggregate_policy) +
            ". Sample ids may not match and results may be mis-joined";
    }
    return warning;
}

reconcile_result reconciler::merge(const std::map<std::string, sample_summary>& summaries,
                                   const std::map<std::string, sample_aggregate>& aggregates) {
    reconcile_result result;

    for (const auto& [id, summary] : summaries) {
        result.records[id].summary = summary;
    }
    for (const auto& [id, aggregate] : aggregates) {
        result.records[id].aggregate = aggregate;
    }

    auto summary_ids = key_set(summaries);
    auto aggregate_ids = key_set(aggregates);
    if (summary_ids != aggregate_ids) {
        reconcile_warning warning;
        warning.type = reconcile_warning::kind::KEY_SET_MISMATCH;
        std::set_symmetric_difference(summary_ids.begin(), summary_ids.end(),
                                      aggregate_ids.begin(), aggregate_ids.end(),
                                      std::inserter(warning.samples, warning.samples.end()));
        warning.message = "Iso-Seq refine: different sets of JSON and CSV files found: {" +
            join_ids(summary_ids) + "} vs {" + join_ids(aggregate_ids) + "}. "
            "Make sure that there is a JSON and a CSV file for each sample (unpaired: " +
            join_ids(warning.samples) + ")";
        result.warnings.push_back(std::move(warning));
    }

    return result;
}

void reconciler::log_warnings(const std::vector<reconcile_warning>& warnings) {
    for (const auto& warning : warnings) {
        if (warning.type == reconcile_warning::kind::INCOMPATIBLE_SAMPLE_NAMING) {
            logging::error(warning.message);
        } else {
            logging::warning(warning.message);
        }
    }
}
