/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_REFINE_BATCH_HPP
#define REFINEQC_REFINE_BATCH_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "reconciler.hpp"
#include "refine_stats.hpp"
#include "sample_info.hpp"
#include "sample_naming.hpp"
#include "summary_loader.hpp"

/**
 * A sample input that could not be used; the rest of the batch is unaffected.
 */
struct sample_failure {
    std::string sample_id;
    std::filesystem::path file;
    report_kind kind = report_kind::UNKNOWN;
    std::string message;
};

struct batch_result {
    std::map<std::string, sample_summary> summaries;
    std::map<std::string, sample_aggregate> aggregates;
    std::vector<sample_failure> failures;

    // CSV reports without a single row (no aggregate, not a failure)
    std::vector<std::string> empty_reports;

    // naming policies the inputs of each source were configured with
    std::set<naming_policy> summary_naming;
    std::set<naming_policy> aggregate_naming;
};

/**
 * Collects the refine outputs of one report run and turns them into
 * per-sample summaries and aggregates.
 *
 * Each input file is handled on its own: a malformed or unreadable file
 * becomes a sample_failure instead of stopping the batch. With more than one
 * thread the files are split into contiguous partitions, each worker writes
 * only its own result slots and the maps are assembled after all workers
 * joined.
 */
class refine_batch {
public:
    explicit refine_batch(uint32_t threads = 1);

    /**
     * Add an input whose sample id is already known.
     * An UNKNOWN kind is detected from the file content.
     */
    void add(sample_info info);

    /**
     * Add an input file, deriving its sample id with the given naming.
     */
    void add_file(const std::filesystem::path& file, const sample_naming& naming,
                  report_kind kind = report_kind::UNKNOWN);

    const std::vector<sample_info>& inputs() const { return inputs_; }

    /**
     * Load every summary and fold every per-read report.
     * Only errors outside the input data (e.g. out of memory) are thrown.
     */
    batch_result load() const;

    /**
     * Naming precondition + merge. Raw file names, or sources whose naming
     * policies differ, raise one naming warning for the whole batch; it
     * comes first. Warnings are logged.
     */
    static reconcile_result reconcile(const batch_result& batch);

private:
    uint32_t threads_;
    std::vector<sample_info> inputs_;
};

#endif //REFINEQC_REFINE_BATCH_HPP
