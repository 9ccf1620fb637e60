/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "refine_batch.hpp"

// standard
#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <thread>

// class
#include "filetype_detector.hpp"
#include "malformed_record.hpp"
#include "utility.hpp"

namespace {
// result slot of one input file, written by exactly one worker
struct file_outcome {
    std::optional<sample_summary> summary;
    std::optional<sample_aggregate> aggregate;
    std::optional<std::string> error;
};

file_outcome process_input(const sample_info& info) {
    file_outcome outcome;
    try {
        if (info.kind == report_kind::SUMMARY) {
            outcome.summary = summary_loader::load_file(info.source_file);
        } else if (info.kind == report_kind::READS) {
            outcome.aggregate = aggregator::fold_file(info.source_file);
        } else {
            outcome.error = "cannot determine report type (expected refine JSON or CSV)";
        }
    } catch (const malformed_record& e) {
        outcome.error = std::string("malformed record: ") + e.what();
    } catch (const std::runtime_error& e) {
        // unreadable file, scoped to this sample
        outcome.error = e.what();
    }
    return outcome;
}
} // anonymous namespace

refine_batch::refine_batch(uint32_t threads)
    : threads_(std::max<uint32_t>(threads, 1)) {}

void refine_batch::add(sample_info info) {
    if (info.kind == report_kind::UNKNOWN) {
        try {
            filetype_detector detector;
            auto [kind, is_gzipped] = detector.detect_filetype(info.source_file);
            info.kind = kind;
            if (kind != report_kind::UNKNOWN) {
                logging::progress("Detected " + to_string(kind) + " report" +
                    (is_gzipped ? " (gzipped)" : "") + ": " + info.source_file.string());
            }
        } catch (const std::runtime_error& e) {
            // stays UNKNOWN, reported as a failure when loading
            logging::progress(e.what());
        }
    }
    inputs_.push_back(std::move(info));
}

void refine_batch::add_file(const std::filesystem::path& file, const sample_naming& naming,
                            report_kind kind) {
    add(sample_info(naming.derive(file), file, kind, naming.policy()));
}

batch_result refine_batch::load() const {
    batch_result result;
    std::vector<file_outcome> outcomes(inputs_.size());

    size_t worker_count = std::min<size_t>(threads_, inputs_.size());
    if (worker_count <= 1) {
        for (size_t i = 0; i < inputs_.size(); ++i) {
            logging::progress("Processing " + inputs_[i].source_file.string());
            outcomes[i] = process_input(inputs_[i]);
        }
    } else {
        logging::info("Processing " + std::to_string(inputs_.size()) + " file(s) on " +
            std::to_string(worker_count) + " threads");

        std::vector<std::exception_ptr> worker_errors(worker_count);
        std::vector<std::thread> workers;
        workers.reserve(worker_count);

        size_t chunk = (inputs_.size() + worker_count - 1) / worker_count;
        for (size_t wi = 0; wi < worker_count; ++wi) {
            size_t first = wi * chunk;
            size_t last = std::min(first + chunk, inputs_.size());
            workers.emplace_back([this, &outcomes, &worker_errors, wi, first, last] {
                try {
                    for (size_t i = first; i < last; ++i) {
                        logging::progress("Processing " + inputs_[i].source_file.string());
                        outcomes[i] = process_input(inputs_[i]);
                    }
                } catch (...) {
                    worker_errors[wi] = std::current_exception();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        for (const auto& error : worker_errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    // Assemble in input order; later files of the same sample win
    for (size_t i = 0; i < inputs_.size(); ++i) {
        const auto& info = inputs_[i];
        auto& outcome = outcomes[i];

        if (info.kind == report_kind::SUMMARY) {
            result.summary_naming.insert(info.naming);
        } else if (info.kind == report_kind::READS) {
            result.aggregate_naming.insert(info.naming);
        }

        if (outcome.error) {
            logging::error("Skipping sample '" + info.id + "' (" + info.source_file.string() +
                "): " + *outcome.error);
            result.failures.push_back({info.id, info.source_file, info.kind, *outcome.error});
            // a failed later file still replaces what an earlier one loaded
            if (info.kind == report_kind::SUMMARY) {
                result.summaries.erase(info.id);
            } else if (info.kind == report_kind::READS) {
                result.aggregates.erase(info.id);
            }
            continue;
        }

        if (outcome.summary) {
            if (result.summaries.count(info.id)) {
                logging::warning("Duplicate JSON summary for sample '" + info.id +
                    "', using " + info.source_file.string());
            }
            result.summaries[info.id] = std::move(*outcome.summary);
        } else if (info.kind == report_kind::READS) {
            if (result.aggregates.count(info.id)) {
                logging::warning("Duplicate CSV report for sample '" + info.id +
                    "', using " + info.source_file.string());
            }
            if (outcome.aggregate) {
                result.aggregates[info.id] = std::move(*outcome.aggregate);
            } else {
                result.aggregates.erase(info.id);
                result.empty_reports.push_back(info.id);
                logging::warning("No reads in CSV report of sample '" + info.id + "': " +
                    info.source_file.string());
            }
        }
    }

    logging::info("Loaded " + std::to_string(result.summaries.size()) + " JSON summar" +
        (result.summaries.size() == 1 ? "y" : "ies") + " and " +
        std::to_string(result.aggregates.size()) + " CSV report(s)");

    return result;
}

reconcile_result refine_batch::reconcile(const batch_result& batch) {
    std::optional<reconcile_warning> naming_warning;

    // raw file names break the join even if only one source is present
    if (batch.summary_naming.count(naming_policy::RAW_FILENAME) ||
        batch.aggregate_naming.count(naming_policy::RAW_FILENAME)) {
        naming_warning = reconciler::check_sample_naming(naming_policy::RAW_FILENAME,
                                                         naming_policy::RAW_FILENAME);
    }
    // both sources configured alike (e.g. explicit and cleaned ids on each side) join safely
    if (!naming_warning && batch.summary_naming != batch.aggregate_naming) {
        for (naming_policy sp : batch.summary_naming) {
            for (naming_policy ap : batch.aggregate_naming) {
                if (naming_warning) break;
                if (!batch.aggregate_naming.count(sp) || !batch.summary_naming.count(ap)) {
                    naming_warning = reconciler::check_sample_naming(sp, ap);
                }
            }
        }
    }

    auto result = reconciler::merge(batch.summaries, batch.aggregates);
    if (naming_warning) {
        result.warnings.insert(result.warnings.begin(), std::move(*naming_warning));
    }

    reconciler::log_warnings(result.warnings);
    return result;
}
