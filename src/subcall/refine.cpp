/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/refine.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "report_writer.hpp"
#include "sample_manifest.hpp"
#include "utility.hpp"

namespace subcall {

cxxopts::Options refine::parse_args(int argc, char** argv) {
    cxxopts::Options options("refineqc refine",
        "Aggregate Iso-Seq refine summaries and per-read reports per sample");

    options.add_options("Input")
        ("i,input", "Refine output file(s), JSON or CSV detected from content (plain or .gz)",
            cxxopts::value<std::vector<std::string>>())
        ("json", "Refine JSON summary file(s) (*.filter_summary.report.json)",
            cxxopts::value<std::vector<std::string>>())
        ("csv", "Refine per-read report file(s) (*.report.csv)",
            cxxopts::value<std::vector<std::string>>())
        ("m,manifest", "Sample manifest (TSV with file, id, type columns)",
            cxxopts::value<std::string>())
        ;

    options.add_options("Sample names")
        ("fn-as-s-name", "Use raw file names as sample names (breaks JSON/CSV pairing)")
        ("clean-ext", "Additional suffix to strip from file names",
            cxxopts::value<std::vector<std::string>>())
        ;

    options.add_options("Behaviour")
        ("strict", "Exit with status 2 if any sample failed or the sources did not match")
        ;

    add_common_options(options);

    return options;
}

void refine::validate(const cxxopts::ParseResult& args) {
    if (!args.count("input") && !args.count("json") && !args.count("csv") && !args.count("manifest")) {
        throw std::runtime_error(
            "No input specified. Use -i/--input, --json, --csv or -m/--manifest");
    }

    if (args.count("manifest")) {
        std::string manifest_path = args["manifest"].as<std::string>();
        if (!std::filesystem::exists(manifest_path)) {
            throw std::runtime_error("Manifest file not found: " + manifest_path);
        }
    }

    if (args["threads"].as<uint32_t>() == 0) {
        throw std::runtime_error("--threads must be at least 1");
    }
}

sample_naming refine::make_naming(const cxxopts::ParseResult& args) const {
    naming_policy policy = args.count("fn-as-s-name")
        ? naming_policy::RAW_FILENAME
        : naming_policy::CLEANED;

    std::vector<std::string> extensions;
    if (args.count("clean-ext")) {
        extensions = args["clean-ext"].as<std::vector<std::string>>();
    }
    return sample_naming(policy, extensions);
}

void refine::collect_inputs(const cxxopts::ParseResult& args, refine_batch& batch) const {
    auto naming = make_naming(args);

    if (args.count("manifest")) {
        std::string manifest_path = args["manifest"].as<std::string>();
        logging::info("Loading manifest: " + manifest_path);
        sample_manifest manifest(manifest_path, naming);
        logging::info("Found " + std::to_string(manifest.size()) + " file(s) in manifest");

        for (const auto& info : manifest) {
            batch.add(info);
        }
    }

    auto add_all = [&](const std::string& option, report_kind kind) {
        if (!args.count(option)) return;
        for (const auto& file : args[option].as<std::vector<std::string>>()) {
            batch.add_file(file, naming, kind);
        }
    };
    add_all("input", report_kind::UNKNOWN);
    add_all("json", report_kind::SUMMARY);
    add_all("csv", report_kind::READS);
}

void refine::execute(const cxxopts::ParseResult& args) {
    refine_batch batch(args["threads"].as<uint32_t>());
    collect_inputs(args, batch);

    logging::info("Reading " + std::to_string(batch.inputs().size()) + " Iso-Seq refine file(s)...");
    auto loaded = batch.load();
    auto result = refine_batch::reconcile(loaded);

    if (result.records.empty()) {
        logging::warning("No Iso-Seq refine data found");
    }

    auto out_dir = resolve_output_dir(args);
    auto written = report_writer::write_all(result.records, out_dir);

    logging::info("Iso-Seq refine: " + std::to_string(result.records.size()) + " sample(s), " +
        std::to_string(loaded.failures.size()) + " failed file(s), " +
        std::to_string(result.warnings.size()) + " warning(s)");

    if (written.size() < report_writer::OUTPUT_FILES) {
        status = 1;
    } else if (args.count("strict") && (!loaded.failures.empty() || !result.warnings.empty())) {
        status = 2;
    }
}

} // namespace subcall
