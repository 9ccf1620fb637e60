/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_FILETYPE_DETECTOR_HPP
#define REFINEQC_FILETYPE_DETECTOR_HPP

// standard
#include <filesystem>
#include <ios>
#include <tuple>

#include "sample_info.hpp"

class filetype_detector {
public:
    /**
     * Detect whether a file is a refine JSON summary or a per-read CSV.
     * @return report kind and whether the file is gzipped
     */
    std::tuple<report_kind, bool> detect_filetype(const std::filesystem::path& filepath);

private:
    report_kind detect_plain_filetype(const char* buffer, std::streamsize size);
    std::tuple<report_kind, bool> detect_gzipped_filetype(const std::filesystem::path& filepath);
    report_kind detect_from_extension(const std::filesystem::path& filepath);
};

#endif //REFINEQC_FILETYPE_DETECTOR_HPP
