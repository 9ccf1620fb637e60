/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_UTILITY_HPP
#define REFINEQC_UTILITY_HPP

// standard
#include <chrono>
#include <string>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Only printed when progress output was requested (--progress)
    void progress(const std::string& message);

    void set_progress_enabled(bool enabled);
    void set_quiet(bool quiet);
}

#endif //REFINEQC_UTILITY_HPP
