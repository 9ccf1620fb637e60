/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of refineqc and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef REFINEQC_FILE_READER_HPP
#define REFINEQC_FILE_READER_HPP

#include <cstddef>

// Base class for all file readers
class file_reader_base {
    public:
        virtual bool has_next() const = 0;
        virtual size_t get_current_line() const = 0;
        virtual ~file_reader_base() = default;
};

// Templated derived class for type-specific reading
template<typename EntryType>
class file_reader : public file_reader_base {
    public:
        virtual bool read_next(EntryType& entry) = 0;
};

#endif //REFINEQC_FILE_READER_HPP
