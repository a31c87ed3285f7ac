/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file options.h
 * @brief SerializerOptions - formatting rules shared by serialize() and deserialize().
 */

#include <stdexcept>
#include <string>

#include "culture.h"
#include "definitions.h"

namespace rcsv {

    struct SerializerOptions {
        std::string     delimiter = std::string(DEFAULT_DELIMITER);     // only the first character is significant
        bool            includeHeader = true;
        std::string     dateTimeFormat = std::string(DEFAULT_DATETIME_FORMAT);
        Culture         culture = Culture::invariant();

        /// Effective delimiter character. Throws std::invalid_argument for an empty delimiter.
        char delimiterChar() const {
            if (delimiter.empty()) {
                throw std::invalid_argument("Delimiter must not be empty");
            }
            return delimiter.front();
        }
    };

} // namespace rcsv
