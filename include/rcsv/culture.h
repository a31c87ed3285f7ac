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
 * @file culture.h
 * @brief Culture - culture-sensitive formatting data (decimal separator,
 *        special floating point symbols, calendar names).
 *
 * The invariant culture is the default everywhere. Cultures are plain values
 * and may be copied and adjusted field by field:
 *
 *     rcsv::Culture c = rcsv::Culture::byName("de-DE");
 *     c.decimalSeparator = '.';
 */

#include <array>
#include <string>
#include <string_view>

namespace rcsv {

    struct Culture {
        std::string                 name;                   // "" for the invariant culture
        char                        decimalSeparator = '.';
        std::string                 nanSymbol = "NaN";
        std::string                 positiveInfinitySymbol = "Infinity";
        std::string                 negativeInfinitySymbol = "-Infinity";
        std::array<std::string, 12> monthNames;             // January first
        std::array<std::string, 12> abbreviatedMonthNames;
        std::array<std::string, 7>  dayNames;               // Sunday first
        std::array<std::string, 7>  abbreviatedDayNames;
        std::string                 amDesignator = "AM";
        std::string                 pmDesignator = "PM";

        bool operator==(const Culture& other) const = default;

        bool isInvariant() const                            { return name.empty(); }

        static const Culture&       invariant();
        static Culture              byName(std::string_view name);
    };

} // namespace rcsv
