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
 * @file decimal.h
 * @brief Decimal - fixed-point number (64-bit unscaled value, 0..18 fractional digits).
 *
 * The text form keeps the scale: "1.50" parses to {150, 2} and prints as
 * "1.50" again. Equality is numeric, so 1.5 == 1.50.
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace rcsv {

    class Decimal {
        int64_t     unscaled_ = 0;
        uint8_t     scale_ = 0;

    public:
        static constexpr uint8_t MAX_SCALE = 18;

        Decimal() = default;
        Decimal(int64_t unscaled, uint8_t scale);

        static Decimal      fromInteger(int64_t value)      { return Decimal(value, 0); }
        static Decimal      parse(std::string_view text, char decimalSep = '.');

        int64_t             unscaled() const                { return unscaled_; }
        uint8_t             scale() const                   { return scale_; }
        bool                isZero() const                  { return unscaled_ == 0; }
        Decimal             normalized() const;
        double              toDouble() const;
        std::string         toString(char decimalSep = '.') const;

        bool operator==(const Decimal& other) const;
    };

    std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace rcsv
