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
 * @file decimal.hpp
 * @brief Decimal implementations.
 */

#include "decimal.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace rcsv {

    inline Decimal::Decimal(int64_t unscaled, uint8_t scale)
        : unscaled_(unscaled)
        , scale_(scale)
    {
        if (scale > MAX_SCALE) {
            throw std::out_of_range("Decimal scale exceeds " + std::to_string(MAX_SCALE));
        }
    }

    /// Parse [+|-]digits[<sep>digits]. Throws std::invalid_argument on bad format,
    /// std::out_of_range when the value does not fit.
    inline Decimal Decimal::parse(std::string_view text, char decimalSep) {
        size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            negative = (text[pos] == '-');
            ++pos;
        }

        const uint64_t limit = negative
            ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1u
            : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

        uint64_t magnitude = 0;
        size_t digits = 0;
        size_t scale = 0;
        bool fraction = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == decimalSep && !fraction) {
                fraction = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Input string was not in a correct format.");
            }
            unsigned digit = static_cast<unsigned>(c - '0');
            if (magnitude > (limit - digit) / 10) {
                throw std::out_of_range("Value was either too large or too small for a Decimal.");
            }
            magnitude = magnitude * 10 + digit;
            ++digits;
            if (fraction) {
                if (++scale > MAX_SCALE) {
                    throw std::out_of_range("Value has more than " + std::to_string(MAX_SCALE) + " decimal places.");
                }
            }
        }

        if (digits == 0) {
            throw std::invalid_argument("Input string was not in a correct format.");
        }

        int64_t unscaled = negative
            ? static_cast<int64_t>(0u - magnitude)
            : static_cast<int64_t>(magnitude);
        return Decimal(unscaled, static_cast<uint8_t>(scale));
    }

    inline Decimal Decimal::normalized() const {
        Decimal result = *this;
        while (result.scale_ > 0 && result.unscaled_ % 10 == 0) {
            result.unscaled_ /= 10;
            --result.scale_;
        }
        return result;
    }

    inline double Decimal::toDouble() const {
        return static_cast<double>(unscaled_) / std::pow(10.0, scale_);
    }

    inline std::string Decimal::toString(char decimalSep) const {
        const bool negative = unscaled_ < 0;
        const uint64_t magnitude = negative
            ? 0u - static_cast<uint64_t>(unscaled_)
            : static_cast<uint64_t>(unscaled_);

        std::string digits = std::to_string(magnitude);
        if (digits.size() <= scale_) {
            digits.insert(0, scale_ + 1 - digits.size(), '0');
        }
        if (scale_ > 0) {
            digits.insert(digits.size() - scale_, 1, decimalSep);
        }
        if (negative) {
            digits.insert(0, 1, '-');
        }
        return digits;
    }

    inline bool Decimal::operator==(const Decimal& other) const {
        Decimal a = normalized();
        Decimal b = other.normalized();
        return a.unscaled_ == b.unscaled_ && a.scale_ == b.scale_;
    }

    inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
        return os << value.toString();
    }

} // namespace rcsv
