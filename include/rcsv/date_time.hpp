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
 * @file date_time.hpp
 * @brief DateTime implementations (calendar math, pattern formatting and parsing).
 */

#include "date_time.h"
#include "culture.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace rcsv {

    namespace detail {

        struct PatternToken {
            char        symbol = 0;     // 0 for literal text
            size_t      count = 0;
            std::string literal;
        };

        inline bool isPatternSymbol(char c) {
            switch (c) {
                case 'y': case 'M': case 'd': case 'H': case 'h':
                case 'm': case 's': case 'f': case 't':
                    return true;
                default:
                    return false;
            }
        }

        /// Split a custom date/time pattern into specifier runs and literal text
        inline std::vector<PatternToken> tokenizePattern(std::string_view pattern) {
            std::vector<PatternToken> tokens;
            auto appendLiteral = [&tokens](std::string_view text) {
                if (tokens.empty() || tokens.back().symbol != 0) {
                    tokens.push_back({});
                }
                tokens.back().literal.append(text);
            };

            size_t i = 0;
            while (i < pattern.size()) {
                char c = pattern[i];
                if (isPatternSymbol(c)) {
                    size_t run = 1;
                    while (i + run < pattern.size() && pattern[i + run] == c) ++run;
                    if (c == 'f' && run > 7) {
                        throw std::invalid_argument("Invalid date/time format pattern: too many 'f' specifiers");
                    }
                    tokens.push_back({c, run, {}});
                    i += run;
                } else if (c == '\'' || c == '"') {
                    size_t close = pattern.find(c, i + 1);
                    if (close == std::string_view::npos) {
                        throw std::invalid_argument("Invalid date/time format pattern: unterminated quote");
                    }
                    appendLiteral(pattern.substr(i + 1, close - i - 1));
                    i = close + 1;
                } else if (c == '\\') {
                    if (i + 1 >= pattern.size()) {
                        throw std::invalid_argument("Invalid date/time format pattern: dangling escape");
                    }
                    appendLiteral(pattern.substr(i + 1, 1));
                    i += 2;
                } else if (c == '%') {
                    ++i;
                } else {
                    appendLiteral(pattern.substr(i, 1));
                    ++i;
                }
            }
            return tokens;
        }

        inline void appendPadded(std::string& out, int value, size_t width) {
            std::string digits = std::to_string(value);
            if (digits.size() < width) {
                out.append(width - digits.size(), '0');
            }
            out += digits;
        }

        /// First UTF-8 encoded character of a string
        inline std::string_view firstCharacter(std::string_view text) {
            if (text.empty()) return text;
            unsigned char lead = static_cast<unsigned char>(text[0]);
            size_t len = (lead < 0x80) ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : 4;
            return text.substr(0, std::min(len, text.size()));
        }

        inline bool readNumber(std::string_view text, size_t& pos, size_t minDigits, size_t maxDigits, int& out) {
            size_t start = pos;
            int value = 0;
            while (pos < text.size() && pos - start < maxDigits &&
                   text[pos] >= '0' && text[pos] <= '9') {
                value = value * 10 + (text[pos] - '0');
                ++pos;
            }
            if (pos - start < minDigits) {
                pos = start;
                return false;
            }
            out = value;
            return true;
        }

        inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i]))) {
                    return false;
                }
            }
            return true;
        }

        /// Longest case-insensitive match of one of `names` at `pos`; returns its index or -1
        template<size_t N>
        int matchName(std::string_view text, size_t& pos, const std::array<std::string, N>& names) {
            int best = -1;
            size_t bestLen = 0;
            for (size_t i = 0; i < N; ++i) {
                const std::string& name = names[i];
                if (name.empty() || name.size() <= bestLen) continue;
                if (equalsIgnoreCase(text.substr(pos, name.size()), name)) {
                    best = static_cast<int>(i);
                    bestLen = name.size();
                }
            }
            if (best >= 0) pos += bestLen;
            return best;
        }

        inline bool isValidDateTime(int year, int month, int day, int hour, int minute, int second, int millisecond) {
            return year >= 1 && year <= 9999 &&
                   month >= 1 && month <= 12 &&
                   day >= 1 && day <= DateTime::daysInMonth(year, month) &&
                   hour >= 0 && hour <= 23 &&
                   minute >= 0 && minute <= 59 &&
                   second >= 0 && second <= 59 &&
                   millisecond >= 0 && millisecond <= 999;
        }

        [[noreturn]] inline void throwBadDateTime(std::string_view text) {
            throw std::invalid_argument("String '" + std::string(text) + "' was not recognized as a valid DateTime.");
        }

    } // namespace detail

    // ── Construction / calendar ─────────────────────────────────────────

    inline DateTime::DateTime(int year, int month, int day, int hour, int minute, int second, int millisecond) {
        if (!detail::isValidDateTime(year, month, day, hour, minute, second, millisecond)) {
            throw std::out_of_range("Year, Month, and Day parameters describe an un-representable DateTime.");
        }
        year_ = static_cast<int16_t>(year);
        month_ = static_cast<uint8_t>(month);
        day_ = static_cast<uint8_t>(day);
        hour_ = static_cast<uint8_t>(hour);
        minute_ = static_cast<uint8_t>(minute);
        second_ = static_cast<uint8_t>(second);
        millisecond_ = static_cast<uint16_t>(millisecond);
    }

    inline bool DateTime::isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    inline int DateTime::daysInMonth(int year, int month) {
        static constexpr int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12) {
            throw std::out_of_range("Month must be between 1 and 12");
        }
        return (month == 2 && isLeapYear(year)) ? 29 : days[month - 1];
    }

    inline int DateTime::dayOfYear() const {
        int doy = day_;
        for (int m = 1; m < month_; ++m) {
            doy += daysInMonth(year_, m);
        }
        return doy;
    }

    inline int DateTime::dayOfWeek() const {
        // 0001-01-01 was a Monday
        const int64_t y = year_ - 1;
        const int64_t days = y * 365 + y / 4 - y / 100 + y / 400 + dayOfYear() - 1;
        return static_cast<int>((days + 1) % 7);
    }

    // ── Formatting ──────────────────────────────────────────────────────

    inline std::string DateTime::format(std::string_view pattern, const Culture& culture) const {
        std::string out;
        out.reserve(pattern.size() + 8);

        for (const auto& token : detail::tokenizePattern(pattern)) {
            const size_t n = token.count;
            switch (token.symbol) {
                case 0:
                    out += token.literal;
                    break;
                case 'y':
                    if (n == 1) {
                        out += std::to_string(year_ % 100);
                    } else if (n == 2) {
                        detail::appendPadded(out, year_ % 100, 2);
                    } else {
                        detail::appendPadded(out, year_, n);
                    }
                    break;
                case 'M':
                    if (n >= 4) {
                        out += culture.monthNames[month_ - 1];
                    } else if (n == 3) {
                        out += culture.abbreviatedMonthNames[month_ - 1];
                    } else {
                        detail::appendPadded(out, month_, n);
                    }
                    break;
                case 'd':
                    if (n >= 4) {
                        out += culture.dayNames[dayOfWeek()];
                    } else if (n == 3) {
                        out += culture.abbreviatedDayNames[dayOfWeek()];
                    } else {
                        detail::appendPadded(out, day_, n);
                    }
                    break;
                case 'H':
                    detail::appendPadded(out, hour_, std::min<size_t>(n, 2));
                    break;
                case 'h': {
                    int h12 = hour_ % 12;
                    detail::appendPadded(out, h12 == 0 ? 12 : h12, std::min<size_t>(n, 2));
                    break;
                }
                case 'm':
                    detail::appendPadded(out, minute_, std::min<size_t>(n, 2));
                    break;
                case 's':
                    detail::appendPadded(out, second_, std::min<size_t>(n, 2));
                    break;
                case 'f': {
                    // millisecond expressed in 7-digit ticks, truncated to n digits
                    int64_t ticks = static_cast<int64_t>(millisecond_) * 10000;
                    for (size_t k = n; k < 7; ++k) ticks /= 10;
                    detail::appendPadded(out, static_cast<int>(ticks), n);
                    break;
                }
                case 't': {
                    const std::string& designator = hour_ < 12 ? culture.amDesignator : culture.pmDesignator;
                    out += (n == 1) ? std::string(detail::firstCharacter(designator)) : designator;
                    break;
                }
                default:
                    break;
            }
        }
        return out;
    }

    // ── Parsing ─────────────────────────────────────────────────────────

    /// Parse `text` exactly as described by `pattern`. Throws std::invalid_argument.
    inline DateTime DateTime::parseExact(std::string_view text, std::string_view pattern, const Culture& culture) {
        int year = 1, month = 1, day = 1, hour = 0, minute = 0, second = 0, millisecond = 0;
        bool twelveHour = false;
        int meridiem = -1; // -1 none, 0 AM, 1 PM
        size_t pos = 0;

        for (const auto& token : detail::tokenizePattern(pattern)) {
            const size_t n = token.count;
            bool ok = true;
            switch (token.symbol) {
                case 0:
                    ok = text.substr(pos, token.literal.size()) == token.literal;
                    if (ok) pos += token.literal.size();
                    break;
                case 'y':
                    if (n <= 2) {
                        ok = detail::readNumber(text, pos, n, 2, year);
                        if (ok) year += (year <= 49) ? 2000 : 1900;
                    } else {
                        ok = detail::readNumber(text, pos, std::min<size_t>(n, 4), std::max<size_t>(n, 4), year);
                    }
                    break;
                case 'M':
                    if (n >= 4) {
                        int idx = detail::matchName(text, pos, culture.monthNames);
                        ok = idx >= 0;
                        month = idx + 1;
                    } else if (n == 3) {
                        int idx = detail::matchName(text, pos, culture.abbreviatedMonthNames);
                        ok = idx >= 0;
                        month = idx + 1;
                    } else {
                        ok = detail::readNumber(text, pos, n, 2, month);
                    }
                    break;
                case 'd':
                    if (n >= 4) {
                        ok = detail::matchName(text, pos, culture.dayNames) >= 0;
                    } else if (n == 3) {
                        ok = detail::matchName(text, pos, culture.abbreviatedDayNames) >= 0;
                    } else {
                        ok = detail::readNumber(text, pos, n, 2, day);
                    }
                    break;
                case 'H':
                    ok = detail::readNumber(text, pos, std::min<size_t>(n, 2), 2, hour);
                    break;
                case 'h':
                    ok = detail::readNumber(text, pos, std::min<size_t>(n, 2), 2, hour);
                    twelveHour = true;
                    break;
                case 'm':
                    ok = detail::readNumber(text, pos, std::min<size_t>(n, 2), 2, minute);
                    break;
                case 's':
                    ok = detail::readNumber(text, pos, std::min<size_t>(n, 2), 2, second);
                    break;
                case 'f': {
                    int fraction = 0;
                    ok = detail::readNumber(text, pos, n, n, fraction);
                    if (ok) {
                        if (n <= 3) {
                            for (size_t k = n; k < 3; ++k) fraction *= 10;
                        } else {
                            for (size_t k = 3; k < n; ++k) fraction /= 10;
                        }
                        millisecond = fraction;
                    }
                    break;
                }
                case 't': {
                    std::string_view am = culture.amDesignator;
                    std::string_view pm = culture.pmDesignator;
                    if (n == 1) {
                        am = detail::firstCharacter(am);
                        pm = detail::firstCharacter(pm);
                    }
                    std::string_view rest = text.substr(pos);
                    if (!am.empty() && detail::equalsIgnoreCase(rest.substr(0, am.size()), am)) {
                        meridiem = 0;
                        pos += am.size();
                    } else if (!pm.empty() && detail::equalsIgnoreCase(rest.substr(0, pm.size()), pm)) {
                        meridiem = 1;
                        pos += pm.size();
                    } else {
                        ok = false;
                    }
                    break;
                }
                default:
                    break;
            }
            if (!ok) {
                detail::throwBadDateTime(text);
            }
        }

        if (pos != text.size()) {
            detail::throwBadDateTime(text);
        }

        if (twelveHour) {
            if (hour < 1 || hour > 12) {
                detail::throwBadDateTime(text);
            }
            hour %= 12;
            if (meridiem == 1) hour += 12;
        } else if (meridiem == 1 && hour < 12) {
            hour += 12;
        }

        if (!detail::isValidDateTime(year, month, day, hour, minute, second, millisecond)) {
            detail::throwBadDateTime(text);
        }
        return DateTime(year, month, day, hour, minute, second, millisecond);
    }

    /**
     * @brief Parse a limited ISO-8601 subset:
     *        yyyy-MM-dd[(T| )HH:mm[:ss[.fffffff]]][Z]
     */
    inline std::optional<DateTime> DateTime::parseIso8601(std::string_view s) {
        size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millisecond = 0;

        if (!(detail::readNumber(s, pos, 4, 4, year) && pos < s.size() && s[pos++] == '-' &&
              detail::readNumber(s, pos, 2, 2, month) && pos < s.size() && s[pos++] == '-' &&
              detail::readNumber(s, pos, 2, 2, day))) {
            return std::nullopt;
        }

        if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
            ++pos;
            if (!(detail::readNumber(s, pos, 2, 2, hour) && pos < s.size() && s[pos++] == ':' &&
                  detail::readNumber(s, pos, 2, 2, minute))) {
                return std::nullopt;
            }
            if (pos < s.size() && s[pos] == ':') {
                ++pos;
                if (!detail::readNumber(s, pos, 2, 2, second)) return std::nullopt;
                if (pos < s.size() && s[pos] == '.') {
                    ++pos;
                    size_t start = pos;
                    int fraction = 0;
                    if (!detail::readNumber(s, pos, 1, 7, fraction)) return std::nullopt;
                    size_t digits = pos - start;
                    if (digits <= 3) {
                        for (size_t k = digits; k < 3; ++k) fraction *= 10;
                    } else {
                        for (size_t k = 3; k < digits; ++k) fraction /= 10;
                    }
                    millisecond = fraction;
                }
            }
        }

        if (pos < s.size() && s[pos] == 'Z') ++pos;
        if (pos != s.size()) return std::nullopt;

        if (!detail::isValidDateTime(year, month, day, hour, minute, second, millisecond)) {
            return std::nullopt;
        }
        return DateTime(year, month, day, hour, minute, second, millisecond);
    }

    /// Parse with `pattern`, falling back to ISO-8601. Throws std::invalid_argument.
    inline DateTime DateTime::parse(std::string_view text, std::string_view pattern, const Culture& culture) {
        try {
            return parseExact(text, pattern, culture);
        } catch (const std::invalid_argument&) {
            if (auto iso = parseIso8601(text)) {
                return *iso;
            }
            throw;
        }
    }

    inline std::ostream& operator<<(std::ostream& os, const DateTime& value) {
        return os << value.format("yyyy-MM-dd HH:mm:ss.fff");
    }

} // namespace rcsv
