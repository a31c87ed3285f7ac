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
 * @file date_time.h
 * @brief DateTime - calendar date and wall-clock time with millisecond resolution.
 *
 * Formatting and parsing use custom format patterns:
 *
 *   yyyy yy        year (4 digits, 2 digits)
 *   MMMM MMM MM M  month (full name, abbreviated name, 2 digits, 1-2 digits)
 *   dddd ddd dd d  day (full day name, abbreviated day name, 2 digits, 1-2 digits)
 *   HH H hh h      hour (24h, 12h)
 *   mm m ss s      minute, second
 *   fff ff f       fraction of a second
 *   tt t           AM/PM designator
 *   'x' "x" \x     literal text
 *
 * Names and designators come from the supplied Culture. Values carry no time
 * zone.
 */

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "culture.h"

namespace rcsv {

    class DateTime {
        // Member order defines chronological comparison
        int16_t     year_ = 1;
        uint8_t     month_ = 1;
        uint8_t     day_ = 1;
        uint8_t     hour_ = 0;
        uint8_t     minute_ = 0;
        uint8_t     second_ = 0;
        uint16_t    millisecond_ = 0;

    public:
        DateTime() = default;
        DateTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, int millisecond = 0);

        int                 year() const            { return year_; }
        int                 month() const           { return month_; }
        int                 day() const             { return day_; }
        int                 hour() const            { return hour_; }
        int                 minute() const          { return minute_; }
        int                 second() const          { return second_; }
        int                 millisecond() const     { return millisecond_; }
        int                 dayOfWeek() const;      // 0 = Sunday
        int                 dayOfYear() const;

        std::string         format(std::string_view pattern, const Culture& culture = Culture::invariant()) const;

        static DateTime     parse(std::string_view text, std::string_view pattern, const Culture& culture = Culture::invariant());
        static DateTime     parseExact(std::string_view text, std::string_view pattern, const Culture& culture = Culture::invariant());
        static std::optional<DateTime> parseIso8601(std::string_view text);

        static bool         isLeapYear(int year);
        static int          daysInMonth(int year, int month);

        auto operator<=>(const DateTime& other) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const DateTime& value);

} // namespace rcsv
