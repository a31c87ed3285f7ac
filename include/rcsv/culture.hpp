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
 * @file culture.hpp
 * @brief Culture implementations (built-in culture table).
 */

#include "culture.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace rcsv {

    namespace detail {

        inline Culture makeEnglishCulture(std::string name) {
            Culture c;
            c.name = std::move(name);
            c.monthNames = {"January", "February", "March", "April", "May", "June", "July",
                            "August", "September", "October", "November", "December"};
            c.abbreviatedMonthNames = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
            c.dayNames = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
            c.abbreviatedDayNames = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
            return c;
        }

    } // namespace detail

    inline const Culture& Culture::invariant() {
        static const Culture culture = detail::makeEnglishCulture("");
        return culture;
    }

    /// Look up a built-in culture. Throws std::invalid_argument for unknown names.
    inline Culture Culture::byName(std::string_view name) {
        if (name.empty() || name == "invariant") {
            return invariant();
        }
        if (name == "en-US") {
            return detail::makeEnglishCulture("en-US");
        }
        if (name == "de-DE") {
            Culture c = detail::makeEnglishCulture("de-DE");
            c.decimalSeparator = ',';
            c.positiveInfinitySymbol = "∞";
            c.negativeInfinitySymbol = "-∞";
            c.monthNames = {"Januar", "Februar", "März", "April", "Mai", "Juni", "Juli",
                            "August", "September", "Oktober", "November", "Dezember"};
            c.abbreviatedMonthNames = {"Jan", "Feb", "Mär", "Apr", "Mai", "Jun",
                                       "Jul", "Aug", "Sep", "Okt", "Nov", "Dez"};
            c.dayNames = {"Sonntag", "Montag", "Dienstag", "Mittwoch", "Donnerstag", "Freitag", "Samstag"};
            c.abbreviatedDayNames = {"So", "Mo", "Di", "Mi", "Do", "Fr", "Sa"};
            return c;
        }
        if (name == "fr-FR") {
            Culture c = detail::makeEnglishCulture("fr-FR");
            c.decimalSeparator = ',';
            c.positiveInfinitySymbol = "∞";
            c.negativeInfinitySymbol = "-∞";
            c.monthNames = {"janvier", "février", "mars", "avril", "mai", "juin", "juillet",
                            "août", "septembre", "octobre", "novembre", "décembre"};
            c.abbreviatedMonthNames = {"janv.", "févr.", "mars", "avr.", "mai", "juin",
                                       "juil.", "août", "sept.", "oct.", "nov.", "déc."};
            c.dayNames = {"dimanche", "lundi", "mardi", "mercredi", "jeudi", "vendredi", "samedi"};
            c.abbreviatedDayNames = {"dim.", "lun.", "mar.", "mer.", "jeu.", "ven.", "sam."};
            return c;
        }
        if (name == "ja-JP") {
            Culture c = detail::makeEnglishCulture("ja-JP");
            for (size_t i = 0; i < 12; ++i) {
                c.monthNames[i] = std::to_string(i + 1) + "月";
                c.abbreviatedMonthNames[i] = c.monthNames[i];
            }
            c.dayNames = {"日曜日", "月曜日", "火曜日", "水曜日", "木曜日", "金曜日", "土曜日"};
            c.abbreviatedDayNames = {"日", "月", "火", "水", "木", "金", "土"};
            c.amDesignator = "午前";
            c.pmDesignator = "午後";
            return c;
        }
        throw std::invalid_argument("Unknown culture name: " + std::string(name));
    }

} // namespace rcsv
