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
 * @file field_codec.hpp
 * @brief FieldCodec implementations.
 */

#include "field_codec.h"
#include "culture.hpp"
#include "date_time.hpp"
#include "decimal.hpp"
#include "tokenizer.hpp"
#include "value.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace rcsv {

    namespace detail {

        inline std::string_view trimBlanks(std::string_view text) {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
            return text;
        }

        [[noreturn]] inline void throwBadFormat() {
            throw std::invalid_argument("Input string was not in a correct format.");
        }

        // ── Integers ────────────────────────────────────────────────────

        template<typename T>
        std::string integerToText(const Value& value, const ValueType&, const SerializerOptions&) {
            char buf[24];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), std::get<T>(value));
            return std::string(buf, ptr);
        }

        template<typename T>
        Value integerFromText(std::string_view text, const ValueType&, const SerializerOptions&) {
            std::string_view cell = trimBlanks(text);
            if (!cell.empty() && cell.front() == '+') {
                cell.remove_prefix(1);
                if (!cell.empty() && cell.front() == '-') throwBadFormat();
            }
            T v = 0;
            auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), v);
            if (ec == std::errc::result_out_of_range) {
                throw std::out_of_range("Value was either too large or too small for " + kindToString(
                    sizeof(T) == 4 ? ValueKind::INTEGER : ValueKind::LONG) + ".");
            }
            if (ec != std::errc{} || ptr != cell.data() + cell.size() || cell.empty()) {
                throwBadFormat();
            }
            return Value(std::in_place_type<T>, v);
        }

        // ── Floating point ──────────────────────────────────────────────

        template<typename T>
        std::string floatToText(const Value& value, const ValueType&, const SerializerOptions& options) {
            const Culture& culture = options.culture;
            T v = std::get<T>(value);
            if (std::isnan(v)) return culture.nanSymbol;
            if (std::isinf(v)) return v > 0 ? culture.positiveInfinitySymbol : culture.negativeInfinitySymbol;

            constexpr size_t kMaxDigits = 32;
            char buf[kMaxDigits];
            auto [ptr, ec] = std::to_chars(buf, buf + kMaxDigits, v);
            std::string out(buf, ptr);

            // Replace '.' with the culture's decimal separator
            if (culture.decimalSeparator != '.') {
                for (char& c : out) {
                    if (c == '.') { c = culture.decimalSeparator; break; }
                }
            }
            return out;
        }

        template<typename T>
        Value floatFromText(std::string_view text, const ValueType&, const SerializerOptions& options) {
            const Culture& culture = options.culture;
            std::string_view cell = trimBlanks(text);

            if (cell == culture.nanSymbol) {
                return Value(std::in_place_type<T>, std::numeric_limits<T>::quiet_NaN());
            }
            if (cell == culture.positiveInfinitySymbol) {
                return Value(std::in_place_type<T>, std::numeric_limits<T>::infinity());
            }
            if (cell == culture.negativeInfinitySymbol) {
                return Value(std::in_place_type<T>, -std::numeric_limits<T>::infinity());
            }

            std::string cellStr(cell);
            if (!cellStr.empty() && cellStr.front() == '+') {
                cellStr.erase(0, 1);
                if (!cellStr.empty() && cellStr.front() == '-') throwBadFormat();
            }
            // Only the culture's symbols name non-finite values
            for (char c : cellStr) {
                if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') throwBadFormat();
            }
            if (culture.decimalSeparator != '.') {
                // '.' is not a decimal point in this culture
                if (cellStr.find('.') != std::string::npos) throwBadFormat();
                for (char& c : cellStr) {
                    if (c == culture.decimalSeparator) { c = '.'; break; }
                }
            }

            T v = 0;
            auto [ptr, ec] = std::from_chars(cellStr.data(), cellStr.data() + cellStr.size(), v,
                                             std::chars_format::general);
            if (ec == std::errc::result_out_of_range) {
                throw std::out_of_range("Value was either too large or too small for " +
                                        kindToString(std::is_same_v<T, float> ? ValueKind::FLOAT : ValueKind::DOUBLE) + ".");
            }
            if (ec != std::errc{} || ptr != cellStr.data() + cellStr.size() || cellStr.empty()) {
                throwBadFormat();
            }
            return Value(std::in_place_type<T>, v);
        }

        // ── Remaining kinds ─────────────────────────────────────────────

        inline std::string stringToText(const Value& value, const ValueType&, const SerializerOptions&) {
            return std::get<std::string>(value);
        }

        inline Value stringFromText(std::string_view text, const ValueType&, const SerializerOptions&) {
            return Value(std::in_place_type<std::string>, text);
        }

        inline std::string decimalToText(const Value& value, const ValueType&, const SerializerOptions& options) {
            return std::get<Decimal>(value).toString(options.culture.decimalSeparator);
        }

        inline Value decimalFromText(std::string_view text, const ValueType&, const SerializerOptions& options) {
            return Decimal::parse(trimBlanks(text), options.culture.decimalSeparator);
        }

        inline std::string boolToText(const Value& value, const ValueType&, const SerializerOptions&) {
            return std::get<bool>(value) ? "True" : "False";
        }

        inline Value boolFromText(std::string_view text, const ValueType&, const SerializerOptions&) {
            std::string_view cell = trimBlanks(text);
            if (equalsIgnoreCase(cell, "true"))  return true;
            if (equalsIgnoreCase(cell, "false")) return false;
            throw std::invalid_argument("String '" + std::string(text) + "' was not recognized as a valid Boolean.");
        }

        inline std::string dateTimeToText(const Value& value, const ValueType&, const SerializerOptions& options) {
            return std::get<DateTime>(value).format(options.dateTimeFormat, options.culture);
        }

        inline Value dateTimeFromText(std::string_view text, const ValueType&, const SerializerOptions& options) {
            return DateTime::parse(trimBlanks(text), options.dateTimeFormat, options.culture);
        }

        // '\0' is the default char and writes as an empty cell
        inline std::string charToText(const Value& value, const ValueType&, const SerializerOptions&) {
            char c = std::get<char>(value);
            return c == '\0' ? std::string() : std::string(1, c);
        }

        inline Value charFromText(std::string_view text, const ValueType&, const SerializerOptions&) {
            if (text.size() != 1) {
                throw std::invalid_argument("String must be exactly one character long.");
            }
            return text.front();
        }

        // Non-member values fall back to their numeric text
        inline std::string enumToText(const Value& value, const ValueType& type, const SerializerOptions&) {
            int64_t v = std::get<EnumValue>(value).value;
            if (const EnumMember* member = type.findMember(v)) {
                return member->name;
            }
            return std::to_string(v);
        }

        inline Value enumFromText(std::string_view text, const ValueType& type, const SerializerOptions&) {
            if (const EnumMember* member = type.findMember(text)) {
                return EnumValue{member->value};
            }
            throw std::invalid_argument("Requested value '" + std::string(text) + "' was not found in " +
                                        type.typeName() + ".");
        }

    } // namespace detail

    // ── FieldCodec ──────────────────────────────────────────────────────

    inline FieldCodec::FieldCodec(ValueType type) : type_(std::move(type)) {
        if (!type_.isScalar()) {
            throw std::logic_error("FieldCodec requires a scalar type, got " + type_.typeName());
        }
        switch (type_.unwrapped().kind()) {
            case ValueKind::STRING:
                to_text_ = &detail::stringToText;          from_text_ = &detail::stringFromText;          break;
            case ValueKind::INTEGER:
                to_text_ = &detail::integerToText<int32_t>; from_text_ = &detail::integerFromText<int32_t>; break;
            case ValueKind::LONG:
                to_text_ = &detail::integerToText<int64_t>; from_text_ = &detail::integerFromText<int64_t>; break;
            case ValueKind::FLOAT:
                to_text_ = &detail::floatToText<float>;     from_text_ = &detail::floatFromText<float>;     break;
            case ValueKind::DOUBLE:
                to_text_ = &detail::floatToText<double>;    from_text_ = &detail::floatFromText<double>;    break;
            case ValueKind::DECIMAL:
                to_text_ = &detail::decimalToText;          from_text_ = &detail::decimalFromText;          break;
            case ValueKind::BOOLEAN:
                to_text_ = &detail::boolToText;             from_text_ = &detail::boolFromText;             break;
            case ValueKind::DATETIME:
                to_text_ = &detail::dateTimeToText;         from_text_ = &detail::dateTimeFromText;         break;
            case ValueKind::CHAR:
                to_text_ = &detail::charToText;             from_text_ = &detail::charFromText;             break;
            case ValueKind::ENUM:
                to_text_ = &detail::enumToText;             from_text_ = &detail::enumFromText;             break;
            default:
                throw std::logic_error("No text conversion for " + type_.typeName());
        }
    }

    inline std::string FieldCodec::format(const Value& value, const SerializerOptions& options) const {
        if (isAbsent(value)) {
            return {};
        }
        return to_text_(value, type_.unwrapped(), options);
    }

    inline std::string FieldCodec::serialize(const Value& value, const SerializerOptions& options) const {
        return escapeField(format(value, options), options.delimiterChar());
    }

    inline Value FieldCodec::deserialize(std::string_view text, const SerializerOptions& options,
                                         std::string_view fieldName) const {
        if (text.empty()) {
            return type_.isNullable() ? Value{} : defaultValue(type_);
        }
        try {
            return from_text_(text, type_.unwrapped(), options);
        } catch (const std::exception&) {
            std::throw_with_nested(ConversionError(std::string(text), type_.typeName(), std::string(fieldName)));
        }
    }

    inline std::string serializeField(const Value& value, const ValueType& type, const SerializerOptions& options) {
        return FieldCodec(type).serialize(value, options);
    }

    inline Value deserializeField(std::string_view text, const ValueType& type, const SerializerOptions& options) {
        return FieldCodec(type).deserialize(text, options);
    }

} // namespace rcsv
