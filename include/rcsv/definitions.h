/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the RCSV library */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rcsv {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Diagnostics to std::cerr, enabled at compile time (-DRCSV_DEBUG_OUTPUTS)
#ifdef RCSV_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

    // Text format constants
    constexpr char              QUOTE_CHAR              = '"';
    constexpr std::string_view  ROW_TERMINATOR          = "\r\n";
    constexpr std::string_view  DEFAULT_DELIMITER       = ",";
    constexpr std::string_view  DEFAULT_DATETIME_FORMAT = "yyyy-MM-dd HH:mm:ss";
    constexpr size_t            ROW_BUFFER_RESERVE      = 4096;

    /**
     * @brief Closed set of value kinds a record field may carry.
     *
     * UNSUPPORTED is not a valid field kind. It tags member types that have no
     * text representation so schema validation can reject them with the
     * offending type name.
     */
    enum class ValueKind : uint8_t {
        STRING      = 0x01,
        INTEGER     = 0x02,   // 32-bit signed
        LONG        = 0x03,   // 64-bit signed
        FLOAT       = 0x04,
        DOUBLE      = 0x05,
        DECIMAL     = 0x06,
        BOOLEAN     = 0x07,
        DATETIME    = 0x08,
        CHAR        = 0x09,
        ENUM        = 0x0A,
        NULLABLE    = 0x0B,
        MAP         = 0x0C,
        UNSUPPORTED = 0xFF
    };

    inline std::string kindToString(ValueKind kind) {
        switch (kind) {
            case ValueKind::STRING:      return "string";
            case ValueKind::INTEGER:     return "int32";
            case ValueKind::LONG:        return "int64";
            case ValueKind::FLOAT:       return "float";
            case ValueKind::DOUBLE:      return "double";
            case ValueKind::DECIMAL:     return "decimal";
            case ValueKind::BOOLEAN:     return "bool";
            case ValueKind::DATETIME:    return "datetime";
            case ValueKind::CHAR:        return "char";
            case ValueKind::ENUM:        return "enum";
            case ValueKind::NULLABLE:    return "nullable";
            case ValueKind::MAP:         return "map";
            case ValueKind::UNSUPPORTED: return "unsupported";
            default:                     return "undefined";
        }
    }

    /// Kinds that occupy exactly one cell and have a direct text form
    constexpr bool isPrimitiveKind(ValueKind kind) {
        switch (kind) {
            case ValueKind::STRING:
            case ValueKind::INTEGER:
            case ValueKind::LONG:
            case ValueKind::FLOAT:
            case ValueKind::DOUBLE:
            case ValueKind::DECIMAL:
            case ValueKind::BOOLEAN:
            case ValueKind::DATETIME:
            case ValueKind::CHAR:
                return true;
            default:
                return false;
        }
    }

    template<typename T>
    constexpr bool always_false = false;

} // namespace rcsv
