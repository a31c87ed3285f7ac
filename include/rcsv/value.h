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
 * @file value.h
 * @brief ValueType (kind descriptor) and Value (type-erased field value).
 *
 * ValueType describes what a record field holds: a primitive kind, an enum
 * with its member set, a nullable wrapper around one of those, or a map with
 * key and value types. Types outside the supported set are represented as
 * ValueKind::UNSUPPORTED and rejected during schema resolution.
 *
 * Value carries a single field value between record accessors and the field
 * codec. std::monostate stands for "absent" (an empty nullable).
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "date_time.h"
#include "decimal.h"
#include "definitions.h"

namespace rcsv {

    /// One symbolic member of an enum kind
    struct EnumMember {
        int64_t     value;
        std::string name;

        bool operator==(const EnumMember& other) const = default;
    };

    /// Enum field value, stored by its underlying integer
    struct EnumValue {
        int64_t     value = 0;

        bool operator==(const EnumValue& other) const = default;
    };

    struct MapEntry;
    using MapValue = std::vector<MapEntry>;

    using Value = std::variant<
        std::monostate,
        std::string,
        int32_t,
        int64_t,
        float,
        double,
        Decimal,
        bool,
        DateTime,
        char,
        EnumValue,
        MapValue>;

    /// Key/value pair of a map-valued field, in the map's iteration order
    struct MapEntry {
        Value       key;
        Value       value;

        bool operator==(const MapEntry& other) const = default;
    };

    inline bool isAbsent(const Value& value) { return std::holds_alternative<std::monostate>(value); }

    /**
     * @brief Describes the kind of value stored in a record field.
     */
    class ValueType {
        ValueKind                   kind_ = ValueKind::UNSUPPORTED;
        std::string                 type_name_;
        std::vector<EnumMember>     enum_members_;  // ENUM only
        std::vector<ValueType>      children_;      // NULLABLE: {inner}, MAP: {key, value}

        ValueType(ValueKind kind, std::string typeName)
            : kind_(kind), type_name_(std::move(typeName)) {}

    public:
        ValueType() = default;

        static ValueType            primitive(ValueKind kind);
        static ValueType            enumeration(std::string typeName, std::vector<EnumMember> members);
        static ValueType            nullable(ValueType inner);
        static ValueType            map(std::string typeName, ValueType key, ValueType value);
        static ValueType            unsupported(std::string typeName);

        ValueKind                   kind() const            { return kind_; }
        const std::string&          typeName() const        { return type_name_; }
        const std::vector<EnumMember>& enumMembers() const  { return enum_members_; }
        const ValueType&            inner() const;
        const ValueType&            keyType() const;
        const ValueType&            valueType() const;

        bool                        isPrimitive() const     { return isPrimitiveKind(kind_); }
        bool                        isEnum() const          { return kind_ == ValueKind::ENUM; }
        bool                        isNullable() const      { return kind_ == ValueKind::NULLABLE; }
        bool                        isMap() const           { return kind_ == ValueKind::MAP; }
        bool                        isScalar() const;
        const ValueType&            unwrapped() const       { return isNullable() ? inner() : *this; }

        const EnumMember*           findMember(int64_t value) const;
        const EnumMember*           findMember(std::string_view name) const;

        bool operator==(const ValueType& other) const = default;
    };

    /// Zero/default value of a non-nullable kind (absent for NULLABLE)
    Value defaultValue(const ValueType& type);

    /// True when the type lies outside the supported closed set
    bool isComplexType(const ValueType& type);

} // namespace rcsv
