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
 * @file value.hpp
 * @brief ValueType implementations.
 */

#include "value.h"
#include <stdexcept>

namespace rcsv {

    inline ValueType ValueType::primitive(ValueKind kind) {
        if (!isPrimitiveKind(kind)) {
            throw std::invalid_argument("Not a primitive value kind: " + kindToString(kind));
        }
        return ValueType(kind, kindToString(kind));
    }

    inline ValueType ValueType::enumeration(std::string typeName, std::vector<EnumMember> members) {
        ValueType type(ValueKind::ENUM, std::move(typeName));
        type.enum_members_ = std::move(members);
        return type;
    }

    inline ValueType ValueType::nullable(ValueType inner) {
        ValueType type(ValueKind::NULLABLE, "optional<" + inner.typeName() + ">");
        type.children_.push_back(std::move(inner));
        return type;
    }

    inline ValueType ValueType::map(std::string typeName, ValueType key, ValueType value) {
        ValueType type(ValueKind::MAP, std::move(typeName));
        type.children_.push_back(std::move(key));
        type.children_.push_back(std::move(value));
        return type;
    }

    inline ValueType ValueType::unsupported(std::string typeName) {
        return ValueType(ValueKind::UNSUPPORTED, std::move(typeName));
    }

    inline const ValueType& ValueType::inner() const {
        if (kind_ != ValueKind::NULLABLE) {
            throw std::logic_error("ValueType::inner() called on " + kindToString(kind_));
        }
        return children_[0];
    }

    inline const ValueType& ValueType::keyType() const {
        if (kind_ != ValueKind::MAP) {
            throw std::logic_error("ValueType::keyType() called on " + kindToString(kind_));
        }
        return children_[0];
    }

    inline const ValueType& ValueType::valueType() const {
        if (kind_ != ValueKind::MAP) {
            throw std::logic_error("ValueType::valueType() called on " + kindToString(kind_));
        }
        return children_[1];
    }

    inline bool ValueType::isScalar() const {
        if (isPrimitive() || isEnum()) {
            return true;
        }
        if (isNullable()) {
            const ValueType& in = inner();
            return in.isPrimitive() || in.isEnum();
        }
        return false;
    }

    inline const EnumMember* ValueType::findMember(int64_t value) const {
        for (const auto& member : enum_members_) {
            if (member.value == value) return &member;
        }
        return nullptr;
    }

    inline const EnumMember* ValueType::findMember(std::string_view name) const {
        for (const auto& member : enum_members_) {
            if (member.name == name) return &member;
        }
        return nullptr;
    }

    inline Value defaultValue(const ValueType& type) {
        switch (type.kind()) {
            case ValueKind::STRING:     return std::string{};
            case ValueKind::INTEGER:    return int32_t{0};
            case ValueKind::LONG:       return int64_t{0};
            case ValueKind::FLOAT:      return float{0.0f};
            case ValueKind::DOUBLE:     return double{0.0};
            case ValueKind::DECIMAL:    return Decimal{};
            case ValueKind::BOOLEAN:    return bool{false};
            case ValueKind::DATETIME:   return DateTime{};
            case ValueKind::CHAR:       return char{'\0'};
            case ValueKind::ENUM:       return EnumValue{};
            case ValueKind::NULLABLE:   return std::monostate{};
            case ValueKind::MAP:        return MapValue{};
            default:
                throw std::logic_error("No default value for " + kindToString(type.kind()));
        }
    }

    /**
     * @brief Schema validation rule.
     *
     * Supported: primitives, enums, nullable of either, and maps whose key and
     * value types are each one of those. Everything else (unknown types,
     * nested nullables, maps of maps) is complex.
     */
    inline bool isComplexType(const ValueType& type) {
        if (type.isScalar()) {
            return false;
        }
        if (type.isMap()) {
            return !type.keyType().isScalar() || !type.valueType().isScalar();
        }
        return true;
    }

} // namespace rcsv
