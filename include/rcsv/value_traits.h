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
 * @file value_traits.h
 * @brief Compile-time mapping from C++ member types to ValueType / Value.
 *
 *   std::string                     -> STRING
 *   32-bit / 64-bit signed integers -> INTEGER / LONG
 *   float, double, rcsv::Decimal    -> FLOAT, DOUBLE, DECIMAL
 *   bool, char, rcsv::DateTime      -> BOOLEAN, CHAR, DATETIME
 *   enum E with EnumTraits<E>       -> ENUM
 *   std::optional<T>                -> NULLABLE(T)
 *   std::map / std::unordered_map / rcsv::OrderedMap -> MAP(K, V)
 *
 * Any other type maps to ValueKind::UNSUPPORTED, so the error surfaces during
 * schema resolution with the type's name instead of as a compile failure.
 *
 * Enums publish their symbolic members through an EnumTraits specialization:
 *
 *     namespace rcsv {
 *         template<> struct EnumTraits<Color> {
 *             static constexpr std::array<EnumEntry<Color>, 2> members{{
 *                 {Color::Red, "Red"}, {Color::Blue, "Blue"}}};
 *         };
 *     }
 */

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#if defined(__GNUG__)
#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#endif

#include "ordered_map.h"
#include "value.h"

namespace rcsv {

    template<typename E>
    struct EnumEntry {
        E                   value;
        std::string_view    name;
    };

    /// Specialize with a static `members` range of EnumEntry<E>
    template<typename E>
    struct EnumTraits {};

    template<typename E>
    concept ReflectedEnum = std::is_enum_v<E> && requires {
        { EnumTraits<E>::members.begin() };
        { EnumTraits<E>::members.end() };
    };

    /// Human readable name of a C++ type, used in schema diagnostics
    template<typename T>
    std::string typeName() {
        const char* mangled = typeid(T).name();
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, void (*)(void*)> demangled(
            abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
        if (status == 0 && demangled) {
            return demangled.get();
        }
#endif
        return mangled;
    }

    template<typename T>
    constexpr bool isCharType = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                std::is_same_v<T, char32_t> || std::is_same_v<T, signed char> ||
                                std::is_same_v<T, unsigned char>;

    template<typename T>
    constexpr bool isInt32Type = std::is_integral_v<T> && std::is_signed_v<T> && sizeof(T) == 4 &&
                                 !isCharType<T> && !std::is_same_v<T, bool>;

    template<typename T>
    constexpr bool isInt64Type = std::is_integral_v<T> && std::is_signed_v<T> && sizeof(T) == 8;

    template<typename T>
    constexpr bool isSupportedScalarType = std::is_same_v<T, std::string> || std::is_same_v<T, bool> ||
                                           std::is_same_v<T, char> || isInt32Type<T> || isInt64Type<T> ||
                                           std::is_same_v<T, float> || std::is_same_v<T, double> ||
                                           std::is_same_v<T, Decimal> || std::is_same_v<T, DateTime> ||
                                           ReflectedEnum<T>;

    // ========================================================================
    // Scalars (primary template)
    // ========================================================================
    template<typename T>
    struct ValueTraits {
        static ValueType type() {
            if constexpr (std::is_same_v<T, std::string>)   return ValueType::primitive(ValueKind::STRING);
            else if constexpr (std::is_same_v<T, bool>)     return ValueType::primitive(ValueKind::BOOLEAN);
            else if constexpr (std::is_same_v<T, char>)     return ValueType::primitive(ValueKind::CHAR);
            else if constexpr (isInt32Type<T>)              return ValueType::primitive(ValueKind::INTEGER);
            else if constexpr (isInt64Type<T>)              return ValueType::primitive(ValueKind::LONG);
            else if constexpr (std::is_same_v<T, float>)    return ValueType::primitive(ValueKind::FLOAT);
            else if constexpr (std::is_same_v<T, double>)   return ValueType::primitive(ValueKind::DOUBLE);
            else if constexpr (std::is_same_v<T, Decimal>)  return ValueType::primitive(ValueKind::DECIMAL);
            else if constexpr (std::is_same_v<T, DateTime>) return ValueType::primitive(ValueKind::DATETIME);
            else if constexpr (ReflectedEnum<T>) {
                std::vector<EnumMember> members;
                for (const auto& entry : EnumTraits<T>::members) {
                    members.push_back({static_cast<int64_t>(static_cast<std::underlying_type_t<T>>(entry.value)),
                                       std::string(entry.name)});
                }
                return ValueType::enumeration(typeName<T>(), std::move(members));
            }
            else return ValueType::unsupported(typeName<T>());
        }

        static Value toValue(const T& v) {
            if constexpr (std::is_same_v<T, std::string>)   return Value(std::in_place_type<std::string>, v);
            else if constexpr (std::is_same_v<T, bool>)     return Value(std::in_place_type<bool>, v);
            else if constexpr (std::is_same_v<T, char>)     return Value(std::in_place_type<char>, v);
            else if constexpr (isInt32Type<T>)              return Value(std::in_place_type<int32_t>, static_cast<int32_t>(v));
            else if constexpr (isInt64Type<T>)              return Value(std::in_place_type<int64_t>, static_cast<int64_t>(v));
            else if constexpr (std::is_same_v<T, float>)    return Value(std::in_place_type<float>, v);
            else if constexpr (std::is_same_v<T, double>)   return Value(std::in_place_type<double>, v);
            else if constexpr (std::is_same_v<T, Decimal>)  return Value(std::in_place_type<Decimal>, v);
            else if constexpr (std::is_same_v<T, DateTime>) return Value(std::in_place_type<DateTime>, v);
            else if constexpr (ReflectedEnum<T>) {
                return Value(std::in_place_type<EnumValue>,
                             EnumValue{static_cast<int64_t>(static_cast<std::underlying_type_t<T>>(v))});
            }
            else {
                throw std::logic_error("No value conversion for unsupported type " + typeName<T>());
            }
        }

        static void fromValue(Value&& value, T& out) {
            if constexpr (isSupportedScalarType<T>) {
                if (isAbsent(value)) {
                    out = T{};
                    return;
                }
            }
            if constexpr (std::is_same_v<T, std::string>)   out = std::get<std::string>(std::move(value));
            else if constexpr (std::is_same_v<T, bool>)     out = std::get<bool>(value);
            else if constexpr (std::is_same_v<T, char>)     out = std::get<char>(value);
            else if constexpr (isInt32Type<T>)              out = static_cast<T>(std::get<int32_t>(value));
            else if constexpr (isInt64Type<T>)              out = static_cast<T>(std::get<int64_t>(value));
            else if constexpr (std::is_same_v<T, float>)    out = std::get<float>(value);
            else if constexpr (std::is_same_v<T, double>)   out = std::get<double>(value);
            else if constexpr (std::is_same_v<T, Decimal>)  out = std::get<Decimal>(value);
            else if constexpr (std::is_same_v<T, DateTime>) out = std::get<DateTime>(value);
            else if constexpr (ReflectedEnum<T>) {
                out = static_cast<T>(static_cast<std::underlying_type_t<T>>(std::get<EnumValue>(value).value));
            }
            else {
                throw std::logic_error("No value conversion for unsupported type " + typeName<T>());
            }
        }
    };

    // ========================================================================
    // Nullable
    // ========================================================================
    template<typename T>
    struct ValueTraits<std::optional<T>> {
        static ValueType type() {
            return ValueType::nullable(ValueTraits<T>::type());
        }

        static Value toValue(const std::optional<T>& v) {
            if (!v.has_value()) {
                return std::monostate{};
            }
            return ValueTraits<T>::toValue(*v);
        }

        static void fromValue(Value&& value, std::optional<T>& out) {
            if (isAbsent(value)) {
                out.reset();
                return;
            }
            T inner{};
            ValueTraits<T>::fromValue(std::move(value), inner);
            out = std::move(inner);
        }
    };

    // ========================================================================
    // Maps
    // ========================================================================
    namespace detail {

        template<typename MapType>
        struct MapValueTraits {
            using K = typename MapType::key_type;
            using V = typename MapType::mapped_type;

            static ValueType type() {
                return ValueType::map(typeName<MapType>(), ValueTraits<K>::type(), ValueTraits<V>::type());
            }

            static Value toValue(const MapType& map) {
                MapValue entries;
                entries.reserve(map.size());
                for (const auto& [key, value] : map) {
                    entries.push_back({ValueTraits<K>::toValue(key), ValueTraits<V>::toValue(value)});
                }
                return Value(std::in_place_type<MapValue>, std::move(entries));
            }

            static void fromValue(Value&& value, MapType& out) {
                out.clear();
                if (isAbsent(value)) {
                    return;
                }
                for (auto& entry : std::get<MapValue>(value)) {
                    K key{};
                    V mapped{};
                    ValueTraits<K>::fromValue(std::move(entry.key), key);
                    ValueTraits<V>::fromValue(std::move(entry.value), mapped);
                    out.insert_or_assign(std::move(key), std::move(mapped));
                }
            }
        };

    } // namespace detail

    template<typename K, typename V, typename Compare, typename Alloc>
    struct ValueTraits<std::map<K, V, Compare, Alloc>>
        : detail::MapValueTraits<std::map<K, V, Compare, Alloc>> {};

    template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
    struct ValueTraits<std::unordered_map<K, V, Hash, Eq, Alloc>>
        : detail::MapValueTraits<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

    template<typename K, typename V>
    struct ValueTraits<OrderedMap<K, V>>
        : detail::MapValueTraits<OrderedMap<K, V>> {};

} // namespace rcsv
