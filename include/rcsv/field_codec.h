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
 * @file field_codec.h
 * @brief Scalar value <-> cell text conversion.
 *
 * A FieldCodec is resolved once per scalar ValueType to a fixed pair of
 * conversion functions, so no per-cell type dispatch takes place.
 *
 * Write: absent -> "", DateTime via options.dateTimeFormat, enums by member
 * name, numbers with the culture's decimal separator and NaN/Infinity symbols.
 * Read: "" -> absent (nullable) or the kind's default value (non-nullable).
 * Any other failure raises ConversionError with the parse error nested.
 */

#include <string>
#include <string_view>

#include "errors.h"
#include "options.h"
#include "value.h"

namespace rcsv {

    class FieldCodec {
    public:
        using ToTextFn   = std::string (*)(const Value& value, const ValueType& type, const SerializerOptions& options);
        using FromTextFn = Value (*)(std::string_view text, const ValueType& type, const SerializerOptions& options);

    private:
        ValueType       type_;
        ToTextFn        to_text_   = nullptr;
        FromTextFn      from_text_ = nullptr;

    public:
        FieldCodec() = default;
        explicit FieldCodec(ValueType type);   // throws std::logic_error for non-scalar types

        const ValueType&    type() const        { return type_; }

        /// Unescaped text form; absent values yield ""
        std::string         format(const Value& value, const SerializerOptions& options) const;
        /// format() passed through escapeField()
        std::string         serialize(const Value& value, const SerializerOptions& options) const;
        Value               deserialize(std::string_view text, const SerializerOptions& options,
                                        std::string_view fieldName = {}) const;
    };

    std::string serializeField(const Value& value, const ValueType& type, const SerializerOptions& options);
    Value       deserializeField(std::string_view text, const ValueType& type, const SerializerOptions& options);

} // namespace rcsv
