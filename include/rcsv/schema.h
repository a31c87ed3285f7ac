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
 * @file schema.h
 * @brief Record schema: field descriptors, column names and validation.
 *
 * A record type declares its fields once:
 *
 *     struct Person {
 *         std::string name;
 *         int32_t     age = 0;
 *
 *         static rcsv::FieldList<Person> describeSchema() {
 *             return {
 *                 rcsv::field("Name", &Person::name),
 *                 rcsv::field("Age",  &Person::age).column("年齢"),
 *             };
 *         }
 *     };
 *
 * Schema<R> resolves that list, validates every field kind and partitions
 * the fields into scalar and map fields, keeping declaration order.
 */

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "errors.h"
#include "field_codec.h"
#include "value.h"
#include "value_traits.h"

namespace rcsv {

    template<typename R>
    class FieldDescriptor {
    public:
        using Getter = std::function<Value(const R&)>;
        using Setter = std::function<void(R&, Value&&)>;

    private:
        std::string                 name_;
        std::optional<std::string>  column_override_;
        ValueType                   type_;
        Getter                      getter_;
        Setter                      setter_;

    public:
        FieldDescriptor(std::string name, ValueType type, Getter getter, Setter setter)
            : name_(std::move(name)), type_(std::move(type))
            , getter_(std::move(getter)), setter_(std::move(setter)) {}

        /// Column-name override; the logical name is used otherwise
        FieldDescriptor&            column(std::string columnName) &    { column_override_ = std::move(columnName); return *this; }
        FieldDescriptor&&           column(std::string columnName) &&   { column_override_ = std::move(columnName); return std::move(*this); }

        const std::string&          name() const            { return name_; }
        const std::string&          columnName() const      { return column_override_ ? *column_override_ : name_; }
        bool                        hasColumnOverride() const { return column_override_.has_value(); }
        const ValueType&            type() const            { return type_; }

        Value                       get(const R& record) const          { return getter_(record); }
        void                        set(R& record, Value&& value) const { setter_(record, std::move(value)); }
    };

    template<typename R>
    using FieldList = std::vector<FieldDescriptor<R>>;

    /// Bind a data member. The member's type decides the field's ValueType.
    template<typename R, typename M>
        requires (!std::is_function_v<M>)
    FieldDescriptor<R> field(std::string name, M R::* member) {
        return FieldDescriptor<R>(
            std::move(name),
            ValueTraits<M>::type(),
            [member](const R& record) { return ValueTraits<M>::toValue(record.*member); },
            [member](R& record, Value&& value) { ValueTraits<M>::fromValue(std::move(value), record.*member); });
    }

    /// Field metadata provider. Specialize to describe types that cannot carry describeSchema().
    template<typename R>
    struct SchemaProvider {
        static FieldList<R> fields() { return R::describeSchema(); }
    };

    template<typename R>
    concept DescribedRecord = requires {
        { SchemaProvider<R>::fields() } -> std::convertible_to<FieldList<R>>;
    };

    /**
     * @brief Resolved, validated schema of record type R.
     *
     * Construction throws UnsupportedTypeError for a field kind outside the
     * supported set and SchemaError for duplicate scalar column names.
     */
    template<typename R>
    class Schema {
        struct MapCodecs {
            FieldCodec key;
            FieldCodec value;
        };

        FieldList<R>                fields_;
        std::vector<size_t>         scalar_fields_;     // indices into fields_, declaration order
        std::vector<size_t>         map_fields_;
        std::vector<FieldCodec>     scalar_codecs_;     // parallel to scalar_fields_
        std::vector<MapCodecs>      map_codecs_;        // parallel to map_fields_

    public:
        explicit Schema(FieldList<R> fields);

        static Schema resolve() requires DescribedRecord<R> { return Schema(SchemaProvider<R>::fields()); }

        const FieldList<R>&         fields() const                      { return fields_; }

        size_t                      scalarCount() const                 { return scalar_fields_.size(); }
        const FieldDescriptor<R>&   scalarField(size_t i) const         { return fields_[scalar_fields_[i]]; }
        const FieldCodec&           scalarCodec(size_t i) const         { return scalar_codecs_[i]; }

        size_t                      mapCount() const                    { return map_fields_.size(); }
        const FieldDescriptor<R>&   mapField(size_t i) const            { return fields_[map_fields_[i]]; }
        const FieldCodec&           mapKeyCodec(size_t i) const         { return map_codecs_[i].key; }
        const FieldCodec&           mapValueCodec(size_t i) const       { return map_codecs_[i].value; }

        std::vector<std::string>    scalarColumnNames() const;
        std::optional<size_t>       findScalarColumn(std::string_view columnName) const;
    };

} // namespace rcsv
