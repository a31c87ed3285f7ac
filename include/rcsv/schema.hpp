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
 * @file schema.hpp
 * @brief Schema implementations.
 */

#include "schema.h"
#include "field_codec.hpp"

#include <unordered_set>

namespace rcsv {

    template<typename R>
    Schema<R>::Schema(FieldList<R> fields) : fields_(std::move(fields)) {
        for (const auto& fd : fields_) {
            if (isComplexType(fd.type())) {
                throw UnsupportedTypeError(fd.name(), fd.type().typeName());
            }
        }

        std::unordered_set<std::string> columns;
        for (size_t i = 0; i < fields_.size(); ++i) {
            const auto& fd = fields_[i];
            if (fd.type().isMap()) {
                map_fields_.push_back(i);
                map_codecs_.push_back({FieldCodec(fd.type().keyType()), FieldCodec(fd.type().valueType())});
                continue;
            }
            if (!columns.insert(fd.columnName()).second) {
                throw SchemaError("Duplicate column name: " + fd.columnName());
            }
            scalar_fields_.push_back(i);
            scalar_codecs_.emplace_back(fd.type());
        }
    }

    template<typename R>
    std::vector<std::string> Schema<R>::scalarColumnNames() const {
        std::vector<std::string> names;
        names.reserve(scalar_fields_.size());
        for (size_t i = 0; i < scalar_fields_.size(); ++i) {
            names.push_back(scalarField(i).columnName());
        }
        return names;
    }

    template<typename R>
    std::optional<size_t> Schema<R>::findScalarColumn(std::string_view columnName) const {
        for (size_t i = 0; i < scalar_fields_.size(); ++i) {
            if (scalarField(i).columnName() == columnName) {
                return i;
            }
        }
        return std::nullopt;
    }

} // namespace rcsv
