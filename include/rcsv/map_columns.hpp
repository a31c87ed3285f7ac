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
 * @file map_columns.hpp
 * @brief DynamicColumnSet, MapColumnWriter and HeaderBinding implementations.
 */

#include "map_columns.h"
#include "schema.hpp"
#include "tokenizer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <unordered_set>

namespace rcsv {

    // ── DynamicColumnSet ────────────────────────────────────────────────

    inline bool DynamicColumnSet::add(Value key, std::string text) {
        if (index_.find(text) != index_.end()) {
            return false;
        }
        index_.emplace(text, keys_.size());
        keys_.push_back(std::move(key));
        texts_.push_back(std::move(text));
        return true;
    }

    inline std::optional<size_t> DynamicColumnSet::indexOf(std::string_view text) const {
        auto it = index_.find(std::string(text));
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // ── MapColumnWriter ─────────────────────────────────────────────────

    template<typename R>
    MapColumnWriter<R>::MapColumnWriter(const Schema<R>& schema)
        : schema_(schema), columns_(schema.mapCount()) {}

    template<typename R>
    void MapColumnWriter<R>::collect(const R& record, const SerializerOptions& options) {
        for (size_t m = 0; m < schema_.mapCount(); ++m) {
            Value map = schema_.mapField(m).get(record);
            if (isAbsent(map)) {
                continue;
            }
            const FieldCodec& keyCodec = schema_.mapKeyCodec(m);
            for (auto& entry : std::get<MapValue>(map)) {
                std::string text = keyCodec.format(entry.key, options);
                columns_[m].add(std::move(entry.key), std::move(text));
            }
        }
    }

    template<typename R>
    size_t MapColumnWriter<R>::columnCount() const {
        size_t count = 0;
        for (const auto& set : columns_) {
            count += set.size();
        }
        return count;
    }

    template<typename R>
    void MapColumnWriter<R>::appendHeader(std::vector<std::string>& cells, const SerializerOptions& options) const {
        const char delimiter = options.delimiterChar();
        for (const auto& set : columns_) {
            for (const auto& text : set.texts()) {
                cells.push_back(escapeField(text, delimiter));
            }
        }
    }

    template<typename R>
    void MapColumnWriter<R>::appendCells(const R& record, std::vector<std::string>& cells,
                                         const SerializerOptions& options) const {
        for (size_t m = 0; m < schema_.mapCount(); ++m) {
            const DynamicColumnSet& set = columns_[m];
            const size_t base = cells.size();
            cells.resize(base + set.size());

            Value map = schema_.mapField(m).get(record);
            if (isAbsent(map)) {
                continue;
            }
            const FieldCodec& keyCodec = schema_.mapKeyCodec(m);
            const FieldCodec& valueCodec = schema_.mapValueCodec(m);
            for (const auto& entry : std::get<MapValue>(map)) {
                if (auto col = set.indexOf(keyCodec.format(entry.key, options))) {
                    cells[base + *col] = valueCodec.serialize(entry.value, options);
                }
            }
        }
    }

    // ── HeaderBinding ───────────────────────────────────────────────────

    template<typename R>
    HeaderBinding<R> HeaderBinding<R>::fromHeader(const Schema<R>& schema, const std::vector<std::string>& header,
                                                  const SerializerOptions& options) {
        HeaderBinding binding;
        binding.targets_.resize(header.size());

        std::unordered_set<std::string> present(header.begin(), header.end());
        for (const auto& column : schema.scalarColumnNames()) {
            if (present.find(column) == present.end()) {
                binding.missing_.push_back(column);
            }
        }

        // A repeated scalar name binds at its first column; later ones are map keys
        std::vector<bool> bound(schema.scalarCount(), false);
        for (size_t i = 0; i < header.size(); ++i) {
            CellTarget& target = binding.targets_[i];
            target.header = header[i];

            if (auto scalar = schema.findScalarColumn(header[i]); scalar && !bound[*scalar]) {
                bound[*scalar] = true;
                target.kind = CellTarget::Kind::SCALAR;
                target.field = *scalar;
                continue;
            }
            if (header[i].empty() || schema.mapCount() == 0) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "Warning: CSV header column " << i << " '" << header[i]
                              << "' matches no field and is ignored" << std::endl;
                }
                continue;
            }

            // First map field, in declaration order, whose key type accepts the header text
            target.kind = CellTarget::Kind::MAP;
            target.field = 0;
            for (size_t m = 0; m < schema.mapCount(); ++m) {
                try {
                    Value key = schema.mapKeyCodec(m).deserialize(header[i], options);
                    if (isAbsent(key)) {
                        continue;
                    }
                    target.field = m;
                    target.key = std::move(key);
                    break;
                } catch (const ConversionError&) {
                    continue;   // try the next map field
                }
            }
            if constexpr (DEBUG_OUTPUTS) {
                if (!target.key) {
                    std::cerr << "Warning: CSV header column " << i << " '" << header[i]
                              << "' is not a valid key of map field '" << schema.mapField(0).name()
                              << "'" << std::endl;
                }
            }
        }
        return binding;
    }

    template<typename R>
    HeaderBinding<R> HeaderBinding<R>::positional(const Schema<R>& schema) {
        HeaderBinding binding;
        binding.targets_.resize(schema.scalarCount());
        for (size_t i = 0; i < schema.scalarCount(); ++i) {
            binding.targets_[i].kind = CellTarget::Kind::SCALAR;
            binding.targets_[i].field = i;
            binding.targets_[i].header = schema.scalarField(i).columnName();
        }
        return binding;
    }

    template<typename R>
    void HeaderBinding<R>::apply(const Schema<R>& schema, const std::vector<std::string>& cells, R& record,
                                 const SerializerOptions& options) const {
        std::vector<MapValue> maps(schema.mapCount());
        const size_t n = std::min(cells.size(), targets_.size());

        for (size_t i = 0; i < n; ++i) {
            const CellTarget& target = targets_[i];
            const std::string& cell = cells[i];

            switch (target.kind) {
                case CellTarget::Kind::SCALAR: {
                    const auto& fd = schema.scalarField(target.field);
                    fd.set(record, schema.scalarCodec(target.field).deserialize(cell, options, fd.name()));
                    break;
                }
                case CellTarget::Kind::MAP: {
                    if (cell.empty()) {
                        break;
                    }
                    const auto& fd = schema.mapField(target.field);
                    Value key = target.key
                        ? *target.key
                        : schema.mapKeyCodec(target.field).deserialize(target.header, options, fd.name());
                    Value value = schema.mapValueCodec(target.field).deserialize(cell, options, fd.name());
                    maps[target.field].push_back({std::move(key), std::move(value)});
                    break;
                }
                case CellTarget::Kind::IGNORED:
                    break;
            }
        }

        for (size_t m = 0; m < maps.size(); ++m) {
            if (!maps[m].empty()) {
                schema.mapField(m).set(record, Value(std::in_place_type<MapValue>, std::move(maps[m])));
            }
        }
    }

} // namespace rcsv
