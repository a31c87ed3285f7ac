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
 * @file map_columns.h
 * @brief Flattening of map-valued fields into dynamic columns, and the
 *        header binding that reverses it on read.
 *
 * Row layout: scalar columns in schema order, then for every map field (in
 * declaration order) one column per key of its DynamicColumnSet.
 */

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "options.h"
#include "schema.h"
#include "value.h"

namespace rcsv {

    /**
     * @brief Distinct keys of one map field, in first-seen order.
     *
     * Keys are identified by their text form, which is also the header cell.
     */
    class DynamicColumnSet {
        std::vector<Value>                          keys_;
        std::vector<std::string>                    texts_;
        std::unordered_map<std::string, size_t>     index_;

    public:
        /// Returns false if a key with the same text is already present
        bool                        add(Value key, std::string text);

        size_t                      size() const                { return keys_.size(); }
        bool                        empty() const               { return keys_.empty(); }
        const Value&                key(size_t i) const         { return keys_[i]; }
        const std::string&          text(size_t i) const        { return texts_[i]; }
        const std::vector<std::string>& texts() const           { return texts_; }
        std::optional<size_t>       indexOf(std::string_view text) const;
    };

    /**
     * @brief Write side: collects keys over a whole collection, then emits
     *        header and row cells for the dynamic columns.
     */
    template<typename R>
    class MapColumnWriter {
        const Schema<R>&                schema_;
        std::vector<DynamicColumnSet>   columns_;   // one per map field

    public:
        explicit MapColumnWriter(const Schema<R>& schema);

        void                        collect(const R& record, const SerializerOptions& options);
        const DynamicColumnSet&     columns(size_t mapIndex) const  { return columns_[mapIndex]; }
        size_t                      columnCount() const;

        /// Append escaped header cells for all dynamic columns
        void                        appendHeader(std::vector<std::string>& cells, const SerializerOptions& options) const;
        /// Append escaped value cells of `record`; "" where the record lacks a key
        void                        appendCells(const R& record, std::vector<std::string>& cells,
                                                const SerializerOptions& options) const;
    };

    /// Destination of one column on read
    struct CellTarget {
        enum class Kind : uint8_t { IGNORED, SCALAR, MAP };

        Kind                    kind = Kind::IGNORED;
        size_t                  field = 0;          // scalar or map index within the schema
        std::optional<Value>    key;                // MAP: parsed key, unset if the header failed to parse
        std::string             header;
    };

    /**
     * @brief Read side: maps every column to a scalar field, a map field key
     *        or nothing, and assembles records from row cells.
     */
    template<typename R>
    class HeaderBinding {
        std::vector<CellTarget>     targets_;
        std::vector<std::string>    missing_;

    public:
        static HeaderBinding        fromHeader(const Schema<R>& schema, const std::vector<std::string>& header,
                                               const SerializerOptions& options);
        /// Header-less input: scalar columns by position in schema order
        static HeaderBinding        positional(const Schema<R>& schema);

        const std::vector<CellTarget>&  targets() const             { return targets_; }
        size_t                      columnCount() const             { return targets_.size(); }
        /// Scalar column names absent from the header, in schema order
        const std::vector<std::string>& missingColumns() const      { return missing_; }

        /// Populate `record` from one row. Throws ConversionError for a bad cell.
        void                        apply(const Schema<R>& schema, const std::vector<std::string>& cells, R& record,
                                          const SerializerOptions& options) const;
    };

} // namespace rcsv
