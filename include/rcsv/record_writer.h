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
 * @file record_writer.h
 * @brief RecordWriter and serialize() - records to CSV text.
 *
 * Dynamic map columns must be known before the header is written, so every
 * record is passed to collect() first. serialize() does this for a whole range:
 *
 *     std::vector<Person> people = ...;
 *     std::string csv = rcsv::serialize(people);
 *
 *     rcsv::SerializerOptions opts;
 *     opts.delimiter = ";";
 *     rcsv::serialize(people, std::cout, opts);
 *
 * Rows end with CRLF on every platform.
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <ranges>
#include <string>
#include <vector>

#include "definitions.h"
#include "map_columns.h"
#include "options.h"
#include "schema.h"

namespace rcsv {

    template<typename R>
    class RecordWriter {
        Schema<R>                   schema_;
        SerializerOptions           options_;
        char                        delimiter_;
        MapColumnWriter<R>          map_columns_;

        std::ostream*               os_ = nullptr;      // stream sink, or
        std::string*                out_ = nullptr;     // string sink
        uint64_t                    row_cnt_ = 0;       // data rows written

        std::string                 buf_;               // reusable per-row buffer
        std::vector<std::string>    cells_;

        void                        flushRow();

    public:
        /// Resolves and validates the schema of R. Throws SchemaError / std::invalid_argument.
        explicit RecordWriter(SerializerOptions options = {});
        explicit RecordWriter(Schema<R> schema, SerializerOptions options = {});

        RecordWriter(const RecordWriter&) = delete;
        RecordWriter& operator=(const RecordWriter&) = delete;

        const Schema<R>&            schema() const                  { return schema_; }
        const SerializerOptions&    options() const                 { return options_; }
        const MapColumnWriter<R>&   mapColumns() const              { return map_columns_; }

        /// Register the map keys of `record`; call for every record before writeHeader()
        void                        collect(const R& record);

        void                        open(std::ostream& os);
        void                        open(std::string& out);         // appends to `out`
        bool                        isOpen() const                  { return os_ != nullptr || out_ != nullptr; }
        void                        close();

        void                        writeHeader();
        void                        write(const R& record);
        uint64_t                    rowCount() const                { return row_cnt_; }
    };

    /// Serialize a range of records to a string
    template<std::ranges::input_range Range>
    std::string serialize(Range&& records, const SerializerOptions& options = {});

    /// Serialize a range of records to a stream
    template<std::ranges::input_range Range>
    void serialize(Range&& records, std::ostream& os, const SerializerOptions& options = {});

} // namespace rcsv
