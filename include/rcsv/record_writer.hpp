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
 * @file record_writer.hpp
 * @brief RecordWriter and serialize() implementations.
 */

#include "record_writer.h"
#include "map_columns.hpp"
#include "schema.hpp"
#include "tokenizer.hpp"

#include <stdexcept>
#include <type_traits>

namespace rcsv {

    // ── Constructors ────────────────────────────────────────────────────

    template<typename R>
    RecordWriter<R>::RecordWriter(SerializerOptions options)
        : RecordWriter(Schema<R>::resolve(), std::move(options)) {}

    template<typename R>
    RecordWriter<R>::RecordWriter(Schema<R> schema, SerializerOptions options)
        : schema_(std::move(schema))
        , options_(std::move(options))
        , delimiter_(options_.delimiterChar())
        , map_columns_(schema_)
    {
        buf_.reserve(ROW_BUFFER_RESERVE);
        cells_.reserve(schema_.fields().size());
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    template<typename R>
    void RecordWriter<R>::open(std::ostream& os) {
        if (isOpen()) {
            throw std::logic_error("RecordWriter is already open");
        }
        os_ = &os;
        row_cnt_ = 0;
    }

    template<typename R>
    void RecordWriter<R>::open(std::string& out) {
        if (isOpen()) {
            throw std::logic_error("RecordWriter is already open");
        }
        out_ = &out;
        row_cnt_ = 0;
    }

    template<typename R>
    void RecordWriter<R>::close() {
        if (os_ != nullptr) {
            os_->flush();
        }
        os_ = nullptr;
        out_ = nullptr;
    }

    // ── Writing ─────────────────────────────────────────────────────────

    template<typename R>
    void RecordWriter<R>::collect(const R& record) {
        map_columns_.collect(record, options_);
    }

    template<typename R>
    void RecordWriter<R>::flushRow() {
        if (out_ != nullptr) {
            out_->append(buf_);
        } else if (os_ != nullptr) {
            os_->write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
            if (!*os_) {
                throw Error("Failed to write CSV row to output stream");
            }
        } else {
            throw std::logic_error("RecordWriter is not open");
        }
        buf_.clear();
    }

    template<typename R>
    void RecordWriter<R>::writeHeader() {
        cells_.clear();
        for (const auto& name : schema_.scalarColumnNames()) {
            cells_.push_back(escapeField(name, delimiter_));
        }
        map_columns_.appendHeader(cells_, options_);
        appendRow(buf_, cells_, delimiter_);
        flushRow();
    }

    template<typename R>
    void RecordWriter<R>::write(const R& record) {
        cells_.clear();
        for (size_t i = 0; i < schema_.scalarCount(); ++i) {
            cells_.push_back(schema_.scalarCodec(i).serialize(schema_.scalarField(i).get(record), options_));
        }
        map_columns_.appendCells(record, cells_, options_);
        appendRow(buf_, cells_, delimiter_);
        flushRow();
        row_cnt_++;
    }

    // ── serialize() ─────────────────────────────────────────────────────

    namespace detail {

        template<typename R>
        const R& deref(const R* record)     { return *record; }

        template<typename R>
        const R& deref(const R& record)     { return record; }

        /// Forward ranges of lvalues are referenced in place, anything else is copied
        template<typename Range>
        auto materialize(Range&& records) {
            using R = std::remove_cv_t<std::ranges::range_value_t<Range>>;
            if constexpr (std::ranges::forward_range<Range> &&
                          std::is_lvalue_reference_v<std::ranges::range_reference_t<Range>>) {
                std::vector<const R*> out;
                for (const R& record : records) {
                    out.push_back(&record);
                }
                return out;
            } else {
                std::vector<R> out;
                for (auto&& record : records) {
                    out.push_back(std::forward<decltype(record)>(record));
                }
                return out;
            }
        }

        template<typename Range, typename Sink>
        void serializeTo(Range&& records, Sink& sink, const SerializerOptions& options) {
            using R = std::remove_cv_t<std::ranges::range_value_t<Range>>;

            // Schema and options are validated before the input is consumed
            RecordWriter<R> writer(options);
            auto materialized = materialize(std::forward<Range>(records));
            for (const auto& record : materialized) {
                writer.collect(deref(record));
            }

            writer.open(sink);
            if (options.includeHeader) {
                writer.writeHeader();
            }
            for (const auto& record : materialized) {
                writer.write(deref(record));
            }
            writer.close();
        }

    } // namespace detail

    template<std::ranges::input_range Range>
    std::string serialize(Range&& records, const SerializerOptions& options) {
        std::string out;
        detail::serializeTo(std::forward<Range>(records), out, options);
        return out;
    }

    template<std::ranges::input_range Range>
    void serialize(Range&& records, std::ostream& os, const SerializerOptions& options) {
        detail::serializeTo(std::forward<Range>(records), os, options);
    }

} // namespace rcsv
