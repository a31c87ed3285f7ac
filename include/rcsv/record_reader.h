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
 * @file record_reader.h
 * @brief RecordReader, RecordSequence and deserialize() - CSV text to records.
 *
 * Design:
 *   - The schema is resolved and validated on construction
 *   - open() reads the header line and validates it against the scalar columns
 *   - readNext() pulls one record per non-blank line; quoted line breaks join
 *     physical lines into one record
 *   - Any conversion failure closes the reader and propagates
 *
 * Usage:
 *     rcsv::RecordReader<Person> reader;
 *     reader.open(csvText);
 *     while (reader.readNext()) {
 *         const Person& p = reader.record();
 *     }
 *
 *     for (const Person& p : rcsv::deserialize<Person>(csvText)) { ... }
 */

#include <cstddef>
#include <functional>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "definitions.h"
#include "map_columns.h"
#include "options.h"
#include "schema.h"
#include "tokenizer.h"

namespace rcsv {

    template<typename R>
    class RecordReader {
    public:
        using Factory           = std::function<R()>;

    private:
        Schema<R>                   schema_;
        SerializerOptions           options_;
        char                        delimiter_;
        Factory                     factory_;           // creates the empty record for each row

        std::string                 text_;              // owned input for open(std::string)
        std::istream*               is_ = nullptr;      // borrowed input for open(std::istream&)
        LineReader                  lines_;
        bool                        open_ = false;

        std::vector<std::string>    header_;
        HeaderBinding<R>            binding_;
        std::optional<R>            record_;            // current record
        size_t                      row_pos_ = 0;       // data rows read
        size_t                      file_line_ = 0;     // 1-based physical line of the current record's end

        std::string                 line_buf_;
        std::optional<std::string>  pending_;           // first line of header-less input

        void                        readHeader();

    public:
        explicit RecordReader(SerializerOptions options = {}, Factory factory = {});
        ~RecordReader();

        RecordReader(const RecordReader&) = delete;
        RecordReader& operator=(const RecordReader&) = delete;

        /**
         * @brief Start reading. Throws EmptyInputError when the input has no
         *        line and MissingHeaderError when scalar columns are absent.
         */
        void                        open(std::string text);
        void                        open(std::istream& is);
        bool                        isOpen() const                  { return open_; }
        void                        close();

        bool                        readNext();
        const R&                    record() const                  { return *record_; }
        R&                          record()                        { return *record_; }

        const Schema<R>&            schema() const                  { return schema_; }
        const SerializerOptions&    options() const                 { return options_; }
        const std::vector<std::string>& header() const              { return header_; }
        size_t                      rowPos() const                  { return row_pos_; }
        size_t                      fileLine() const                { return file_line_; }
    };

    /**
     * @brief Lazy, single-pass input range over a RecordReader.
     *
     * Records are produced as the iterator advances. Destroying the sequence
     * releases the input.
     */
    template<typename R>
    class RecordSequence {
        std::unique_ptr<RecordReader<R>>    reader_;
        bool                                started_ = false;
        bool                                has_current_ = false;

        void                                advance();

    public:
        class iterator {
            RecordSequence*     seq_ = nullptr;

        public:
            using iterator_concept  = std::input_iterator_tag;
            using value_type        = R;
            using difference_type   = std::ptrdiff_t;

            iterator() = default;
            explicit iterator(RecordSequence* seq) : seq_(seq) {}

            const R&            operator*() const               { return seq_->reader_->record(); }
            const R*            operator->() const              { return &seq_->reader_->record(); }
            iterator&           operator++()                    { seq_->advance(); return *this; }
            void                operator++(int)                 { seq_->advance(); }
            bool                atEnd() const                   { return seq_ == nullptr || !seq_->has_current_; }

            friend bool operator==(const iterator& it, std::default_sentinel_t) {
                return it.atEnd();
            }
        };

        explicit RecordSequence(std::unique_ptr<RecordReader<R>> reader) : reader_(std::move(reader)) {}

        iterator                            begin();
        std::default_sentinel_t             end() const         { return std::default_sentinel; }

        /// Drain the remaining records
        std::vector<R>                      toVector();
        RecordReader<R>&                    reader()            { return *reader_; }
    };

    template<typename R>
    RecordSequence<R> deserialize(std::string text, const SerializerOptions& options = {},
                                  typename RecordReader<R>::Factory factory = {});

    /// `is` must outlive the returned sequence
    template<typename R>
    RecordSequence<R> deserialize(std::istream& is, const SerializerOptions& options = {},
                                  typename RecordReader<R>::Factory factory = {});

} // namespace rcsv
