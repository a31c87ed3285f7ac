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
 * @file record_reader.hpp
 * @brief RecordReader, RecordSequence and deserialize() implementations.
 */

#include "record_reader.h"
#include "map_columns.hpp"
#include "schema.hpp"
#include "tokenizer.hpp"

#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace rcsv {

    // ── Constructor / Destructor ────────────────────────────────────────

    template<typename R>
    RecordReader<R>::RecordReader(SerializerOptions options, Factory factory)
        : schema_(Schema<R>::resolve())
        , options_(std::move(options))
        , delimiter_(options_.delimiterChar())
        , factory_(std::move(factory))
    {
        if (!factory_) {
            if constexpr (std::is_default_constructible_v<R>) {
                factory_ = [] { return R{}; };
            } else {
                throw std::invalid_argument("RecordReader requires a factory for non default-constructible records");
            }
        }
        line_buf_.reserve(ROW_BUFFER_RESERVE);
    }

    template<typename R>
    RecordReader<R>::~RecordReader() {
        close();
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    template<typename R>
    void RecordReader<R>::close() {
        open_ = false;
        is_ = nullptr;
        lines_ = LineReader();
        text_.clear();
        pending_.reset();
        header_.clear();
        binding_ = HeaderBinding<R>();
    }

    template<typename R>
    void RecordReader<R>::open(std::string text) {
        if (open_) {
            throw std::logic_error("RecordReader is already open");
        }
        text_ = std::move(text);
        lines_ = LineReader(std::string_view(text_));
        readHeader();
    }

    template<typename R>
    void RecordReader<R>::open(std::istream& is) {
        if (open_) {
            throw std::logic_error("RecordReader is already open");
        }
        is_ = &is;
        lines_ = LineReader(is);
        readHeader();
    }

    /// Read the first line: header, or first data line of header-less input
    template<typename R>
    void RecordReader<R>::readHeader() {
        row_pos_ = 0;
        file_line_ = 0;
        record_.reset();

        std::string first;
        if (!lines_.readRecord(first)) {
            close();
            throw EmptyInputError();
        }
        file_line_ = lines_.lineNumber();

        // Strip UTF-8 BOM
        if (first.size() >= 3 && first.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            first.erase(0, 3);
        }

        if (!options_.includeHeader) {
            binding_ = HeaderBinding<R>::positional(schema_);
            pending_ = std::move(first);
            open_ = true;
            return;
        }

        header_ = parseLine(first, delimiter_);
        binding_ = HeaderBinding<R>::fromHeader(schema_, header_, options_);
        if (!binding_.missingColumns().empty()) {
            std::vector<std::string> missing = binding_.missingColumns();
            close();
            throw MissingHeaderError(std::move(missing));
        }
        open_ = true;
    }

    // ── Reading ─────────────────────────────────────────────────────────

    template<typename R>
    bool RecordReader<R>::readNext() {
        if (!open_) {
            return false;
        }

        while (true) {
            if (pending_) {
                line_buf_ = std::move(*pending_);
                pending_.reset();
            } else if (!lines_.readRecord(line_buf_)) {
                return false;
            } else {
                file_line_ = lines_.lineNumber();
            }

            if (isBlankLine(line_buf_)) {
                continue;
            }

            std::vector<std::string> cells = parseLine(line_buf_, delimiter_);
            if constexpr (DEBUG_OUTPUTS) {
                if (cells.size() != binding_.columnCount()) {
                    std::cerr << "Warning: CSV line " << file_line_ << " has " << cells.size()
                              << " cells, expected " << binding_.columnCount() << std::endl;
                }
            }

            try {
                record_.emplace(factory_());
                binding_.apply(schema_, cells, *record_, options_);
            } catch (const std::exception&) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "Error: Failed to read record at CSV line " << file_line_
                              << " (data row " << row_pos_ << ")" << std::endl;
                }
                close();
                throw;
            }

            row_pos_++;
            return true;
        }
    }

    // ── RecordSequence ──────────────────────────────────────────────────

    template<typename R>
    void RecordSequence<R>::advance() {
        has_current_ = false;
        has_current_ = reader_->readNext();
    }

    template<typename R>
    typename RecordSequence<R>::iterator RecordSequence<R>::begin() {
        if (!started_) {
            started_ = true;
            advance();
        }
        return iterator(this);
    }

    template<typename R>
    std::vector<R> RecordSequence<R>::toVector() {
        std::vector<R> records;
        for (auto it = begin(); it != end(); ++it) {
            records.push_back(*it);
        }
        return records;
    }

    // ── deserialize() ───────────────────────────────────────────────────

    template<typename R>
    RecordSequence<R> deserialize(std::string text, const SerializerOptions& options,
                                  typename RecordReader<R>::Factory factory) {
        auto reader = std::make_unique<RecordReader<R>>(options, std::move(factory));
        reader->open(std::move(text));
        return RecordSequence<R>(std::move(reader));
    }

    template<typename R>
    RecordSequence<R> deserialize(std::istream& is, const SerializerOptions& options,
                                  typename RecordReader<R>::Factory factory) {
        auto reader = std::make_unique<RecordReader<R>>(options, std::move(factory));
        reader->open(is);
        return RecordSequence<R>(std::move(reader));
    }

} // namespace rcsv
