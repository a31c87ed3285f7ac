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
 * @file tokenizer.h
 * @brief CSV line grammar: field splitting, RFC 4180 style escaping, row joining,
 *        and a line reader over strings or streams.
 *
 * Grammar of one line:
 *   - A field is unquoted or enclosed in double quotes.
 *   - Inside quotes, "" is a literal quote and the delimiter has no meaning.
 *   - A delimiter outside quotes ends the current field.
 *   - End of line ends the final field. An empty line is one empty field.
 *   - Malformed quoting (e.g. an unterminated quote) is taken literally up to
 *     the end of the line. parseLine() never fails.
 */

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace rcsv {

    std::vector<std::string>    parseLine(std::string_view line, char delimiter);
    std::vector<std::string>    parseLine(std::string_view line, std::string_view delimiter);

    std::string                 escapeField(std::string_view value, char delimiter);
    bool                        needsQuoting(std::string_view value, char delimiter);

    /// Append already escaped fields joined by `delimiter`, followed by CRLF.
    /// A single blank field is quoted so the row is not a blank line.
    void                        appendRow(std::string& out, const std::vector<std::string>& escapedFields, char delimiter);

    bool                        isBlankLine(std::string_view line);

    /**
     * @brief Splits text into lines. A line ends at "\r\n", "\n" or "\r".
     *
     * Reads from a borrowed string_view or std::istream; the source must
     * outlive the reader. readRecord() joins physical lines while a quoted
     * field is still open, so quoted line breaks survive as "\n".
     */
    class LineReader {
        std::string_view        text_;
        size_t                  pos_ = 0;
        std::istream*           is_ = nullptr;
        size_t                  line_no_ = 0;   // physical lines consumed

        bool                    readPhysical(std::string& line);

    public:
        LineReader() = default;
        explicit LineReader(std::string_view text) : text_(text) {}
        explicit LineReader(std::istream& is) : is_(&is) {}

        bool                    readLine(std::string& line);
        bool                    readRecord(std::string& line);
        size_t                  lineNumber() const              { return line_no_; }
    };

} // namespace rcsv
