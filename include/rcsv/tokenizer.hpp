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
 * @file tokenizer.hpp
 * @brief Tokenizer implementations.
 */

#include "tokenizer.h"
#include <algorithm>
#include <stdexcept>

namespace rcsv {

    // ── Field splitting ─────────────────────────────────────────────────

    inline std::vector<std::string> parseLine(std::string_view line, char delimiter) {
        std::vector<std::string> fields;
        fields.reserve(static_cast<size_t>(std::count(line.begin(), line.end(), delimiter)) + 1);

        std::string current;
        current.reserve(std::min<size_t>(line.size(), 100));
        bool inQuotes = false;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == QUOTE_CHAR) {
                if (inQuotes && i + 1 < line.size() && line[i + 1] == QUOTE_CHAR) {
                    current.push_back(QUOTE_CHAR);
                    ++i;
                } else {
                    inQuotes = !inQuotes;
                }
            } else if (c == delimiter && !inQuotes) {
                fields.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }

        fields.push_back(std::move(current));
        return fields;
    }

    /// Only the first character of `delimiter` is used
    inline std::vector<std::string> parseLine(std::string_view line, std::string_view delimiter) {
        if (delimiter.empty()) {
            throw std::invalid_argument("Delimiter must not be empty");
        }
        return parseLine(line, delimiter.front());
    }

    // ── Escaping / joining ──────────────────────────────────────────────

    inline bool needsQuoting(std::string_view value, char delimiter) {
        for (char c : value) {
            if (c == delimiter || c == QUOTE_CHAR || c == '\n' || c == '\r') {
                return true;
            }
        }
        return false;
    }

    /// Quote the value when it contains the delimiter, a quote or a line break;
    /// embedded quotes are doubled. Empty input stays empty.
    inline std::string escapeField(std::string_view value, char delimiter) {
        if (value.empty() || !needsQuoting(value, delimiter)) {
            return std::string(value);
        }
        std::string escaped;
        escaped.reserve(value.size() + 2);
        escaped.push_back(QUOTE_CHAR);
        for (char c : value) {
            if (c == QUOTE_CHAR) escaped.push_back(QUOTE_CHAR);
            escaped.push_back(c);
        }
        escaped.push_back(QUOTE_CHAR);
        return escaped;
    }

    inline void appendRow(std::string& out, const std::vector<std::string>& escapedFields, char delimiter) {
        // A lone blank cell would read back as a skipped blank line
        if (escapedFields.size() == 1 && isBlankLine(escapedFields[0])) {
            out.push_back(QUOTE_CHAR);
            out += escapedFields[0];
            out.push_back(QUOTE_CHAR);
            out += ROW_TERMINATOR;
            return;
        }
        for (size_t i = 0; i < escapedFields.size(); ++i) {
            if (i > 0) out.push_back(delimiter);
            out += escapedFields[i];
        }
        out += ROW_TERMINATOR;
    }

    inline bool isBlankLine(std::string_view line) {
        return std::all_of(line.begin(), line.end(), [](char c) {
            return c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r' || c == '\n';
        });
    }

    // ── LineReader ──────────────────────────────────────────────────────

    inline bool LineReader::readPhysical(std::string& line) {
        line.clear();

        if (is_ != nullptr) {
            std::streambuf* buf = is_->rdbuf();
            if (buf == nullptr) {
                return false;
            }
            using Traits = std::istream::traits_type;
            Traits::int_type c = buf->sgetc();
            if (Traits::eq_int_type(c, Traits::eof())) {
                is_->setstate(std::ios::eofbit);
                return false;
            }
            while (!Traits::eq_int_type(c = buf->sbumpc(), Traits::eof())) {
                char ch = Traits::to_char_type(c);
                if (ch == '\n') {
                    break;
                }
                if (ch == '\r') {
                    if (Traits::eq_int_type(buf->sgetc(), Traits::to_int_type('\n'))) {
                        buf->sbumpc();
                    }
                    break;
                }
                line.push_back(ch);
            }
            ++line_no_;
            return true;
        }

        if (pos_ >= text_.size()) {
            return false;
        }
        size_t end = text_.find_first_of("\r\n", pos_);
        if (end == std::string_view::npos) {
            line.assign(text_.substr(pos_));
            pos_ = text_.size();
        } else {
            line.assign(text_.substr(pos_, end - pos_));
            pos_ = end + 1;
            if (text_[end] == '\r' && pos_ < text_.size() && text_[pos_] == '\n') {
                ++pos_;
            }
        }
        ++line_no_;
        return true;
    }

    inline bool LineReader::readLine(std::string& line) {
        return readPhysical(line);
    }

    inline bool LineReader::readRecord(std::string& line) {
        if (!readPhysical(line)) {
            return false;
        }

        // Count quotes to track whether a quoted field is still open
        bool inQuotes = (std::count(line.begin(), line.end(), QUOTE_CHAR) % 2) != 0;
        std::string next;
        while (inQuotes && readPhysical(next)) {
            line.push_back('\n');
            line += next;
            if (std::count(next.begin(), next.end(), QUOTE_CHAR) % 2 != 0) {
                inQuotes = false;
            }
        }
        return true;
    }

} // namespace rcsv
