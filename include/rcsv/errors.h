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
 * @file errors.h
 * @brief Exception types raised by serialize() and deserialize().
 *
 * Every failure aborts the whole operation. Nothing is retried and no row is
 * skipped.  ConversionError is thrown through std::throw_with_nested, so the
 * parse failure that caused it can be recovered with std::rethrow_if_nested.
 */

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rcsv {

    /// Common base of all RCSV errors
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}
    };

    /// Invalid record schema (duplicate column names, unsupported field kinds)
    class SchemaError : public Error {
    public:
        explicit SchemaError(const std::string& message) : Error(message) {}
    };

    /// A field's kind lies outside the supported closed set
    class UnsupportedTypeError : public SchemaError {
        std::string field_name_;
        std::string type_name_;

    public:
        UnsupportedTypeError(std::string fieldName, std::string typeName)
            : SchemaError("Property '" + fieldName + "' of type '" + typeName +
                          "' is not supported. Only primitive types, string, DateTime, enums, "
                          "nullable values and maps of those are supported.")
            , field_name_(std::move(fieldName))
            , type_name_(std::move(typeName))
        {}

        const std::string&  fieldName() const   { return field_name_; }
        const std::string&  typeName() const    { return type_name_; }
    };

    /// deserialize() was given input without a single line
    class EmptyInputError : public Error {
    public:
        EmptyInputError() : Error("CSV data is empty.") {}
    };

    /// Required scalar columns are absent from the header line
    class MissingHeaderError : public Error {
        std::vector<std::string> missing_;

        static std::string join(const std::vector<std::string>& names) {
            std::string joined;
            for (size_t i = 0; i < names.size(); ++i) {
                if (i > 0) joined += ", ";
                joined += names[i];
            }
            return joined;
        }

    public:
        explicit MissingHeaderError(std::vector<std::string> missing)
            : Error("Missing CSV headers: " + join(missing))
            , missing_(std::move(missing))
        {}

        const std::vector<std::string>& missingColumns() const { return missing_; }
    };

    /// A single cell could not be converted to its field's kind
    class ConversionError : public Error {
        std::string text_;
        std::string target_kind_;
        std::string field_name_;

    public:
        ConversionError(std::string text, std::string targetKind, std::string fieldName = {})
            : Error("Failed to convert field '" + text + "' to type " + targetKind +
                    (fieldName.empty() ? std::string() : " for property " + fieldName))
            , text_(std::move(text))
            , target_kind_(std::move(targetKind))
            , field_name_(std::move(fieldName))
        {}

        const std::string&  text() const        { return text_; }
        const std::string&  targetKind() const  { return target_kind_; }
        const std::string&  fieldName() const   { return field_name_; }
    };

} // namespace rcsv
