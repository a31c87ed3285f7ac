/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file error_handling_test.cpp
 * @brief Error reporting of serialize() and deserialize()
 */

#include <gtest/gtest.h>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>

#include "test_records.h"

using rcsv_test::Person;
using rcsv_test::PersonJa;

// ============================================================================
// Input shape
// ============================================================================

TEST(ErrorHandlingTest, EmptyInput) {
    try {
        rcsv::deserialize<Person>("");
        FAIL() << "expected EmptyInputError";
    } catch (const rcsv::EmptyInputError& e) {
        EXPECT_STREQ(e.what(), "CSV data is empty.");
    }

    std::istringstream in;
    EXPECT_THROW(rcsv::deserialize<Person>(in), rcsv::EmptyInputError);
}

TEST(ErrorHandlingTest, MissingHeaderColumns) {
    try {
        rcsv::deserialize<PersonJa>("名前,年齢\n田中太郎,30\n");
        FAIL() << "expected MissingHeaderError";
    } catch (const rcsv::MissingHeaderError& e) {
        EXPECT_STREQ(e.what(), "Missing CSV headers: 生年月日");
        EXPECT_EQ(e.missingColumns(), (std::vector<std::string>{"生年月日"}));
    }
}

TEST(ErrorHandlingTest, MissingHeadersListedInSchemaOrder) {
    try {
        rcsv::deserialize<Person>("Age\n1\n");
        FAIL() << "expected MissingHeaderError";
    } catch (const rcsv::MissingHeaderError& e) {
        EXPECT_STREQ(e.what(), "Missing CSV headers: Name, BirthDate");
    }
}

TEST(ErrorHandlingTest, HeaderNamesAreCaseSensitive) {
    EXPECT_THROW(rcsv::deserialize<Person>("name,age,birthdate\n"), rcsv::MissingHeaderError);
}

TEST(ErrorHandlingTest, FailedOpenLeavesReaderClosed) {
    rcsv::RecordReader<Person> reader;
    EXPECT_THROW(reader.open("Name\nA\n"), rcsv::MissingHeaderError);
    EXPECT_FALSE(reader.isOpen());
    EXPECT_NO_THROW(reader.open("Name,Age,BirthDate\n"));
}

// ============================================================================
// Conversion failures
// ============================================================================

TEST(ErrorHandlingTest, ConversionErrorCarriesCellAndCause) {
    auto seq = rcsv::deserialize<Person>("Name,Age,BirthDate\nA,abc,2000-01-01 00:00:00\n");
    try {
        seq.toVector();
        FAIL() << "expected ConversionError";
    } catch (const rcsv::ConversionError& e) {
        EXPECT_EQ(e.text(), "abc");
        EXPECT_EQ(e.fieldName(), "Age");
        EXPECT_NE(std::string(e.what()).find("abc"), std::string::npos);

        bool hasCause = false;
        try {
            std::rethrow_if_nested(e);
        } catch (const std::invalid_argument& cause) {
            hasCause = true;
            EXPECT_STREQ(cause.what(), "Input string was not in a correct format.");
        }
        EXPECT_TRUE(hasCause);
    }
}

TEST(ErrorHandlingTest, ConversionErrorEndsIteration) {
    auto seq = rcsv::deserialize<Person>(
        "Name,Age,BirthDate\n"
        "A,1,2000-01-01 00:00:00\n"
        "B,2,not a date\n"
        "C,3,2000-01-01 00:00:00\n");

    std::vector<std::string> names;
    EXPECT_THROW({
        for (const Person& p : seq) {
            names.push_back(p.name);
        }
    }, rcsv::ConversionError);
    EXPECT_EQ(names, (std::vector<std::string>{"A"}));
    EXPECT_FALSE(seq.reader().isOpen());
    EXPECT_FALSE(seq.reader().readNext());
}

TEST(ErrorHandlingTest, IntegerOverflowIsConversionError) {
    EXPECT_THROW(rcsv::deserialize<Person>("Name,Age,BirthDate\nA,2147483648,\n").toVector(), rcsv::ConversionError);
}

TEST(ErrorHandlingTest, UnknownEnumNameIsConversionError) {
    struct Paint {
        rcsv_test::Color color = rcsv_test::Color::Red;

        static rcsv::FieldList<Paint> describeSchema() {
            return {rcsv::field("Color", &Paint::color)};
        }
    };
    EXPECT_THROW(rcsv::deserialize<Paint>("Color\nPurple\n").toVector(), rcsv::ConversionError);
    EXPECT_THROW(rcsv::deserialize<Paint>("Color\nred\n").toVector(), rcsv::ConversionError);
    EXPECT_THROW(rcsv::deserialize<Paint>("Color\n4\n").toVector(), rcsv::ConversionError);
}

TEST(ErrorHandlingTest, BadMapHeaderFailsOnlyForNonEmptyCells) {
    struct Channels {
        std::string                         id;
        rcsv::OrderedMap<int32_t, double>   values;

        static rcsv::FieldList<Channels> describeSchema() {
            return {
                rcsv::field("Id", &Channels::id),
                rcsv::field("Values", &Channels::values),
            };
        }
    };

    EXPECT_EQ(rcsv::deserialize<Channels>("Id,1,oops\na,0.5,\n").toVector().size(), 1u);

    try {
        rcsv::deserialize<Channels>("Id,1,oops\na,0.5,\nb,1.5,2.5\n").toVector();
        FAIL() << "expected ConversionError";
    } catch (const rcsv::ConversionError& e) {
        EXPECT_EQ(e.text(), "oops");
    }
}

// ============================================================================
// Schema and options
// ============================================================================

TEST(ErrorHandlingTest, UnsupportedFieldOnBothDirections) {
    std::vector<rcsv_test::WithTags> rows(1);
    EXPECT_THROW(rcsv::serialize(rows), rcsv::UnsupportedTypeError);
    EXPECT_THROW(rcsv::deserialize<rcsv_test::WithTags>("Name\nA\n"), rcsv::UnsupportedTypeError);
    // Raised before any input is read
    EXPECT_THROW(rcsv::deserialize<rcsv_test::WithTags>(""), rcsv::UnsupportedTypeError);
}

TEST(ErrorHandlingTest, UnsupportedTypeErrorIsSchemaError) {
    EXPECT_THROW(rcsv::RecordWriter<rcsv_test::WithAddress> writer, rcsv::SchemaError);
    EXPECT_THROW(rcsv::RecordWriter<rcsv_test::DuplicateColumns> writer, rcsv::SchemaError);
}

TEST(ErrorHandlingTest, EmptyDelimiterIsRejected) {
    rcsv::SerializerOptions options;
    options.delimiter = "";
    std::vector<Person> rows(1);
    EXPECT_THROW(rcsv::serialize(rows, options), std::invalid_argument);
    EXPECT_THROW(rcsv::deserialize<Person>("Name,Age,BirthDate\n", options), std::invalid_argument);
}

TEST(ErrorHandlingTest, AllErrorsDeriveFromError) {
    EXPECT_THROW(rcsv::deserialize<Person>(""), rcsv::Error);
    EXPECT_THROW(rcsv::deserialize<Person>("Name\n"), rcsv::Error);
    EXPECT_THROW(rcsv::deserialize<Person>("Name,Age,BirthDate\nA,x,\n").toVector(), rcsv::Error);
    EXPECT_THROW(rcsv::Schema<rcsv_test::NestedMap>::resolve(), rcsv::Error);
}
