/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file deserializer_test.cpp
 * @brief Tests for RecordReader, RecordSequence and deserialize()
 */

#include <gtest/gtest.h>
#include <cmath>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>

#include "test_records.h"

using rcsv_test::Person;
using rcsv_test::PersonJa;

class DeserializerTest : public ::testing::Test {
protected:
    const std::string basic_ =
        "Name,Age,BirthDate\r\n"
        "田中太郎,30,1993-05-15 00:00:00\r\n"
        "山田花子,25,1998-08-20 00:00:00\r\n";

    const std::vector<Person> expected_ = {
        {"田中太郎", 30, rcsv::DateTime(1993, 5, 15)},
        {"山田花子", 25, rcsv::DateTime(1998, 8, 20)},
    };
};

// ============================================================================
// Basic input
// ============================================================================

TEST_F(DeserializerTest, ReadsRecords) {
    EXPECT_EQ(rcsv::deserialize<Person>(basic_).toVector(), expected_);
}

TEST_F(DeserializerTest, ColumnOverridesAndOptions) {
    rcsv::SerializerOptions options;
    options.delimiter = ";";
    options.dateTimeFormat = "yyyy/MM/dd";
    auto rows = rcsv::deserialize<PersonJa>("名前;年齢;生年月日\r\n田中太郎;30;1993/05/15\r\n", options).toVector();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].name, "田中太郎");
    EXPECT_EQ(rows[0].age, 30);
    EXPECT_EQ(rows[0].birthDate, rcsv::DateTime(1993, 5, 15));
}

TEST_F(DeserializerTest, HeaderColumnOrderIsFree) {
    auto rows = rcsv::deserialize<Person>("BirthDate,Age,Name\n1993-05-15 00:00:00,30,田中太郎\n").toVector();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], expected_[0]);
}

TEST_F(DeserializerTest, SkipsBlankLines) {
    auto rows = rcsv::deserialize<Person>(
        "Name,Age,BirthDate\r\n"
        "\r\n"
        "田中太郎,30,1993-05-15 00:00:00\r\n"
        "   \r\n"
        "\t\r\n"
        "山田花子,25,1998-08-20 00:00:00\r\n"
        "\r\n").toVector();
    EXPECT_EQ(rows, expected_);
}

TEST_F(DeserializerTest, AcceptsAnyLineEnding) {
    EXPECT_EQ(rcsv::deserialize<Person>(
        "Name,Age,BirthDate\n田中太郎,30,1993-05-15 00:00:00\n山田花子,25,1998-08-20 00:00:00").toVector(), expected_);
    EXPECT_EQ(rcsv::deserialize<Person>(
        "Name,Age,BirthDate\r田中太郎,30,1993-05-15 00:00:00\r山田花子,25,1998-08-20 00:00:00\r").toVector(), expected_);
}

TEST_F(DeserializerTest, StripsByteOrderMark) {
    EXPECT_EQ(rcsv::deserialize<Person>("\xEF\xBB\xBF" + basic_).toVector(), expected_);
}

TEST_F(DeserializerTest, QuotedFieldsSpanLines) {
    auto rows = rcsv::deserialize<Person>(
        "Name,Age,BirthDate\r\n"
        "\"田中,\"\"太郎\"\"\r\nsecond line\",30,1993-05-15 00:00:00\r\n").toVector();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].name, "田中,\"太郎\"\nsecond line");
    EXPECT_EQ(rows[0].age, 30);
}

TEST_F(DeserializerTest, ShortRowsKeepDefaultsAndExtraCellsAreIgnored) {
    auto rows = rcsv::deserialize<Person>(
        "Name,Age,BirthDate\n"
        "A\n"
        "B,5,2000-01-02 00:00:00,extra,more\n").toVector();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].name, "A");
    EXPECT_EQ(rows[0].age, 0);
    EXPECT_EQ(rows[0].birthDate, rcsv::DateTime());
    EXPECT_EQ(rows[1].age, 5);
    EXPECT_EQ(rows[1].birthDate, rcsv::DateTime(2000, 1, 2));
}

TEST_F(DeserializerTest, HeaderOnlyInputYieldsNothing) {
    EXPECT_TRUE(rcsv::deserialize<Person>("Name,Age,BirthDate\r\n").toVector().empty());
}

TEST_F(DeserializerTest, HeaderlessInputIsPositional) {
    rcsv::SerializerOptions options;
    options.includeHeader = false;
    options.delimiter = ";";
    options.dateTimeFormat = "yyyy/MM/dd";
    auto rows = rcsv::deserialize<Person>("田中太郎;30;1993/05/15\r\n山田花子;25;1998/08/20\r\n", options).toVector();
    EXPECT_EQ(rows, expected_);
}

TEST_F(DeserializerTest, ReadsFromStream) {
    std::istringstream in(basic_);
    EXPECT_EQ(rcsv::deserialize<Person>(in).toVector(), expected_);
}

// ============================================================================
// Field values
// ============================================================================

TEST_F(DeserializerTest, EmptyCellsOfNullableAndPlainFields) {
    auto rows = rcsv::deserialize<rcsv_test::AllKinds>(
        "Text,I32,I64,F32,F64,Amount,Flag,When,Letter,Color,Grade,MaybeInt,MaybeDouble,MaybeColor,MaybeText\n"
        ",,,,,,,,,,,,,,\n"
        "t,1,2,0.5,NaN,3.25,false,2024-03-07 00:00:00,q,Green,B,-4,Infinity,Blue,txt\n").toVector();
    ASSERT_EQ(rows.size(), 2u);

    // Empty cells give the zero value of the kind, not the member initializer
    const rcsv_test::AllKinds& empty = rows[0];
    EXPECT_EQ(empty.text, "");
    EXPECT_EQ(empty.i32, 0);
    EXPECT_EQ(empty.amount, rcsv::Decimal());
    EXPECT_EQ(empty.when, rcsv::DateTime());
    EXPECT_EQ(empty.letter, '\0');
    EXPECT_EQ(static_cast<int32_t>(empty.color), 0);
    EXPECT_EQ(static_cast<int64_t>(empty.grade), 0);
    EXPECT_FALSE(empty.maybeInt.has_value());
    EXPECT_FALSE(empty.maybeColor.has_value());
    EXPECT_FALSE(empty.maybeText.has_value());

    const rcsv_test::AllKinds& full = rows[1];
    EXPECT_EQ(full.text, "t");
    EXPECT_EQ(full.i64, 2);
    EXPECT_FLOAT_EQ(full.f32, 0.5f);
    EXPECT_TRUE(std::isnan(full.f64));
    EXPECT_EQ(full.amount, rcsv::Decimal(325, 2));
    EXPECT_FALSE(full.flag);
    EXPECT_EQ(full.letter, 'q');
    EXPECT_EQ(full.color, rcsv_test::Color::Green);
    EXPECT_EQ(full.grade, rcsv_test::GRADE_B);
    EXPECT_EQ(full.maybeInt, -4);
    EXPECT_TRUE(std::isinf(*full.maybeDouble));
    EXPECT_EQ(full.maybeColor, rcsv_test::Color::Blue);
    EXPECT_EQ(full.maybeText, "txt");
}

TEST_F(DeserializerTest, CultureDecimalSeparator) {
    struct Money {
        double          rate = 0.0;
        rcsv::Decimal   amount;

        static rcsv::FieldList<Money> describeSchema() {
            return {
                rcsv::field("Rate", &Money::rate),
                rcsv::field("Amount", &Money::amount),
            };
        }
    };

    rcsv::SerializerOptions options;
    options.delimiter = ";";
    options.culture = rcsv::Culture::byName("de-DE");
    auto rows = rcsv::deserialize<Money>("Rate;Amount\n2,5;-1,75\n", options).toVector();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].rate, 2.5);
    EXPECT_EQ(rows[0].amount, rcsv::Decimal(-175, 2));

    EXPECT_THROW(rcsv::deserialize<Money>("Rate;Amount\n2.5;1\n", options).toVector(), rcsv::ConversionError);
}

TEST_F(DeserializerTest, RebuildsMaps) {
    auto rows = rcsv::deserialize<rcsv_test::Scores>("Name,Math,Lit\nA,85,90\nB,,70\nC,,\n").toVector();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].scores, (rcsv::OrderedMap<std::string, int32_t>{{"Math", 85}, {"Lit", 90}}));
    EXPECT_EQ(rows[1].scores, (rcsv::OrderedMap<std::string, int32_t>{{"Lit", 70}}));
    EXPECT_TRUE(rows[2].scores.empty());
}

TEST_F(DeserializerTest, EnumKeyedMapWithNullableValues) {
    auto rows = rcsv::deserialize<rcsv_test::ColorCounts>("Name,Red,Blue\nx,3,\n").toVector();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].counts.size(), 1u);
    EXPECT_EQ(rows[0].counts.at(rcsv_test::Color::Red), 3);
}

// ============================================================================
// Factories
// ============================================================================

TEST_F(DeserializerTest, FactoryCreatesEachRecord) {
    int created = 0;
    auto factory = [&created] { ++created; return rcsv_test::Tagged("factory"); };
    auto rows = rcsv::deserialize<rcsv_test::Tagged>("Value\na\nb\n", {}, factory).toVector();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(created, 2);
    EXPECT_EQ(rows[1].source, "factory");
    EXPECT_EQ(rows[1].value, "b");
}

TEST_F(DeserializerTest, NonDefaultConstructibleNeedsFactory) {
    EXPECT_THROW(rcsv::RecordReader<rcsv_test::Tagged> reader, std::invalid_argument);
}

// ============================================================================
// RecordReader
// ============================================================================

TEST_F(DeserializerTest, ReaderTracksPositions) {
    rcsv::RecordReader<Person> reader;
    reader.open("Name,Age,BirthDate\n\nA,1,2000-01-01 00:00:00\n\"B\nB\",2,2000-01-01 00:00:00\nC,3,2000-01-01 00:00:00\n");
    EXPECT_TRUE(reader.isOpen());
    EXPECT_EQ(reader.header(), (std::vector<std::string>{"Name", "Age", "BirthDate"}));

    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record().name, "A");
    EXPECT_EQ(reader.rowPos(), 1u);
    EXPECT_EQ(reader.fileLine(), 3u);

    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record().name, "B\nB");
    EXPECT_EQ(reader.fileLine(), 5u);

    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.rowPos(), 3u);
    EXPECT_EQ(reader.fileLine(), 6u);

    EXPECT_FALSE(reader.readNext());
    reader.close();
    EXPECT_FALSE(reader.isOpen());
    EXPECT_FALSE(reader.readNext());
}

TEST_F(DeserializerTest, ReaderCanBeReopened) {
    rcsv::RecordReader<Person> reader;
    reader.open(basic_);
    EXPECT_THROW(reader.open(basic_), std::logic_error);
    reader.close();
    reader.open("Name,Age,BirthDate\nZ,9,2000-01-01 00:00:00\n");
    ASSERT_TRUE(reader.readNext());
    EXPECT_EQ(reader.record().name, "Z");
    EXPECT_EQ(reader.rowPos(), 1u);
}

// ============================================================================
// Lazy sequence
// ============================================================================

TEST_F(DeserializerTest, SequenceIsLazy) {
    // The bad second row only fails once iteration reaches it
    auto seq = rcsv::deserialize<Person>("Name,Age,BirthDate\nA,1,2000-01-01 00:00:00\nB,x,2000-01-01 00:00:00\n");
    auto it = seq.begin();
    ASSERT_TRUE(it != seq.end());
    EXPECT_EQ(it->name, "A");
    EXPECT_EQ(seq.reader().rowPos(), 1u);
    EXPECT_THROW(++it, rcsv::ConversionError);
}

TEST_F(DeserializerTest, RangeForOverSequence) {
    std::vector<std::string> names;
    for (const Person& p : rcsv::deserialize<Person>(basic_)) {
        names.push_back(p.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"田中太郎", "山田花子"}));
}

TEST_F(DeserializerTest, SequenceEndComparisons) {
    rcsv::RecordSequence<Person>::iterator unbound;
    EXPECT_TRUE(unbound == std::default_sentinel);
    EXPECT_TRUE(unbound.atEnd());

    auto empty = rcsv::deserialize<Person>("Name,Age,BirthDate\n");
    EXPECT_TRUE(empty.begin() == empty.end());

    auto seq = rcsv::deserialize<Person>(basic_);
    auto it = seq.begin();
    EXPECT_FALSE(it == std::default_sentinel);
    ++it;
    EXPECT_FALSE(it.atEnd());
    ++it;
    EXPECT_TRUE(it == seq.end());
}
