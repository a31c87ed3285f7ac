/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file serializer_test.cpp
 * @brief Tests for RecordWriter and serialize()
 */

#include <gtest/gtest.h>
#include <list>
#include <sstream>
#include <string>
#include <vector>

#include <rcsv/rcsv.h>

#include "test_records.h"

using rcsv_test::Person;
using rcsv_test::PersonJa;

class SerializerTest : public ::testing::Test {
protected:
    std::vector<Person> people_ = {
        {"田中太郎", 30, rcsv::DateTime(1993, 5, 15)},
        {"山田花子", 25, rcsv::DateTime(1998, 8, 20)},
    };

    static rcsv::SerializerOptions semicolonOptions(bool includeHeader) {
        rcsv::SerializerOptions options;
        options.delimiter = ";";
        options.includeHeader = includeHeader;
        options.dateTimeFormat = "yyyy/MM/dd";
        return options;
    }
};

// ============================================================================
// Basic output
// ============================================================================

TEST_F(SerializerTest, HeaderAndRows) {
    EXPECT_EQ(rcsv::serialize(people_),
              "Name,Age,BirthDate\r\n"
              "田中太郎,30,1993-05-15 00:00:00\r\n"
              "山田花子,25,1998-08-20 00:00:00\r\n");
}

TEST_F(SerializerTest, DelimiterFormatWithoutHeader) {
    std::vector<Person> one = {people_[0]};
    EXPECT_EQ(rcsv::serialize(one, semicolonOptions(false)), "田中太郎;30;1993/05/15\r\n");
}

TEST_F(SerializerTest, OnlyFirstDelimiterCharacterIsUsed) {
    rcsv::SerializerOptions options;
    options.delimiter = "|;";
    options.includeHeader = false;
    std::vector<Person> one = {people_[0]};
    EXPECT_EQ(rcsv::serialize(one, options), "田中太郎|30|1993-05-15 00:00:00\r\n");
}

TEST_F(SerializerTest, QuotesSpecialCharacters) {
    rcsv::SerializerOptions options;
    options.includeHeader = false;
    std::vector<Person> rows = {
        {"田中,太郎", 30, rcsv::DateTime(1993, 5, 15)},
        {"say \"hi\"", 1, rcsv::DateTime(2000, 1, 1)},
        {"two\nlines", 2, rcsv::DateTime(2000, 1, 1)},
    };
    EXPECT_EQ(rcsv::serialize(rows, options),
              "\"田中,太郎\",30,1993-05-15 00:00:00\r\n"
              "\"say \"\"hi\"\"\",1,2000-01-01 00:00:00\r\n"
              "\"two\nlines\",2,2000-01-01 00:00:00\r\n");
}

TEST_F(SerializerTest, ColumnOverridesInHeader) {
    std::vector<PersonJa> rows = {{"田中太郎", 30, rcsv::DateTime(1993, 5, 15)}};
    EXPECT_EQ(rcsv::serialize(rows), "名前,年齢,生年月日\r\n田中太郎,30,1993-05-15 00:00:00\r\n");
    EXPECT_EQ(rcsv::serialize(rows, semicolonOptions(true)), "名前;年齢;生年月日\r\n田中太郎;30;1993/05/15\r\n");
}

TEST_F(SerializerTest, EmptyCollection) {
    std::vector<Person> none;
    EXPECT_EQ(rcsv::serialize(none), "Name,Age,BirthDate\r\n");
    EXPECT_EQ(rcsv::serialize(none, semicolonOptions(false)), "");
}

TEST_F(SerializerTest, StreamOverload) {
    std::ostringstream os;
    rcsv::serialize(people_, os, semicolonOptions(true));
    EXPECT_EQ(os.str(), "Name;Age;BirthDate\r\n田中太郎;30;1993/05/15\r\n山田花子;25;1998/08/20\r\n");
}

TEST_F(SerializerTest, AcceptsNonContiguousAndSinglePassRanges) {
    std::list<Person> list(people_.begin(), people_.end());
    const std::string expected = rcsv::serialize(people_);
    EXPECT_EQ(rcsv::serialize(list), expected);

    std::istringstream in("Name,Age,BirthDate\r\n田中太郎,30,1993-05-15 00:00:00\r\n山田花子,25,1998-08-20 00:00:00\r\n");
    EXPECT_EQ(rcsv::serialize(rcsv::deserialize<Person>(in)), expected);
}

// ============================================================================
// Scalar kinds
// ============================================================================

TEST_F(SerializerTest, AllScalarKinds) {
    rcsv_test::AllKinds rec;
    rec.text = "abc";
    rec.i32 = -7;
    rec.i64 = 9000000000LL;
    rec.f32 = 1.5f;
    rec.f64 = 0.25;
    rec.amount = rcsv::Decimal(150, 2);
    rec.flag = true;
    rec.when = rcsv::DateTime(2024, 3, 7, 14, 5, 9);
    rec.letter = 'x';
    rec.color = rcsv_test::Color::Blue;
    rec.grade = rcsv_test::GRADE_B;
    rec.maybeInt = 42;

    std::vector<rcsv_test::AllKinds> rows = {rec};
    EXPECT_EQ(rcsv::serialize(rows),
              "Text,I32,I64,F32,F64,Amount,Flag,When,Letter,Color,Grade,MaybeInt,MaybeDouble,MaybeColor,MaybeText\r\n"
              "abc,-7,9000000000,1.5,0.25,1.50,True,2024-03-07 14:05:09,x,Blue,B,42,,,\r\n");
}

TEST_F(SerializerTest, CultureDecimalSeparator) {
    rcsv_test::AllKinds rec;
    rec.f64 = 2.5;
    rec.amount = rcsv::Decimal(1234, 1);
    rec.maybeDouble = -0.5;

    rcsv::SerializerOptions options;
    options.delimiter = ";";
    options.includeHeader = false;
    options.culture = rcsv::Culture::byName("de-DE");

    std::vector<rcsv_test::AllKinds> rows = {rec};
    EXPECT_EQ(rcsv::serialize(rows, options),
              ";0;0;0;2,5;123,4;False;0001-01-01 00:00:00;;Red;A;;-0,5;;\r\n");
}

TEST_F(SerializerTest, CultureSeparatorMatchingDelimiterIsQuoted) {
    rcsv_test::AllKinds rec;
    rec.f64 = 2.5;

    rcsv::SerializerOptions options;
    options.includeHeader = false;
    options.culture = rcsv::Culture::byName("de-DE");

    std::vector<rcsv_test::AllKinds> rows = {rec};
    const std::string csv = rcsv::serialize(rows, options);
    EXPECT_NE(csv.find(",\"2,5\","), std::string::npos);
}

TEST_F(SerializerTest, EnumWithoutMemberWritesNumber) {
    rcsv_test::AllKinds rec;
    rec.color = static_cast<rcsv_test::Color>(3);
    std::vector<rcsv_test::AllKinds> rows = {rec};
    rcsv::SerializerOptions options;
    options.includeHeader = false;
    const std::string csv = rcsv::serialize(rows, options);
    EXPECT_NE(csv.find(",3,A,"), std::string::npos);
}

// ============================================================================
// Map fields
// ============================================================================

TEST_F(SerializerTest, MapKeysBecomeColumns) {
    std::vector<rcsv_test::Scores> rows = {
        {"A", {{"Math", 85}, {"Lit", 90}}},
        {"B", {{"Art", 70}, {"Math", 60}}},
    };
    EXPECT_EQ(rcsv::serialize(rows),
              "Name,Math,Lit,Art\r\n"
              "A,85,90,\r\n"
              "B,60,,70\r\n");
}

TEST_F(SerializerTest, SortedMapColumnsFollowKeyOrder) {
    std::vector<rcsv_test::SortedScores> rows = {{"A", {{"Math", 85}, {"Lit", 90}}}};
    EXPECT_EQ(rcsv::serialize(rows), "Name,Lit,Math\r\nA,90,85\r\n");
}

TEST_F(SerializerTest, MultipleMapFieldsInDeclarationOrder) {
    std::vector<rcsv_test::Sensor> rows = {
        {"s1", {{1, 0.5}}, {{"unit", "mV"}}},
        {"s2", {{2, 1.25}}, {}},
    };
    EXPECT_EQ(rcsv::serialize(rows),
              "Id,1,2,unit\r\n"
              "s1,0.5,,mV\r\n"
              "s2,,1.25,\r\n");
}

// ============================================================================
// RecordWriter
// ============================================================================

TEST_F(SerializerTest, WriterCountsRows) {
    rcsv::RecordWriter<Person> writer;
    std::string out;
    for (const auto& p : people_) {
        writer.collect(p);
    }
    writer.open(out);
    EXPECT_TRUE(writer.isOpen());
    writer.writeHeader();
    for (const auto& p : people_) {
        writer.write(p);
    }
    writer.close();
    EXPECT_FALSE(writer.isOpen());
    EXPECT_EQ(writer.rowCount(), 2u);
    EXPECT_EQ(out, rcsv::serialize(people_));
}

TEST_F(SerializerTest, WriterRequiresOpen) {
    rcsv::RecordWriter<Person> writer;
    EXPECT_THROW(writer.write(people_[0]), std::logic_error);

    std::string out;
    writer.open(out);
    EXPECT_THROW(writer.open(out), std::logic_error);
}

TEST_F(SerializerTest, WriterReportsStreamFailure) {
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    rcsv::RecordWriter<Person> writer;
    writer.open(os);
    EXPECT_THROW(writer.writeHeader(), rcsv::Error);
}
