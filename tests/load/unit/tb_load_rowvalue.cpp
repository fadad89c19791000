// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <limits>
#include <string>

#include "gtest/gtest.h"

#include <arrow/api.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/RowValue.hh"

using namespace std;
using namespace tabxfer;


TEST(RowValue, TemporalText) {
  EXPECT_EQ("1970-01-01", FormatDate(0));
  EXPECT_EQ("1969-12-31", FormatDate(-1));
  EXPECT_EQ("2019-03-04", FormatDate(17959));
  EXPECT_EQ("1900-02-28", FormatDate(-25509));

  EXPECT_EQ("01:02:03", FormatTimeOfDay(3723, 0));
  EXPECT_EQ("01:02:03.040", FormatTimeOfDay(3723040, 3));

  EXPECT_EQ("2019-03-04 05:06:07.250", FormatTimestamp(1551675967250, 3));
  EXPECT_EQ("1969-12-31 23:59:59", FormatTimestamp(-1, 0));
  EXPECT_EQ("1969-12-31 23:59:59.999999", FormatTimestamp(-1, 6));
}

TEST(RowValue, Format) {
  EXPECT_EQ(RowValue("true"),  *FormatRowValue(arrow::BooleanScalar(true)));
  EXPECT_EQ(RowValue("-42"),   *FormatRowValue(arrow::Int32Scalar(-42)));
  EXPECT_EQ(RowValue("200"),   *FormatRowValue(arrow::UInt8Scalar(200)));
  EXPECT_EQ(RowValue("1.5"),   *FormatRowValue(arrow::DoubleScalar(1.5)));
  EXPECT_EQ(RowValue("0.25"),  *FormatRowValue(arrow::FloatScalar(0.25f)));
  EXPECT_EQ(RowValue("hello"), *FormatRowValue(arrow::StringScalar("hello")));
  EXPECT_EQ(RowValue("1.23"),  *FormatRowValue(arrow::Decimal128Scalar(arrow::Decimal128(123), arrow::decimal128(10, 2))));
  EXPECT_EQ(RowValue("2019-03-04"), *FormatRowValue(arrow::Date32Scalar(17959)));
  EXPECT_EQ(RowValue("2019-03-04 05:06:07.250"),
            *FormatRowValue(arrow::TimestampScalar(1551675967250, arrow::timestamp(arrow::TimeUnit::MILLI))));
  EXPECT_EQ(RowValue("01:02:03"),
            *FormatRowValue(arrow::Time32Scalar(3723, arrow::time32(arrow::TimeUnit::SECOND))));

  auto null_value = FormatRowValue(*arrow::MakeNullScalar(arrow::int64()));
  ASSERT_TRUE(null_value.ok());
  EXPECT_TRUE(null_value->is_null);

  auto bad = FormatRowValue(arrow::BinaryScalar("raw"));
  EXPECT_TRUE(IsError(bad.status(), ErrorCode::TypeMismatch));
}

TEST(RowValue, ParseNumbers) {
  auto i = ParseRowValue(RowValue("42"), ColumnSpec("i", LogicalType::INT));
  ASSERT_TRUE(i.ok());
  EXPECT_TRUE((*i)->Equals(arrow::Int32Scalar(42)));

  auto t = ParseRowValue(RowValue("-128"), ColumnSpec("t", LogicalType::TINYINT));
  ASSERT_TRUE(t.ok());
  EXPECT_TRUE((*t)->Equals(arrow::Int8Scalar(-128)));

  auto d = ParseRowValue(RowValue("2.5"), ColumnSpec("d", LogicalType::DOUBLE));
  ASSERT_TRUE(d.ok());
  EXPECT_TRUE((*d)->Equals(arrow::DoubleScalar(2.5)));

  //Integers read fine into floating columns
  auto f = ParseRowValue(RowValue("3"), ColumnSpec("f", LogicalType::FLOAT));
  ASSERT_TRUE(f.ok());
  EXPECT_TRUE((*f)->Equals(arrow::FloatScalar(3.0f)));

  auto b = ParseRowValue(RowValue("False"), ColumnSpec("b", LogicalType::BOOL));
  ASSERT_TRUE(b.ok());
  EXPECT_TRUE((*b)->Equals(arrow::BooleanScalar(false)));

  auto n = ParseRowValue(RowValue("1.5"), ColumnSpec("n", LogicalType::DECIMAL, true, 10, 2));
  ASSERT_TRUE(n.ok());
  EXPECT_TRUE((*n)->Equals(arrow::Decimal128Scalar(arrow::Decimal128(150), arrow::decimal128(10, 2))));
}

TEST(RowValue, ParseBadNumbers) {
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("300"), ColumnSpec("t", LogicalType::TINYINT)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("12abc"), ColumnSpec("i", LogicalType::INT)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue(""), ColumnSpec("i", LogicalType::BIGINT)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("1.5x"), ColumnSpec("d", LogicalType::DOUBLE)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("maybe"), ColumnSpec("b", LogicalType::BOOL)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("123456789012"), ColumnSpec("n", LogicalType::DECIMAL, true, 10, 2)).status(),
                      ErrorCode::TypeMismatch));
}

TEST(RowValue, ParseTemporal) {
  auto ts = ParseRowValue(RowValue("2019-03-04 05:06:07.25"), ColumnSpec("ts", LogicalType::TIMESTAMP, true, 3));
  ASSERT_TRUE(ts.ok());
  EXPECT_TRUE((*ts)->Equals(arrow::TimestampScalar(1551675967250, arrow::timestamp(arrow::TimeUnit::MILLI))));

  auto ts_t = ParseRowValue(RowValue("2019-03-04T05:06:07"), ColumnSpec("ts", LogicalType::TIMESTAMP));
  ASSERT_TRUE(ts_t.ok());
  EXPECT_TRUE((*ts_t)->Equals(arrow::TimestampScalar(1551675967, arrow::timestamp(arrow::TimeUnit::SECOND))));

  //A bare count is taken at the column's precision
  auto raw = ParseRowValue(RowValue("1000"), ColumnSpec("ts", LogicalType::TIMESTAMP, true, 3));
  ASSERT_TRUE(raw.ok());
  EXPECT_TRUE((*raw)->Equals(arrow::TimestampScalar(1000, arrow::timestamp(arrow::TimeUnit::MILLI))));

  auto day = ParseRowValue(RowValue("2019-03-04"), ColumnSpec("d", LogicalType::DATE, true, 0, 0, 32, Encoding::DATE_IN_DAYS));
  ASSERT_TRUE(day.ok());
  EXPECT_TRUE((*day)->Equals(arrow::Date32Scalar(17959)));

  auto tm = ParseRowValue(RowValue("01:02:03"), ColumnSpec("tm", LogicalType::TIME));
  ASSERT_TRUE(tm.ok());
  EXPECT_TRUE((*tm)->Equals(arrow::Time32Scalar(3723, arrow::time32(arrow::TimeUnit::SECOND))));

  EXPECT_TRUE(IsError(ParseRowValue(RowValue("2019-13-04"), ColumnSpec("d", LogicalType::DATE)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("25:00:00"), ColumnSpec("tm", LogicalType::TIME)).status(), ErrorCode::TypeMismatch));
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("yesterday"), ColumnSpec("ts", LogicalType::TIMESTAMP)).status(), ErrorCode::TypeMismatch));
}

TEST(RowValue, CalendarDays) {
  ColumnSpec date("d", LogicalType::DATE);
  EXPECT_TRUE(ParseRowValue(RowValue("2021-01-31"), date).ok());
  EXPECT_TRUE(ParseRowValue(RowValue("2020-02-29"), date).ok());
  EXPECT_TRUE(ParseRowValue(RowValue("2000-02-29"), date).ok());
  for(string bad : {"2021-02-31", "2021-02-29", "1900-02-29", "2021-04-31", "2021-11-31", "2021-06-00"}) {
    auto st = ParseRowValue(RowValue(bad), date).status();
    EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch)) << bad;
  }
  auto st = ParseRowValue(RowValue("2021-02-31 00:00:00"), ColumnSpec("ts", LogicalType::TIMESTAMP)).status();
  EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch)) << st.ToString();
}

TEST(RowValue, TimestampRange) {
  ColumnSpec nanos("ts", LogicalType::TIMESTAMP, true, 9);
  auto nano_type = arrow::timestamp(arrow::TimeUnit::NANO);

  //The last nanosecond a signed 64-bit count can hold
  auto last = ParseRowValue(RowValue("2262-04-11 23:47:16.854775807"), nanos);
  ASSERT_TRUE(last.ok()) << last.status().ToString();
  EXPECT_TRUE((*last)->Equals(arrow::TimestampScalar(numeric_limits<int64_t>::max(), nano_type)));

  for(string late : {"2262-04-11 23:47:16.854775808", "2262-04-12", "2300-01-01 00:00:00", "9999-12-31 23:59:59"}) {
    auto st = ParseRowValue(RowValue(late), nanos).status();
    EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch)) << late << ": " << st.ToString();
  }
  EXPECT_TRUE(IsError(ParseRowValue(RowValue("1000-01-01"), nanos).status(), ErrorCode::TypeMismatch));

  //Coarser precisions still reach the far dates
  auto micros = ParseRowValue(RowValue("9999-12-31 23:59:59"), ColumnSpec("ts", LogicalType::TIMESTAMP, true, 6));
  ASSERT_TRUE(micros.ok()) << micros.status().ToString();
  EXPECT_TRUE((*micros)->Equals(arrow::TimestampScalar(253402300799000000LL, arrow::timestamp(arrow::TimeUnit::MICRO))));
}

TEST(RowValue, Nulls) {
  auto n = ParseRowValue(RowValue::Null(), ColumnSpec("s", LogicalType::STR));
  ASSERT_TRUE(n.ok());
  EXPECT_FALSE((*n)->is_valid);
  EXPECT_TRUE((*n)->type->Equals(arrow::utf8()));

  auto nn = ParseRowValue(RowValue::Null(), ColumnSpec("s", LogicalType::STR, false));
  EXPECT_TRUE(IsError(nn.status(), ErrorCode::TypeMismatch));

  //Empty text is a real value for strings
  auto empty = ParseRowValue(RowValue(""), ColumnSpec("s", LogicalType::STR));
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE((*empty)->is_valid);

  EXPECT_EQ(RowValue::Null(), RowValue("ignored", true));
  EXPECT_FALSE(RowValue::Null()==RowValue(""));
}

TEST(RowValue, FormatThenParse) {
  //Text produced for one type reads back into a wider column
  auto text = FormatRowValue(arrow::Int16Scalar(1234));
  ASSERT_TRUE(text.ok());
  auto v = ParseRowValue(*text, ColumnSpec("l", LogicalType::BIGINT));
  ASSERT_TRUE(v.ok());
  EXPECT_TRUE((*v)->Equals(arrow::Int64Scalar(1234)));

  auto ts_text = FormatRowValue(arrow::TimestampScalar(-1, arrow::timestamp(arrow::TimeUnit::MICRO)));
  ASSERT_TRUE(ts_text.ok());
  EXPECT_EQ("1969-12-31 23:59:59.999999", ts_text->str_val);
  auto ts = ParseRowValue(*ts_text, ColumnSpec("ts", LogicalType::TIMESTAMP, true, 6));
  ASSERT_TRUE(ts.ok());
  EXPECT_TRUE((*ts)->Equals(arrow::TimestampScalar(-1, arrow::timestamp(arrow::TimeUnit::MICRO))));
}
