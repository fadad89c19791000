// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <string>

#include "gtest/gtest.h"

#include <arrow/api.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/TabularData.hh"

#include "support/TableHelpers.hh"

using namespace std;
using namespace tabxfer;

namespace {
shared_ptr<arrow::Scalar> i64(int64_t v) { return arrow::MakeScalar(v); }
shared_ptr<arrow::Scalar> str(const string &s) { return make_shared<arrow::StringScalar>(s); }
shared_ptr<arrow::Scalar> dbl(double v) { return arrow::MakeScalar(v); }
}


TEST(TabularData, Kinds) {
  auto t = createMixedTable();
  auto from_table = TabularData::FromTable(t);
  EXPECT_EQ(TabularData::Kind::ArrowTable, from_table.kind());
  EXPECT_TRUE(from_table.IsArrow());
  EXPECT_EQ(6, from_table.num_columns());
  EXPECT_EQ(4, from_table.num_rows());
  EXPECT_EQ(t->schema()->field_names(), from_table.column_names());

  //The mixed table has a single chunk, so it reads back as one batch
  arrow::TableBatchReader reader(*t);
  shared_ptr<arrow::RecordBatch> rb;
  ASSERT_TRUE(reader.ReadNext(&rb).ok());
  ASSERT_NE(nullptr, rb);
  auto from_batch = TabularData::FromRecordBatch(rb);
  EXPECT_EQ(TabularData::Kind::RecordBatch, from_batch.kind());
  auto bt = from_batch.ToTable();
  ASSERT_TRUE(bt.ok());
  EXPECT_EQ(0, compareTables(t, *bt));

  auto from_rows = TabularData::FromRows({ makeRow({i64(1), str("a")}) });
  EXPECT_EQ(TabularData::Kind::Rows, from_rows.kind());
  EXPECT_FALSE(from_rows.IsArrow());
  EXPECT_EQ(2, from_rows.num_columns());
  EXPECT_EQ(vector<string>({"c0", "c1"}), from_rows.column_names());
  EXPECT_EQ("Rows", to_string(from_rows.kind()));
}

TEST(TabularData, RowsToTable) {
  RowSet rows = { makeRow({i64(1), str("a")}),
                  makeRow({nullptr, str("b")}),
                  makeRow({i64(3), arrow::MakeNullScalar(arrow::utf8())}) };
  auto data = TabularData::FromRows(rows, {"id", "name"});
  auto t = data.ToTable();
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(3, (*t)->num_rows());
  EXPECT_EQ("id", (*t)->field(0)->name());
  EXPECT_TRUE((*t)->field(0)->type()->Equals(arrow::int64()));
  EXPECT_TRUE((*t)->field(1)->type()->Equals(arrow::utf8()));
  EXPECT_EQ(vector<int64_t>({1, -1, 3}), getInt64Column(*t, 0));
  EXPECT_EQ(vector<string>({"a", "b", "<null>"}), getStringColumn(*t, 1));
}

TEST(TabularData, RowsBadShape) {
  auto ragged = TabularData::FromRows({ makeRow({i64(1), str("a")}), makeRow({i64(2)}) });
  EXPECT_TRUE(IsError(ragged.ToTable().status(), ErrorCode::SchemaMismatch));

  auto mixed = TabularData::FromRows({ makeRow({i64(1)}), makeRow({str("two")}) });
  EXPECT_TRUE(IsError(mixed.ToTable().status(), ErrorCode::TypeMismatch));

  auto all_null = TabularData::FromRows({ makeRow({i64(1), nullptr}), makeRow({i64(2), nullptr}) });
  auto t = all_null.ToTable();
  ASSERT_TRUE(t.ok());
  EXPECT_EQ(arrow::Type::NA, (*t)->field(1)->type()->id());
  EXPECT_TRUE(IsError(all_null.InferColumnSpecs().status(), ErrorCode::TypeMismatch));
}

TEST(TabularData, RowsToSpecTypes) {
  //A double column may receive ints when the target type is known
  RowSet rows = { makeRow({i64(1), dbl(0.5)}),
                  makeRow({i64(2), i64(7)}) };
  auto data = TabularData::FromRows(rows);
  EXPECT_TRUE(IsError(data.ToTable().status(), ErrorCode::TypeMismatch));

  vector<ColumnSpec> specs = { ColumnSpec("a", LogicalType::SMALLINT), ColumnSpec("b", LogicalType::DOUBLE) };
  auto t = data.ToTable(specs);
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_TRUE((*t)->field(0)->type()->Equals(arrow::int16()));
  EXPECT_TRUE((*t)->field(1)->type()->Equals(arrow::float64()));
  auto b = static_pointer_cast<arrow::DoubleArray>((*t)->column(1)->chunk(0));
  EXPECT_EQ(0.5, b->Value(0));
  EXPECT_EQ(7.0, b->Value(1));

  EXPECT_TRUE(IsError(data.ToTable({specs[0]}).status(), ErrorCode::SchemaMismatch));

  vector<ColumnSpec> narrow = { ColumnSpec("a", LogicalType::BOOL), ColumnSpec("b", LogicalType::DOUBLE) };
  EXPECT_TRUE(IsError(TabularData::FromRows({ makeRow({i64(5), dbl(1)}) }).ToTable(narrow).status(), ErrorCode::TypeMismatch));
}

TEST(TabularData, WireRows) {
  auto data = TabularData::FromTable(createMixedTable());
  auto rows = data.ToWireRows();
  ASSERT_TRUE(rows.ok());
  ASSERT_EQ(4, rows->size());

  const auto &r0 = (*rows)[0];
  ASSERT_EQ(6, r0.size());
  EXPECT_EQ(RowValue("1"), r0[0]);
  EXPECT_EQ(RowValue("1.5"), r0[1]);
  EXPECT_EQ(RowValue("alpha"), r0[2]);
  EXPECT_EQ(RowValue("true"), r0[3]);
  EXPECT_EQ(RowValue("2019-03-04 05:06:07.250"), r0[4]);
  EXPECT_EQ(RowValue::Null(), r0[5]);

  EXPECT_EQ(RowValue::Null(), (*rows)[2][0]);
  EXPECT_EQ(RowValue("1969-12-31"), (*rows)[2][5]);

  auto from_rows = TabularData::FromRows({ makeRow({i64(1), nullptr, str("x")}) }).ToWireRows();
  ASSERT_TRUE(from_rows.ok());
  EXPECT_EQ(WireRow({RowValue("1"), RowValue::Null(), RowValue("x")}), (*from_rows)[0]);
}

TEST(TabularData, InferSpecs) {
  auto specs = TabularData::FromTable(createMixedTable()).InferColumnSpecs();
  ASSERT_TRUE(specs.ok());
  ASSERT_EQ(6, specs->size());
  EXPECT_EQ(LogicalType::INT,       (*specs)[0].type);
  EXPECT_EQ(LogicalType::DOUBLE,    (*specs)[1].type);
  EXPECT_EQ(LogicalType::STR,       (*specs)[2].type);
  EXPECT_EQ(LogicalType::BOOL,      (*specs)[3].type);
  EXPECT_EQ(LogicalType::TIMESTAMP, (*specs)[4].type);
  EXPECT_EQ(3,                      (*specs)[4].precision);
  EXPECT_EQ(LogicalType::DATE,      (*specs)[5].type);

  auto row_specs = TabularData::FromRows({ makeRow({i64(1), str("a")}) }, {"id", "name"}).InferColumnSpecs();
  ASSERT_TRUE(row_specs.ok());
  EXPECT_EQ(ColumnSpec("id", LogicalType::BIGINT), (*row_specs)[0]);
  EXPECT_EQ("name", (*row_specs)[1].name);
}
