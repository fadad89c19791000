// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_TABULARDATA_HH
#define TABXFER_LOAD_TABULARDATA_HH

#include <memory>
#include <string>
#include <vector>

#include <arrow/result.h>
#include <arrow/type_fwd.h>

#include "tabxfer-load/ColumnSpec.hh"
#include "tabxfer-load/RowValue.hh"


namespace tabxfer {

using Row = std::vector<std::shared_ptr<arrow::Scalar>>;
using RowSet = std::vector<Row>;


/**
 * @brief The application data handed to a load: an Arrow table, a record batch, or plain rows
 *
 * Rows are lists of Arrow scalars, one per column. Every non-null scalar in
 * a column must share one type. Row sets have no schema of their own, so
 * column names may be supplied (otherwise they are named c0, c1, ...).
 */
class TabularData {

public:
  enum class Kind { ArrowTable, RecordBatch, Rows };

  static TabularData FromTable(std::shared_ptr<arrow::Table> table);
  static TabularData FromRecordBatch(std::shared_ptr<arrow::RecordBatch> batch);
  static TabularData FromRows(RowSet rows, std::vector<std::string> column_names={});

  Kind kind() const { return kind_; }
  bool IsArrow() const { return kind_!=Kind::Rows; }

  int num_columns() const;
  int64_t num_rows() const;
  std::vector<std::string> column_names() const;

  arrow::Result<std::shared_ptr<arrow::Table>> ToTable() const;
  arrow::Result<std::shared_ptr<arrow::Table>> ToTable(const std::vector<ColumnSpec> &specs) const;
  arrow::Result<std::vector<WireRow>> ToWireRows() const;
  arrow::Result<std::vector<ColumnSpec>> InferColumnSpecs() const;

private:
  TabularData() = default;

  Kind kind_ = Kind::Rows;
  std::shared_ptr<arrow::Table> table_;
  std::shared_ptr<arrow::RecordBatch> batch_;
  RowSet rows_;
  std::vector<std::string> names_;
};

std::string to_string(TabularData::Kind kind);

} // namespace tabxfer

#endif // TABXFER_LOAD_TABULARDATA_HH
