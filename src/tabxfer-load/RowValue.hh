// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_ROWVALUE_HH
#define TABXFER_LOAD_ROWVALUE_HH

#include <memory>
#include <string>
#include <vector>

#include <arrow/result.h>
#include <arrow/type_fwd.h>

#include "tabxfer-load/ColumnSpec.hh"


namespace tabxfer {

/**
 * @brief One value of a row-wise load, in the text form the server parses
 */
struct RowValue {
  std::string str_val;
  bool is_null = false;

  RowValue() = default;
  RowValue(std::string str_val, bool is_null=false) : str_val(std::move(str_val)), is_null(is_null) {}
  static RowValue Null() { return RowValue("", true); }

  bool operator==(const RowValue &other) const { return (is_null==other.is_null) && (is_null || (str_val==other.str_val)); }
};

using WireRow = std::vector<RowValue>;


arrow::Result<RowValue> FormatRowValue(const arrow::Scalar &value);
arrow::Result<std::shared_ptr<arrow::Scalar>> ParseRowValue(const RowValue &value, const ColumnSpec &spec);

//Text helpers for temporal values. Timestamps look like "2019-03-04 05:06:07.250"
std::string FormatDate(int64_t days_since_epoch);
std::string FormatTimestamp(int64_t ticks, int digits);
std::string FormatTimeOfDay(int64_t ticks, int digits);

} // namespace tabxfer

#endif // TABXFER_LOAD_ROWVALUE_HH
