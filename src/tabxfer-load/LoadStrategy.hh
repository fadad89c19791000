// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_LOADSTRATEGY_HH
#define TABXFER_LOAD_LOADSTRATEGY_HH

#include <cstdint>
#include <string>
#include <vector>

#include <arrow/result.h>

#include "tabxfer-load/TabularData.hh"


namespace tabxfer {

/// What the caller asked for
enum class LoadMethod : uint8_t { Infer=0, Arrow, Columnar, Rows };

/// Whether a load may create its target table
enum class CreatePolicy : uint8_t { Infer=0, Always, Never };

/// How a load is actually sent, decided once per call
enum class LoadStrategy : uint8_t { Arrow=0, Columnar, RowWise };

std::string to_string(LoadMethod method);
std::string to_string(CreatePolicy policy);
std::string to_string(LoadStrategy strategy);

arrow::Result<LoadMethod> ParseLoadMethod(const std::string &text);
arrow::Result<CreatePolicy> ParseCreatePolicy(const std::string &text);

LoadStrategy SelectLoadStrategy(LoadMethod method, const TabularData &data);


/**
 * @brief Per-call load settings. Empty or negative fields fall back to the connection's configuration
 */
struct LoadOptions {
  std::string method;                     //!< infer, arrow, columnar, or rows
  std::string create;                     //!< infer, true, or false
  int64_t chunk_size_bytes = -1;          //!< Columnar batch budget. 0 sends one batch
  std::vector<std::string> column_names;  //!< Target columns, when loading a subset of the table
  bool col_names_from_schema = false;     //!< Columnar: label columns with the table's names instead of the source's
};

} // namespace tabxfer

#endif // TABXFER_LOAD_LOADSTRATEGY_HH
