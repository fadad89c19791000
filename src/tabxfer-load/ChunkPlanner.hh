// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_CHUNKPLANNER_HH
#define TABXFER_LOAD_CHUNKPLANNER_HH

#include <cstdint>
#include <vector>

#include <arrow/result.h>

#include "tabxfer-load/ColumnEncoder.hh"


namespace tabxfer {

/**
 * @brief A row range of a load, with every column sliced to that range
 */
struct Batch {
  int64_t first_row = 0;              //!< Row of the source table this batch starts at
  int64_t num_rows = 0;
  std::vector<EncodedColumn> columns;

  int64_t SerializedSize() const;
};

arrow::Result<EncodedColumn> SliceColumn(const EncodedColumn &column, int64_t offset, int64_t length);

arrow::Result<std::vector<Batch>> PlanBatches(const std::vector<EncodedColumn> &columns, int64_t budget_bytes);

} // namespace tabxfer

#endif // TABXFER_LOAD_CHUNKPLANNER_HH
