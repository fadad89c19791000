// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_COLUMNENCODER_HH
#define TABXFER_LOAD_COLUMNENCODER_HH

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/type_fwd.h>

#include "tabxfer-load/ColumnSpec.hh"


namespace tabxfer {

/**
 * @brief One column of data in the server's binary columnar wire layout
 *
 * - **nulls**: one bit per row, least significant bit first, set when the row is null
 * - **values**: value_width bytes per row, little endian. Null rows hold zero.
 *   STR/NONE columns hold length+1 int32 offsets into heap instead.
 *   STR/DICT columns hold unsigned codes into dictionary.
 * - **heap**: string bytes (STR/NONE only)
 * - **dictionary**: the distinct strings of this column, in first-appearance order (STR/DICT only)
 */
struct EncodedColumn {
  ColumnSpec spec;
  int64_t length = 0;
  int64_t null_count = 0;
  int value_width = 0;
  std::shared_ptr<arrow::Buffer> nulls;
  std::shared_ptr<arrow::Buffer> values;
  std::shared_ptr<arrow::Buffer> heap;
  std::vector<std::string> dictionary;

  bool IsNull(int64_t row) const {
    return (nulls->data()[row>>3] >> (row & 0x07)) & 0x01;
  }
  bool UsesOffsets() const { return (spec.type==LogicalType::STR) && (spec.encoding!=Encoding::DICT); }
  bool UsesDictionary() const { return (spec.type==LogicalType::STR) && (spec.encoding==Encoding::DICT); }

  int64_t SerializedSize() const;

  static int64_t BitmapBytes(int64_t rows) { return (rows+7)/8; }
  static constexpr int64_t kDictionaryEntryOverhead = 4; //Length prefix in front of each entry
};

arrow::Result<EncodedColumn> EncodeColumn(const arrow::ChunkedArray &data, const ColumnSpec &spec);
arrow::Result<EncodedColumn> EncodeColumn(const arrow::Array &data, const ColumnSpec &spec);

arrow::Result<std::shared_ptr<arrow::Array>> DecodeColumn(const EncodedColumn &column);

int64_t ReadWireInt(const uint8_t *ptr, int width);
uint32_t ReadWireCode(const uint8_t *ptr, int width);

} // namespace tabxfer

#endif // TABXFER_LOAD_COLUMNENCODER_HH
