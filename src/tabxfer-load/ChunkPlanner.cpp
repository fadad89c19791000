// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <algorithm>
#include <cmath>
#include <cstring>
#include <unordered_map>

#include <arrow/buffer.h>
#include <arrow/buffer_builder.h>

#include "tabxfer-common/Debug.hh"
#include "tabxfer-load/ChunkPlanner.hh"

using namespace std;

namespace tabxfer {

int64_t Batch::SerializedSize() const {
  int64_t bytes=0;
  for(auto &col : columns)
    bytes += col.SerializedSize();
  return bytes;
}

namespace {

arrow::Result<shared_ptr<arrow::Buffer>> sliceBitmap(const EncodedColumn &col, int64_t offset, int64_t length) {
  arrow::TypedBufferBuilder<bool> bits;
  ARROW_RETURN_NOT_OK(bits.Reserve(length));
  for(int64_t i=0; i<length; i++)
    bits.UnsafeAppend(col.IsNull(offset+i));
  shared_ptr<arrow::Buffer> out;
  ARROW_RETURN_NOT_OK(bits.Finish(&out));
  return out;
}

/// Tracks the exact size a batch grows to as rows are added one at a time
class BatchSizer {

public:
  explicit BatchSizer(const vector<EncodedColumn> &columns)
    : columns(columns), seen(columns.size()) {
  }

  void Reset() {
    rows = 0;
    bytes = 0;
    for(size_t c=0; c<columns.size(); c++) {
      if(columns[c].UsesOffsets()) bytes += 4; //Leading offset
      seen[c].assign(columns[c].dictionary.size(), false);
    }
  }

  /// Bytes the batch would grow by if row joined it
  int64_t CostOf(int64_t row) const {
    int64_t cost=0;
    for(size_t c=0; c<columns.size(); c++) {
      const auto &col = columns[c];
      if((rows & 0x07)==0) cost++; //New bitmap byte
      cost += col.value_width;
      if(col.IsNull(row)) continue;
      if(col.UsesOffsets()) {
        const uint8_t *offs = col.values->data();
        cost += ReadWireInt(offs + 4*(row+1), 4) - ReadWireInt(offs + 4*row, 4);
      } else if(col.UsesDictionary()) {
        uint32_t code = ReadWireCode(col.values->data() + row*col.value_width, col.value_width);
        if(!seen[c][code])
          cost += EncodedColumn::kDictionaryEntryOverhead + static_cast<int64_t>(col.dictionary[code].size());
      }
    }
    return cost;
  }

  void Add(int64_t row, int64_t cost) {
    for(size_t c=0; c<columns.size(); c++) {
      const auto &col = columns[c];
      if(col.UsesDictionary() && !col.IsNull(row))
        seen[c][ReadWireCode(col.values->data() + row*col.value_width, col.value_width)] = true;
    }
    rows++;
    bytes += cost;
  }

  int64_t rows=0;
  int64_t bytes=0;

private:
  const vector<EncodedColumn> &columns;
  vector<vector<bool>> seen;
};

} // namespace

/**
 * @brief Cut a row range out of an encoded column
 * @param[in] column The full column
 * @param[in] offset First row of the slice
 * @param[in] length Number of rows in the slice
 * @return A standalone column for the range
 *
 * The null bitmap is re-packed so the first row lands in bit 0. String
 * offsets are rebased to the slice's heap, and a dictionary column gets a new
 * dictionary holding only the strings the slice uses (first-appearance order).
 */
arrow::Result<EncodedColumn> SliceColumn(const EncodedColumn &column, int64_t offset, int64_t length) {

  if((offset<0) || (length<0) || (offset+length > column.length))
    return arrow::Status::IndexError("Slice ["+std::to_string(offset)+", "+std::to_string(offset+length)+
                                     ") is outside column '"+column.spec.name+"' of "+std::to_string(column.length)+" rows");
  EncodedColumn out;
  out.spec = column.spec;
  out.length = length;
  out.value_width = column.value_width;
  ARROW_ASSIGN_OR_RAISE(out.nulls, sliceBitmap(column, offset, length));
  for(int64_t i=0; i<length; i++)
    if(column.IsNull(offset+i)) out.null_count++;

  const int w = column.value_width;
  const uint8_t *src = column.values->data();

  if(column.UsesOffsets()) {
    int64_t base = ReadWireInt(src + 4*offset, 4);
    int64_t end  = ReadWireInt(src + 4*(offset+length), 4);
    arrow::TypedBufferBuilder<int32_t> offs;
    ARROW_RETURN_NOT_OK(offs.Reserve(length+1));
    for(int64_t i=0; i<=length; i++)
      offs.UnsafeAppend(static_cast<int32_t>(ReadWireInt(src + 4*(offset+i), 4) - base));
    ARROW_RETURN_NOT_OK(offs.Finish(&out.values));
    if(!column.heap && (end>base))
      return arrow::Status::Invalid("String column '"+column.spec.name+"' has offsets but no heap");
    out.heap = (column.heap) ? arrow::SliceBuffer(column.heap, base, end-base) : column.heap;

  } else if(column.UsesDictionary()) {
    unordered_map<uint32_t, uint32_t> remap;
    arrow::BufferBuilder codes;
    ARROW_RETURN_NOT_OK(codes.Reserve(length*w));
    for(int64_t i=0; i<length; i++) {
      uint32_t local=0;
      if(!column.IsNull(offset+i)) {
        uint32_t code = ReadWireCode(src + (offset+i)*w, w);
        auto it = remap.find(code);
        if(it==remap.end()) {
          local = static_cast<uint32_t>(out.dictionary.size());
          remap[code] = local;
          out.dictionary.push_back(column.dictionary[code]);
        } else {
          local = it->second;
        }
      }
      //Little endian, so the low w bytes of the code are the wire value
      codes.UnsafeAppend(&local, w);
    }
    ARROW_RETURN_NOT_OK(codes.Finish(&out.values));

  } else {
    out.values = arrow::SliceBuffer(column.values, offset*w, length*w);
  }
  return out;
}

/**
 * @brief Split encoded columns into batches that each fit in a byte budget
 * @param[in] columns Encoded columns, all with the same number of rows
 * @param[in] budget_bytes Largest serialized batch to produce, or 0 for a single batch
 * @retval Invalid The columns have different lengths, or there are no columns
 * @return Batches covering every row once, in order
 *
 * The planner first estimates rows per batch from the average row cost, then
 * clips each batch to the longest prefix whose exact size fits the budget.
 * Every batch gets at least one row, so a row larger than the budget is sent
 * by itself.
 */
arrow::Result<vector<Batch>> PlanBatches(const vector<EncodedColumn> &columns, int64_t budget_bytes) {

  if(columns.empty())
    return arrow::Status::Invalid("No columns to plan batches for");

  int64_t num_rows = columns[0].length;
  int64_t total_bytes = 0;
  for(auto &col : columns) {
    if(col.length!=num_rows)
      return arrow::Status::Invalid("Column '"+col.spec.name+"' has "+std::to_string(col.length)+
                                    " rows but column '"+columns[0].spec.name+"' has "+std::to_string(num_rows));
    total_bytes += col.SerializedSize();
  }

  vector<Batch> batches;
  if((budget_bytes<=0) || (num_rows==0)) {
    Batch b;
    b.num_rows = num_rows;
    b.columns = columns;
    batches.push_back(std::move(b));
    return batches;
  }

  double cost_per_row = static_cast<double>(total_bytes) / static_cast<double>(num_rows);
  int64_t target_rows = std::max<int64_t>(1, static_cast<int64_t>(std::floor(budget_bytes / cost_per_row)));

  BatchSizer sizer(columns);
  int64_t row=0;
  while(row < num_rows) {
    sizer.Reset();
    int64_t limit = std::min(num_rows, row+target_rows);
    while(row+sizer.rows < limit) {
      int64_t cost = sizer.CostOf(row+sizer.rows);
      if((sizer.rows>0) && (sizer.bytes+cost > budget_bytes)) break;
      sizer.Add(row+sizer.rows, cost);
    }

    Batch b;
    b.first_row = row;
    b.num_rows = sizer.rows;
    for(auto &col : columns) {
      ARROW_ASSIGN_OR_RAISE(auto slice, SliceColumn(col, row, sizer.rows));
      b.columns.push_back(std::move(slice));
    }
    F_ASSERT(b.SerializedSize()==sizer.bytes, "Batch size estimate drifted from the sliced size");
    batches.push_back(std::move(b));
    row += sizer.rows;
  }
  return batches;
}

} // namespace tabxfer
