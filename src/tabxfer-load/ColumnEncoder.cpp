// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>
#include <unordered_map>

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/buffer_builder.h>
#include <arrow/chunked_array.h>
#include <arrow/type.h>
#include <arrow/util/decimal.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/ColumnEncoder.hh"

using namespace std;

namespace tabxfer {

int64_t EncodedColumn::SerializedSize() const {
  int64_t bytes = BitmapBytes(length);
  bytes += ((UsesOffsets()) ? length+1 : length) * value_width;
  if(heap) bytes += heap->size();
  for(auto &entry : dictionary)
    bytes += kDictionaryEntryOverhead + static_cast<int64_t>(entry.size());
  return bytes;
}

/// @brief Read a little-endian signed value of the given width, sign extending to 64 bits
int64_t ReadWireInt(const uint8_t *ptr, int width) {
  switch(width) {
    case 1: { int8_t v;  memcpy(&v, ptr, 1); return v; }
    case 2: { int16_t v; memcpy(&v, ptr, 2); return v; }
    case 4: { int32_t v; memcpy(&v, ptr, 4); return v; }
    default: { int64_t v; memcpy(&v, ptr, 8); return v; }
  }
}

/// @brief Read a little-endian unsigned dictionary code of the given width
uint32_t ReadWireCode(const uint8_t *ptr, int width) {
  switch(width) {
    case 1: { uint8_t v;  memcpy(&v, ptr, 1); return v; }
    case 2: { uint16_t v; memcpy(&v, ptr, 2); return v; }
    default: { uint32_t v; memcpy(&v, ptr, 4); return v; }
  }
}

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t floorDiv(int64_t a, int64_t b) {
  int64_t q = a/b;
  if(((a%b)!=0) && ((a<0)!=(b<0))) q--;
  return q;
}

int64_t ticksPerSecond(arrow::TimeUnit::type unit) {
  switch(unit) {
    case arrow::TimeUnit::SECOND: return 1;
    case arrow::TimeUnit::MILLI:  return 1000;
    case arrow::TimeUnit::MICRO:  return 1000000;
    case arrow::TimeUnit::NANO:   return 1000000000;
  }
  return 1;
}

int64_t powerOf10(int exponent) {
  int64_t v=1;
  for(int i=0; i<exponent; i++) v*=10;
  return v;
}

/**
 * @brief Accumulates one column's wire buffers while rows are appended
 */
class ColumnWriter {

public:
  ColumnWriter(const ColumnSpec &spec, int width) : spec(spec), width(width) {}

  arrow::Status Init(int64_t expected_rows) {
    ARROW_RETURN_NOT_OK(nulls.Reserve(expected_rows));
    if(uses_offsets()) {
      ARROW_RETURN_NOT_OK(values.Reserve((expected_rows+1)*width));
      int32_t zero=0;
      ARROW_RETURN_NOT_OK(values.Append(&zero, sizeof(zero)));
    } else {
      ARROW_RETURN_NOT_OK(values.Reserve(expected_rows*width));
    }
    return arrow::Status::OK();
  }

  arrow::Status AppendNull() {
    if(!spec.nullable)
      return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' is NOT NULL but row "+std::to_string(length)+" is null");
    ARROW_RETURN_NOT_OK(nulls.Append(true));
    null_count++;
    length++;
    if(uses_offsets()) {
      int32_t off = static_cast<int32_t>(heap.length());
      return values.Append(&off, sizeof(off));
    }
    int64_t zero=0;
    return values.Append(&zero, width);
  }

  arrow::Status AppendInt(int64_t v) {
    if(!fits(v))
      return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' value "+std::to_string(v)+
                                                " in row "+std::to_string(length)+" does not fit in "+std::to_string(width*8)+" bits");
    if((spec.type==LogicalType::DECIMAL) && !fitsPrecision(v))
      return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' value "+arrow::Decimal128(v).ToString(spec.scale)+
                                                " in row "+std::to_string(length)+" does not fit in DECIMAL("+
                                                std::to_string(decimalPrecision())+","+std::to_string(spec.scale)+")");
    ARROW_RETURN_NOT_OK(nulls.Append(false));
    length++;
    switch(width) {
      case 1: { auto x=static_cast<int8_t>(v);  return values.Append(&x, 1); }
      case 2: { auto x=static_cast<int16_t>(v); return values.Append(&x, 2); }
      case 4: { auto x=static_cast<int32_t>(v); return values.Append(&x, 4); }
      default: return values.Append(&v, 8);
    }
  }

  arrow::Status AppendFloat(double v) {
    ARROW_RETURN_NOT_OK(nulls.Append(false));
    length++;
    if(width==4) {
      auto x = static_cast<float>(v);
      return values.Append(&x, sizeof(x));
    }
    return values.Append(&v, sizeof(v));
  }

  arrow::Status AppendString(const string &s) {
    if(uses_offsets()) {
      if(heap.length() + static_cast<int64_t>(s.size()) > std::numeric_limits<int32_t>::max())
        return arrow::Status::CapacityError("Column '"+spec.name+"' has more than 2GB of string data");
      ARROW_RETURN_NOT_OK(nulls.Append(false));
      length++;
      ARROW_RETURN_NOT_OK(heap.Append(s.data(), static_cast<int64_t>(s.size())));
      int32_t off = static_cast<int32_t>(heap.length());
      return values.Append(&off, sizeof(off));
    }

    uint32_t code;
    auto it = dict_index.find(s);
    if(it!=dict_index.end()) {
      code = it->second;
    } else {
      if(!fitsCode(dictionary.size()))
        return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' has more distinct strings than "+
                                                  std::to_string(width*8)+"-bit dictionary codes can address");
      code = static_cast<uint32_t>(dictionary.size());
      dict_index[s] = code;
      dictionary.push_back(s);
    }
    ARROW_RETURN_NOT_OK(nulls.Append(false));
    length++;
    switch(width) {
      case 1: { auto x=static_cast<uint8_t>(code);  return values.Append(&x, 1); }
      case 2: { auto x=static_cast<uint16_t>(code); return values.Append(&x, 2); }
      default: return values.Append(&code, 4);
    }
  }

  arrow::Result<EncodedColumn> Finish() {
    EncodedColumn col;
    col.spec = spec;
    col.length = length;
    col.null_count = null_count;
    col.value_width = width;
    ARROW_RETURN_NOT_OK(nulls.Finish(&col.nulls));
    ARROW_RETURN_NOT_OK(values.Finish(&col.values));
    if(uses_offsets()) {
      ARROW_RETURN_NOT_OK(heap.Finish(&col.heap));
    }
    col.dictionary = std::move(dictionary);
    return col;
  }

  const ColumnSpec &spec;

private:
  bool uses_offsets() const { return (spec.type==LogicalType::STR) && (spec.encoding!=Encoding::DICT); }

  bool fits(int64_t v) const {
    switch(width) {
      case 1: return (v>=std::numeric_limits<int8_t>::min())  && (v<=std::numeric_limits<int8_t>::max());
      case 2: return (v>=std::numeric_limits<int16_t>::min()) && (v<=std::numeric_limits<int16_t>::max());
      case 4: return (v>=std::numeric_limits<int32_t>::min()) && (v<=std::numeric_limits<int32_t>::max());
      default: return true;
    }
  }
  //Precision 0 means the widest 64-bit decimal
  int decimalPrecision() const { return (spec.precision==0) ? 18 : spec.precision; }
  bool fitsPrecision(int64_t v) const {
    int64_t limit = powerOf10(decimalPrecision());
    return (v > -limit) && (v < limit);
  }
  bool fitsCode(size_t next_code) const {
    if(width>=4) return next_code <= std::numeric_limits<uint32_t>::max();
    return next_code < (size_t(1) << (width*8));
  }

  int width;
  int64_t length=0;
  int64_t null_count=0;
  arrow::TypedBufferBuilder<bool> nulls;
  arrow::BufferBuilder values;
  arrow::BufferBuilder heap;
  unordered_map<string, uint32_t> dict_index;
  vector<string> dictionary;
};


arrow::Status incompatible(const ColumnSpec &spec, const arrow::DataType &type) {
  return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' of type "+spec.str()+
                                            " cannot be loaded from Arrow type "+type.ToString());
}

/// Hand a typed integer array to fn, or fail if the chunk isn't an integer array
template <typename Fn>
arrow::Status withIntegerArray(const arrow::Array &chunk, const ColumnSpec &spec, Fn &&fn) {
  switch(chunk.type_id()) {
    case arrow::Type::INT8:   return fn(static_cast<const arrow::Int8Array &>(chunk));
    case arrow::Type::INT16:  return fn(static_cast<const arrow::Int16Array &>(chunk));
    case arrow::Type::INT32:  return fn(static_cast<const arrow::Int32Array &>(chunk));
    case arrow::Type::INT64:  return fn(static_cast<const arrow::Int64Array &>(chunk));
    case arrow::Type::UINT8:  return fn(static_cast<const arrow::UInt8Array &>(chunk));
    case arrow::Type::UINT16: return fn(static_cast<const arrow::UInt16Array &>(chunk));
    case arrow::Type::UINT32: return fn(static_cast<const arrow::UInt32Array &>(chunk));
    case arrow::Type::UINT64: return fn(static_cast<const arrow::UInt64Array &>(chunk));
    default: return incompatible(spec, *chunk.type());
  }
}

/// Append every integer in chunk multiplied by scale_factor (used for ints and scaled decimals)
arrow::Status appendIntegers(ColumnWriter &w, const arrow::Array &chunk, int64_t scale_factor) {
  return withIntegerArray(chunk, w.spec, [&](const auto &arr) -> arrow::Status {
    using CType = typename std::decay<decltype(arr)>::type::value_type;
    for(int64_t i=0; i<arr.length(); i++) {
      if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
      CType raw = arr.Value(i);
      if(std::is_unsigned<CType>::value && (static_cast<uint64_t>(raw) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())))
        return MakeError(ErrorCode::TypeMismatch, "Column '"+w.spec.name+"' value "+std::to_string(raw)+" does not fit in a signed 64-bit integer");
      int64_t v = static_cast<int64_t>(raw);
      int64_t scaled;
      if(__builtin_mul_overflow(v, scale_factor, &scaled))
        return MakeError(ErrorCode::TypeMismatch, "Column '"+w.spec.name+"' value "+std::to_string(v)+" overflows when scaled");
      ARROW_RETURN_NOT_OK(w.AppendInt(scaled));
    }
    return arrow::Status::OK();
  });
}

/// Append numbers as floating point (float/double columns)
arrow::Status appendFloats(ColumnWriter &w, const arrow::Array &chunk) {
  switch(chunk.type_id()) {
    case arrow::Type::FLOAT: {
      auto &arr = static_cast<const arrow::FloatArray &>(chunk);
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        ARROW_RETURN_NOT_OK(w.AppendFloat(arr.Value(i)));
      }
      return arrow::Status::OK();
    }
    case arrow::Type::DOUBLE: {
      auto &arr = static_cast<const arrow::DoubleArray &>(chunk);
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        ARROW_RETURN_NOT_OK(w.AppendFloat(arr.Value(i)));
      }
      return arrow::Status::OK();
    }
    default:
      return withIntegerArray(chunk, w.spec, [&](const auto &arr) -> arrow::Status {
        for(int64_t i=0; i<arr.length(); i++) {
          if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
          ARROW_RETURN_NOT_OK(w.AppendFloat(static_cast<double>(arr.Value(i))));
        }
        return arrow::Status::OK();
      });
  }
}

arrow::Status appendScaledFloat(ColumnWriter &w, double v) {
  double scaled = std::round(v * static_cast<double>(powerOf10(w.spec.scale)));
  //2^63 is exactly representable, so compare against it rather than INT64_MAX
  if((!std::isfinite(scaled)) || (scaled >= 9223372036854775808.0) || (scaled < -9223372036854775808.0))
    return MakeError(ErrorCode::TypeMismatch, "Column '"+w.spec.name+"' value "+std::to_string(v)+" does not fit in 64 bits at scale "+
                                              std::to_string(w.spec.scale));
  return w.AppendInt(static_cast<int64_t>(scaled));
}

arrow::Status appendDecimals(ColumnWriter &w, const arrow::Array &chunk) {
  switch(chunk.type_id()) {
    case arrow::Type::DECIMAL128: {
      auto &arr = static_cast<const arrow::Decimal128Array &>(chunk);
      int src_scale = static_cast<const arrow::Decimal128Type &>(*arr.type()).scale();
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        arrow::Decimal128 dec(arr.GetValue(i));
        if(w.spec.scale > src_scale) {
          dec = arrow::Decimal128(dec.IncreaseScaleBy(w.spec.scale - src_scale));
        } else if(w.spec.scale < src_scale) {
          dec = arrow::Decimal128(dec.ReduceScaleBy(src_scale - w.spec.scale, true));
        }
        int64_t v;
        auto st = dec.ToInteger(&v);
        if(!st.ok())
          return MakeError(ErrorCode::TypeMismatch, "Column '"+w.spec.name+"' decimal "+dec.ToString(w.spec.scale)+" does not fit in 64 bits");
        ARROW_RETURN_NOT_OK(w.AppendInt(v));
      }
      return arrow::Status::OK();
    }
    case arrow::Type::FLOAT: {
      auto &arr = static_cast<const arrow::FloatArray &>(chunk);
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        ARROW_RETURN_NOT_OK(appendScaledFloat(w, arr.Value(i)));
      }
      return arrow::Status::OK();
    }
    case arrow::Type::DOUBLE: {
      auto &arr = static_cast<const arrow::DoubleArray &>(chunk);
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        ARROW_RETURN_NOT_OK(appendScaledFloat(w, arr.Value(i)));
      }
      return arrow::Status::OK();
    }
    default:
      return appendIntegers(w, chunk, powerOf10(w.spec.scale));
  }
}

arrow::Status appendBooleans(ColumnWriter &w, const arrow::Array &chunk) {
  if(chunk.type_id()!=arrow::Type::BOOL) return incompatible(w.spec, *chunk.type());
  auto &arr = static_cast<const arrow::BooleanArray &>(chunk);
  for(int64_t i=0; i<arr.length(); i++) {
    if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
    ARROW_RETURN_NOT_OK(w.AppendInt(arr.Value(i) ? 1 : 0));
  }
  return arrow::Status::OK();
}

template <typename StringArrayT>
arrow::Status appendStringArray(ColumnWriter &w, const StringArrayT &arr) {
  for(int64_t i=0; i<arr.length(); i++) {
    if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
    ARROW_RETURN_NOT_OK(w.AppendString(arr.GetString(i)));
  }
  return arrow::Status::OK();
}

arrow::Status appendStrings(ColumnWriter &w, const arrow::Array &chunk) {
  switch(chunk.type_id()) {
    case arrow::Type::STRING:
      return appendStringArray(w, static_cast<const arrow::StringArray &>(chunk));
    case arrow::Type::LARGE_STRING:
      return appendStringArray(w, static_cast<const arrow::LargeStringArray &>(chunk));
    case arrow::Type::DICTIONARY: {
      auto &arr = static_cast<const arrow::DictionaryArray &>(chunk);
      auto dict = arr.dictionary();
      bool large = (dict->type_id()==arrow::Type::LARGE_STRING);
      if((!large) && (dict->type_id()!=arrow::Type::STRING))
        return incompatible(w.spec, *chunk.type());
      for(int64_t i=0; i<arr.length(); i++) {
        if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
        int64_t idx = arr.GetValueIndex(i);
        string s = (large) ? static_cast<const arrow::LargeStringArray &>(*dict).GetString(idx)
                           : static_cast<const arrow::StringArray &>(*dict).GetString(idx);
        ARROW_RETURN_NOT_OK(w.AppendString(s));
      }
      return arrow::Status::OK();
    }
    default:
      return incompatible(w.spec, *chunk.type());
  }
}

/**
 * Walk a temporal chunk handing fn(value, ticks_per_second) for each valid row.
 * Dates are expressed as seconds (date32) or milliseconds (date64) since the epoch.
 */
template <typename Fn>
arrow::Status forEachTemporal(ColumnWriter &w, const arrow::Array &chunk, bool allow_time_of_day, bool allow_date_time, Fn &&fn) {

  auto walk = [&](const auto &arr, int64_t tps, int64_t multiplier) -> arrow::Status {
    for(int64_t i=0; i<arr.length(); i++) {
      if(arr.IsNull(i)) { ARROW_RETURN_NOT_OK(w.AppendNull()); continue; }
      ARROW_RETURN_NOT_OK(fn(static_cast<int64_t>(arr.Value(i))*multiplier, tps));
    }
    return arrow::Status::OK();
  };

  switch(chunk.type_id()) {
    case arrow::Type::TIMESTAMP:
      if(!allow_date_time) break;
      return walk(static_cast<const arrow::TimestampArray &>(chunk),
                  ticksPerSecond(static_cast<const arrow::TimestampType &>(*chunk.type()).unit()), 1);
    case arrow::Type::DATE32:
      if(!allow_date_time) break;
      return walk(static_cast<const arrow::Date32Array &>(chunk), 1, kSecondsPerDay);
    case arrow::Type::DATE64:
      if(!allow_date_time) break;
      return walk(static_cast<const arrow::Date64Array &>(chunk), 1000, 1);
    case arrow::Type::TIME32:
      if(!allow_time_of_day) break;
      return walk(static_cast<const arrow::Time32Array &>(chunk),
                  ticksPerSecond(static_cast<const arrow::Time32Type &>(*chunk.type()).unit()), 1);
    case arrow::Type::TIME64:
      if(!allow_time_of_day) break;
      return walk(static_cast<const arrow::Time64Array &>(chunk),
                  ticksPerSecond(static_cast<const arrow::Time64Type &>(*chunk.type()).unit()), 1);
    default:
      break;
  }
  return incompatible(w.spec, *chunk.type());
}

/// Convert a tick count between resolutions, truncating toward negative infinity when coarsening
arrow::Result<int64_t> rescaleTicks(const ColumnSpec &spec, int64_t v, int64_t src_tps, int64_t dst_tps) {
  if(dst_tps==src_tps) return v;
  if(dst_tps<src_tps) return floorDiv(v, src_tps/dst_tps);
  int64_t out;
  if(__builtin_mul_overflow(v, dst_tps/src_tps, &out))
    return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' time value "+std::to_string(v)+" overflows at the column's precision");
  return out;
}

arrow::Status appendChunk(ColumnWriter &w, const arrow::Array &chunk) {

  const ColumnSpec &spec = w.spec;

  if(chunk.type_id()==arrow::Type::NA) {
    for(int64_t i=0; i<chunk.length(); i++)
      ARROW_RETURN_NOT_OK(w.AppendNull());
    return arrow::Status::OK();
  }

  switch(spec.type) {
    case LogicalType::BOOL:
      return appendBooleans(w, chunk);

    case LogicalType::TINYINT:
    case LogicalType::SMALLINT:
    case LogicalType::INT:
    case LogicalType::BIGINT:
      return appendIntegers(w, chunk, 1);

    case LogicalType::FLOAT:
    case LogicalType::DOUBLE:
      return appendFloats(w, chunk);

    case LogicalType::DECIMAL:
      return appendDecimals(w, chunk);

    case LogicalType::STR:
      return appendStrings(w, chunk);

    case LogicalType::TIMESTAMP: {
      int64_t dst_tps = powerOf10(spec.precision);
      return forEachTemporal(w, chunk, false, true, [&](int64_t v, int64_t tps) -> arrow::Status {
        ARROW_ASSIGN_OR_RAISE(auto out, rescaleTicks(spec, v, tps, dst_tps));
        return w.AppendInt(out);
      });
    }

    case LogicalType::DATE:
      return forEachTemporal(w, chunk, false, true, [&](int64_t v, int64_t tps) -> arrow::Status {
        int64_t days = floorDiv(floorDiv(v, tps), kSecondsPerDay);
        if(spec.encoding==Encoding::DATE_IN_DAYS) return w.AppendInt(days);
        return w.AppendInt(days*kSecondsPerDay);
      });

    case LogicalType::TIME:
      return forEachTemporal(w, chunk, true, false, [&](int64_t v, int64_t tps) -> arrow::Status {
        return w.AppendInt(floorDiv(v, tps));
      });
  }
  return incompatible(spec, *chunk.type());
}

arrow::Result<EncodedColumn> encodeChunks(const arrow::ArrayVector &chunks, const ColumnSpec &spec) {
  ARROW_ASSIGN_OR_RAISE(int width, WireWidth(spec));

  int64_t total_rows=0;
  for(auto &chunk : chunks) total_rows += chunk->length();

  ColumnWriter w(spec, width);
  ARROW_RETURN_NOT_OK(w.Init(total_rows));
  for(auto &chunk : chunks) {
    ARROW_RETURN_NOT_OK(appendChunk(w, *chunk));
  }
  return w.Finish();
}

} // namespace


/**
 * @brief Convert a column of Arrow data into the server's wire layout
 * @param[in] data The source column (any number of chunks)
 * @param[in] spec The server's declaration for the target column
 * @retval TypeMismatch The data can't be coerced into the spec's type, holds
 *         out-of-range values, or holds nulls for a NOT NULL column
 * @return The encoded column
 */
arrow::Result<EncodedColumn> EncodeColumn(const arrow::ChunkedArray &data, const ColumnSpec &spec) {
  return encodeChunks(data.chunks(), spec);
}

arrow::Result<EncodedColumn> EncodeColumn(const arrow::Array &data, const ColumnSpec &spec) {
  ARROW_ASSIGN_OR_RAISE(int width, WireWidth(spec));
  ColumnWriter w(spec, width);
  ARROW_RETURN_NOT_OK(w.Init(data.length()));
  ARROW_RETURN_NOT_OK(appendChunk(w, data));
  return w.Finish();
}


namespace {

template <typename BuilderT, typename Fn>
arrow::Result<std::shared_ptr<arrow::Array>> buildColumn(BuilderT &builder, const EncodedColumn &col, Fn &&value_at) {
  ARROW_RETURN_NOT_OK(builder.Reserve(col.length));
  for(int64_t i=0; i<col.length; i++) {
    if(col.IsNull(i)) {
      ARROW_RETURN_NOT_OK(builder.AppendNull());
    } else {
      ARROW_RETURN_NOT_OK(builder.Append(value_at(i)));
    }
  }
  std::shared_ptr<arrow::Array> out;
  ARROW_RETURN_NOT_OK(builder.Finish(&out));
  return out;
}

arrow::Status checkLayout(const EncodedColumn &col) {
  if(!col.nulls || !col.values)
    return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' is missing its buffers");
  if(col.nulls->size() < EncodedColumn::BitmapBytes(col.length))
    return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' null bitmap is too short");
  int64_t slots = (col.UsesOffsets()) ? col.length+1 : col.length;
  if(col.values->size() < slots*col.value_width)
    return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' value buffer is too short");

  if(col.UsesOffsets()) {
    int64_t heap_size = (col.heap) ? col.heap->size() : 0;
    const uint8_t *p = col.values->data();
    int64_t prev = ReadWireInt(p, 4);
    for(int64_t i=1; i<=col.length; i++) {
      int64_t off = ReadWireInt(p + 4*i, 4);
      if((off<prev) || (off>heap_size))
        return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' has a bad string offset at row "+std::to_string(i-1));
      prev = off;
    }
  }
  if(col.spec.type==LogicalType::DECIMAL) {
    int64_t limit = powerOf10((col.spec.precision==0) ? 18 : col.spec.precision);
    for(int64_t i=0; i<col.length; i++) {
      if(col.IsNull(i)) continue;
      int64_t v = ReadWireInt(col.values->data() + i*col.value_width, col.value_width);
      if((v <= -limit) || (v >= limit))
        return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' has a decimal out of precision at row "+std::to_string(i));
    }
  }
  if(col.UsesDictionary()) {
    for(int64_t i=0; i<col.length; i++) {
      if(col.IsNull(i)) continue;
      if(ReadWireCode(col.values->data() + i*col.value_width, col.value_width) >= col.dictionary.size())
        return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' has a dictionary code out of range at row "+std::to_string(i));
    }
  }
  return arrow::Status::OK();
}

} // namespace

/**
 * @brief Rebuild the canonical Arrow array for an encoded column
 * @param[in] column A column produced by EncodeColumn (or received off the wire)
 * @return An array of ArrowTypeForSpec(column.spec), or Invalid if the buffers are malformed
 */
arrow::Result<std::shared_ptr<arrow::Array>> DecodeColumn(const EncodedColumn &column) {

  const auto &col = column;
  ARROW_ASSIGN_OR_RAISE(int width, WireWidth(col.spec));
  if(width!=col.value_width)
    return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' has width "+std::to_string(col.value_width)+
                                  " but its spec needs "+std::to_string(width));
  ARROW_RETURN_NOT_OK(checkLayout(col));
  ARROW_ASSIGN_OR_RAISE(auto type, ArrowTypeForSpec(col.spec));

  const uint8_t *vals = col.values->data();
  auto int_at = [&](int64_t i) { return ReadWireInt(vals + i*width, width); };
  auto *pool = arrow::default_memory_pool();

  switch(col.spec.type) {
    case LogicalType::BOOL: {
      arrow::BooleanBuilder b(pool);
      return buildColumn(b, col, [&](int64_t i) { return int_at(i)!=0; });
    }
    case LogicalType::TINYINT: {
      arrow::Int8Builder b(pool);
      return buildColumn(b, col, [&](int64_t i) { return static_cast<int8_t>(int_at(i)); });
    }
    case LogicalType::SMALLINT: {
      arrow::Int16Builder b(pool);
      return buildColumn(b, col, [&](int64_t i) { return static_cast<int16_t>(int_at(i)); });
    }
    case LogicalType::INT: {
      arrow::Int32Builder b(pool);
      return buildColumn(b, col, [&](int64_t i) { return static_cast<int32_t>(int_at(i)); });
    }
    case LogicalType::BIGINT: {
      arrow::Int64Builder b(pool);
      return buildColumn(b, col, int_at);
    }
    case LogicalType::FLOAT: {
      arrow::FloatBuilder b(pool);
      return buildColumn(b, col, [&](int64_t i) { float v; memcpy(&v, vals + i*4, 4); return v; });
    }
    case LogicalType::DOUBLE: {
      arrow::DoubleBuilder b(pool);
      return buildColumn(b, col, [&](int64_t i) { double v; memcpy(&v, vals + i*8, 8); return v; });
    }
    case LogicalType::DECIMAL: {
      arrow::Decimal128Builder b(type, pool);
      return buildColumn(b, col, [&](int64_t i) { return arrow::Decimal128(int_at(i)); });
    }
    case LogicalType::STR: {
      arrow::StringBuilder b(pool);
      if(col.UsesDictionary()) {
        return buildColumn(b, col, [&](int64_t i) -> const string & {
          return col.dictionary[ReadWireCode(vals + i*width, width)];
        });
      }
      const char *heap = (col.heap) ? reinterpret_cast<const char *>(col.heap->data()) : "";
      return buildColumn(b, col, [&](int64_t i) {
        int64_t start = ReadWireInt(vals + 4*i, 4);
        int64_t end   = ReadWireInt(vals + 4*(i+1), 4);
        return string(heap+start, end-start);
      });
    }
    case LogicalType::TIMESTAMP: {
      arrow::TimestampBuilder b(type, pool);
      return buildColumn(b, col, int_at);
    }
    case LogicalType::DATE: {
      arrow::Date32Builder b(pool);
      if(col.spec.encoding==Encoding::DATE_IN_DAYS)
        return buildColumn(b, col, [&](int64_t i) { return static_cast<int32_t>(int_at(i)); });
      return buildColumn(b, col, [&](int64_t i) { return static_cast<int32_t>(floorDiv(int_at(i), kSecondsPerDay)); });
    }
    case LogicalType::TIME: {
      arrow::Time32Builder b(type, pool);
      return buildColumn(b, col, [&](int64_t i) { return static_cast<int32_t>(int_at(i)); });
    }
  }
  return arrow::Status::Invalid("Encoded column '"+col.spec.name+"' has an unknown logical type");
}

} // namespace tabxfer
