// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

#include <arrow/scalar.h>
#include <arrow/type.h>
#include <arrow/util/decimal.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-common/StringHelpers.hh"
#include "tabxfer-load/RowValue.hh"

using namespace std;

namespace tabxfer {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t floorDiv(int64_t a, int64_t b) {
  int64_t q = a/b;
  if(((a%b)!=0) && ((a<0)!=(b<0))) q--;
  return q;
}

int64_t powerOf10(int exponent) {
  int64_t v=1;
  for(int i=0; i<exponent; i++) v*=10;
  return v;
}

int digitsForUnit(arrow::TimeUnit::type unit) {
  switch(unit) {
    case arrow::TimeUnit::SECOND: return 0;
    case arrow::TimeUnit::MILLI:  return 3;
    case arrow::TimeUnit::MICRO:  return 6;
    case arrow::TimeUnit::NANO:   return 9;
  }
  return 0;
}

//Proleptic Gregorian conversions (days are counted from 1970-01-01)
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= (m <= 2);
  const int64_t era = floorDiv(y, 400);
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153*(m + (m > 2 ? -3 : 9)) + 2)/5 + d-1;
  const unsigned doe = yoe * 365 + yoe/4 - yoe/100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t *y, unsigned *m, unsigned *d) {
  z += 719468;
  const int64_t era = floorDiv(z, 146097);
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
  const unsigned mp = (5*doy + 2)/153;
  *d = doy - (153*mp+2)/5 + 1;
  *m = mp < 10 ? mp+3 : mp-9;
  *y = static_cast<int64_t>(yoe) + era * 400 + (*m <= 2);
}

string fraction(int64_t frac, int digits) {
  if(digits==0) return "";
  stringstream ss;
  ss << "." << setw(digits) << setfill('0') << frac;
  return ss.str();
}

arrow::Status badText(const ColumnSpec &spec, const string &text) {
  return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' ("+to_string(spec.type)+") cannot parse value '"+text+"'");
}

/// Read exactly n digits starting at pos
bool readDigits(const string &s, size_t &pos, int n, int64_t *out) {
  if(pos+n > s.size()) return false;
  int64_t v=0;
  for(int i=0; i<n; i++) {
    char c = s[pos+i];
    if((c<'0') || (c>'9')) return false;
    v = v*10 + (c-'0');
  }
  pos += n;
  *out = v;
  return true;
}

bool expect(const string &s, size_t &pos, char c) {
  if((pos>=s.size()) || (s[pos]!=c)) return false;
  pos++;
  return true;
}

/// Parse "HH:MM:SS[.fff]" at pos into ticks at 10^digits per second
bool parseTimeOfDay(const string &s, size_t &pos, int digits, int64_t *ticks) {
  int64_t hh, mm, ss;
  if(!readDigits(s, pos, 2, &hh) || !expect(s, pos, ':') ||
     !readDigits(s, pos, 2, &mm) || !expect(s, pos, ':') ||
     !readDigits(s, pos, 2, &ss)) return false;
  if((hh>23) || (mm>59) || (ss>60)) return false;
  int64_t frac=0;
  if((pos<s.size()) && (s[pos]=='.')) {
    pos++;
    int n=0;
    while((pos<s.size()) && isdigit(static_cast<unsigned char>(s[pos]))) {
      if(n<digits) frac = frac*10 + (s[pos]-'0');
      n++; pos++;
    }
    if(n==0) return false;
    for(; n<digits; n++) frac*=10;
  }
  *ticks = (hh*3600 + mm*60 + ss) * powerOf10(digits) + frac;
  return true;
}

int64_t daysInMonth(int64_t y, int64_t m) {
  static const int64_t days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
  bool leap = ((y%4==0) && (y%100!=0)) || (y%400==0);
  return ((m==2) && leap) ? 29 : days[m-1];
}

/// Parse "YYYY-MM-DD" at pos into days since the epoch
bool parseDate(const string &s, size_t &pos, int64_t *days) {
  int64_t y, m, d;
  if(!readDigits(s, pos, 4, &y) || !expect(s, pos, '-') ||
     !readDigits(s, pos, 2, &m) || !expect(s, pos, '-') ||
     !readDigits(s, pos, 2, &d)) return false;
  if((m<1) || (m>12) || (d<1) || (d>daysInMonth(y, m))) return false;
  *days = daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
  return true;
}

/// Parse a date with an optional time of day into ticks at 10^digits per second
bool parseDateTime(const string &s, int digits, int64_t *ticks) {
  size_t pos=0;
  int64_t days;
  if(!parseDate(s, pos, &days)) return false;
  int64_t tod=0;
  if(pos<s.size()) {
    if((s[pos]!=' ') && (s[pos]!='T')) return false;
    pos++;
    if(!parseTimeOfDay(s, pos, digits, &tod)) return false;
  }
  if(pos!=s.size()) return false;
  //Dates far enough out overflow 64 bits at fine precisions
  int64_t day_ticks;
  if(__builtin_mul_overflow(days, kSecondsPerDay * powerOf10(digits), &day_ticks)) return false;
  return !__builtin_add_overflow(day_ticks, tod, ticks);
}

bool parseInteger(const string &s, int64_t *out) {
  if(s.empty()) return false;
  errno=0;
  char *end=nullptr;
  long long v = strtoll(s.c_str(), &end, 10);
  if((errno!=0) || (*end!='\0')) return false;
  *out = v;
  return true;
}

} // namespace


string FormatDate(int64_t days_since_epoch) {
  int64_t y; unsigned m, d;
  civilFromDays(days_since_epoch, &y, &m, &d);
  char buf[32];
  snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
  return buf;
}

string FormatTimeOfDay(int64_t ticks, int digits) {
  int64_t tps = powerOf10(digits);
  int64_t secs = floorDiv(ticks, tps);
  int64_t frac = ticks - secs*tps;
  char buf[32];
  snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
           static_cast<long long>(secs/3600), static_cast<long long>((secs/60)%60), static_cast<long long>(secs%60));
  return buf + fraction(frac, digits);
}

string FormatTimestamp(int64_t ticks, int digits) {
  int64_t tps = powerOf10(digits);
  int64_t days = floorDiv(ticks, kSecondsPerDay*tps);
  int64_t tod  = ticks - days*kSecondsPerDay*tps;
  return FormatDate(days) + " " + FormatTimeOfDay(tod, digits);
}

/**
 * @brief Render one Arrow value in the text form used by row-wise loads
 * @param[in] value A scalar from a row (nulls become RowValue::Null())
 * @return The text form, or TypeMismatch for types with no text form
 */
arrow::Result<RowValue> FormatRowValue(const arrow::Scalar &value) {

  if(!value.is_valid) return RowValue::Null();

  const auto &type = *value.type;
  switch(type.id()) {
    case arrow::Type::BOOL:   return RowValue(static_cast<const arrow::BooleanScalar &>(value).value ? "true" : "false");
    case arrow::Type::INT8:   return RowValue(std::to_string(static_cast<const arrow::Int8Scalar &>(value).value));
    case arrow::Type::INT16:  return RowValue(std::to_string(static_cast<const arrow::Int16Scalar &>(value).value));
    case arrow::Type::INT32:  return RowValue(std::to_string(static_cast<const arrow::Int32Scalar &>(value).value));
    case arrow::Type::INT64:  return RowValue(std::to_string(static_cast<const arrow::Int64Scalar &>(value).value));
    case arrow::Type::UINT8:  return RowValue(std::to_string(static_cast<const arrow::UInt8Scalar &>(value).value));
    case arrow::Type::UINT16: return RowValue(std::to_string(static_cast<const arrow::UInt16Scalar &>(value).value));
    case arrow::Type::UINT32: return RowValue(std::to_string(static_cast<const arrow::UInt32Scalar &>(value).value));
    case arrow::Type::UINT64: return RowValue(std::to_string(static_cast<const arrow::UInt64Scalar &>(value).value));

    case arrow::Type::FLOAT: {
      stringstream ss;
      ss << setprecision(numeric_limits<float>::max_digits10) << static_cast<const arrow::FloatScalar &>(value).value;
      return RowValue(ss.str());
    }
    case arrow::Type::DOUBLE: {
      stringstream ss;
      ss << setprecision(numeric_limits<double>::max_digits10) << static_cast<const arrow::DoubleScalar &>(value).value;
      return RowValue(ss.str());
    }
    case arrow::Type::DECIMAL128: {
      int scale = static_cast<const arrow::Decimal128Type &>(type).scale();
      return RowValue(static_cast<const arrow::Decimal128Scalar &>(value).value.ToString(scale));
    }

    case arrow::Type::STRING:       return RowValue(static_cast<const arrow::StringScalar &>(value).value->ToString());
    case arrow::Type::LARGE_STRING: return RowValue(static_cast<const arrow::LargeStringScalar &>(value).value->ToString());
    case arrow::Type::DICTIONARY: {
      ARROW_ASSIGN_OR_RAISE(auto decoded, static_cast<const arrow::DictionaryScalar &>(value).GetEncodedValue());
      return FormatRowValue(*decoded);
    }

    case arrow::Type::TIMESTAMP: {
      int digits = digitsForUnit(static_cast<const arrow::TimestampType &>(type).unit());
      return RowValue(FormatTimestamp(static_cast<const arrow::TimestampScalar &>(value).value, digits));
    }
    case arrow::Type::DATE32:
      return RowValue(FormatDate(static_cast<const arrow::Date32Scalar &>(value).value));
    case arrow::Type::DATE64:
      return RowValue(FormatDate(floorDiv(static_cast<const arrow::Date64Scalar &>(value).value, kSecondsPerDay*1000)));
    case arrow::Type::TIME32: {
      int digits = digitsForUnit(static_cast<const arrow::Time32Type &>(type).unit());
      return RowValue(FormatTimeOfDay(static_cast<const arrow::Time32Scalar &>(value).value, digits));
    }
    case arrow::Type::TIME64: {
      int digits = digitsForUnit(static_cast<const arrow::Time64Type &>(type).unit());
      return RowValue(FormatTimeOfDay(static_cast<const arrow::Time64Scalar &>(value).value, digits));
    }
    default:
      break;
  }
  return MakeError(ErrorCode::TypeMismatch, "No text form for values of type "+type.ToString());
}

/**
 * @brief Parse the text form of a row-wise value into the column's canonical Arrow scalar
 * @param[in] value Text and null flag from the row
 * @param[in] spec The target column
 * @retval TypeMismatch The text doesn't parse, is out of range, or is null for a NOT NULL column
 * @return A scalar of ArrowTypeForSpec(spec)
 */
arrow::Result<std::shared_ptr<arrow::Scalar>> ParseRowValue(const RowValue &value, const ColumnSpec &spec) {

  ARROW_ASSIGN_OR_RAISE(auto type, ArrowTypeForSpec(spec));

  if(value.is_null) {
    if(!spec.nullable)
      return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' is NOT NULL but received a null");
    return arrow::MakeNullScalar(type);
  }

  const string &s = value.str_val;
  switch(spec.type) {
    case LogicalType::BOOL: {
      bool b;
      if(StringToBoolean(&b, s)!=0) return badText(spec, s);
      return std::make_shared<arrow::BooleanScalar>(b);
    }

    case LogicalType::TINYINT:
    case LogicalType::SMALLINT:
    case LogicalType::INT:
    case LogicalType::BIGINT: {
      int64_t v;
      if(!parseInteger(s, &v)) return badText(spec, s);
      switch(spec.type) {
        case LogicalType::TINYINT:
          if((v<numeric_limits<int8_t>::min()) || (v>numeric_limits<int8_t>::max())) return badText(spec, s);
          return std::make_shared<arrow::Int8Scalar>(static_cast<int8_t>(v));
        case LogicalType::SMALLINT:
          if((v<numeric_limits<int16_t>::min()) || (v>numeric_limits<int16_t>::max())) return badText(spec, s);
          return std::make_shared<arrow::Int16Scalar>(static_cast<int16_t>(v));
        case LogicalType::INT:
          if((v<numeric_limits<int32_t>::min()) || (v>numeric_limits<int32_t>::max())) return badText(spec, s);
          return std::make_shared<arrow::Int32Scalar>(static_cast<int32_t>(v));
        default:
          return std::make_shared<arrow::Int64Scalar>(v);
      }
    }

    case LogicalType::FLOAT:
    case LogicalType::DOUBLE: {
      if(s.empty()) return badText(spec, s);
      char *end=nullptr;
      double d = strtod(s.c_str(), &end);
      if(*end!='\0') return badText(spec, s);
      if(spec.type==LogicalType::FLOAT) return std::make_shared<arrow::FloatScalar>(static_cast<float>(d));
      return std::make_shared<arrow::DoubleScalar>(d);
    }

    case LogicalType::DECIMAL: {
      arrow::Decimal128 dec;
      int32_t precision=0, scale=0;
      if(!arrow::Decimal128::FromString(s, &dec, &precision, &scale).ok()) return badText(spec, s);
      if(scale < spec.scale)      dec = arrow::Decimal128(dec.IncreaseScaleBy(spec.scale - scale));
      else if(scale > spec.scale) dec = arrow::Decimal128(dec.ReduceScaleBy(scale - spec.scale, true));
      auto dtype = std::static_pointer_cast<arrow::Decimal128Type>(type);
      if(!dec.FitsInPrecision(dtype->precision())) return badText(spec, s);
      return std::make_shared<arrow::Decimal128Scalar>(dec, type);
    }

    case LogicalType::STR:
      return std::make_shared<arrow::StringScalar>(s);

    case LogicalType::TIMESTAMP: {
      int64_t ticks;
      if(!parseDateTime(s, spec.precision, &ticks)) {
        //Also take a raw count at the column's precision
        if(!parseInteger(s, &ticks)) return badText(spec, s);
      }
      return std::make_shared<arrow::TimestampScalar>(ticks, type);
    }

    case LogicalType::DATE: {
      int64_t secs;
      if(!parseDateTime(s, 0, &secs)) return badText(spec, s);
      return std::make_shared<arrow::Date32Scalar>(static_cast<int32_t>(floorDiv(secs, kSecondsPerDay)));
    }

    case LogicalType::TIME: {
      size_t pos=0;
      int64_t secs;
      if(!parseTimeOfDay(s, pos, 0, &secs) || (pos!=s.size())) return badText(spec, s);
      return std::make_shared<arrow::Time32Scalar>(static_cast<int32_t>(secs), type);
    }
  }
  return badText(spec, s);
}

} // namespace tabxfer
