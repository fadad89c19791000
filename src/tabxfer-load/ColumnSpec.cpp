// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <sstream>

#include <arrow/type.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/ColumnSpec.hh"

using namespace std;

namespace tabxfer {

string to_string(LogicalType type) {
  switch(type) {
    case LogicalType::BOOL:      return "BOOL";
    case LogicalType::TINYINT:   return "TINYINT";
    case LogicalType::SMALLINT:  return "SMALLINT";
    case LogicalType::INT:       return "INT";
    case LogicalType::BIGINT:    return "BIGINT";
    case LogicalType::FLOAT:     return "FLOAT";
    case LogicalType::DOUBLE:    return "DOUBLE";
    case LogicalType::DECIMAL:   return "DECIMAL";
    case LogicalType::STR:       return "STR";
    case LogicalType::TIME:      return "TIME";
    case LogicalType::TIMESTAMP: return "TIMESTAMP";
    case LogicalType::DATE:      return "DATE";
  }
  return "Unknown("+std::to_string(static_cast<int>(type))+")";
}

string to_string(Encoding encoding) {
  switch(encoding) {
    case Encoding::NONE:         return "NONE";
    case Encoding::FIXED:        return "FIXED";
    case Encoding::DICT:         return "DICT";
    case Encoding::DATE_IN_DAYS: return "DATE_IN_DAYS";
  }
  return "Unknown("+std::to_string(static_cast<int>(encoding))+")";
}

bool ColumnSpec::operator==(const ColumnSpec &other) const {
  return (name==other.name) &&
         (type==other.type) &&
         (nullable==other.nullable) &&
         (precision==other.precision) &&
         (scale==other.scale) &&
         (comp_param==other.comp_param) &&
         (encoding==other.encoding);
}

string ColumnSpec::str() const {
  stringstream ss;
  ss << name << " " << to_string(type);
  if(type==LogicalType::DECIMAL)   ss << "(" << precision << "," << scale << ")";
  if(type==LogicalType::TIMESTAMP) ss << "(" << precision << ")";
  if(!nullable) ss << " NOT NULL";
  if(encoding!=Encoding::NONE) ss << " ENCODING " << to_string(encoding) << "(" << comp_param << ")";
  return ss.str();
}

namespace {

arrow::Status badSpec(const ColumnSpec &spec, const string &why) {
  return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' ("+spec.str()+"): "+why);
}

int naturalIntegerWidth(LogicalType type) {
  switch(type) {
    case LogicalType::TINYINT:  return 1;
    case LogicalType::SMALLINT: return 2;
    case LogicalType::INT:      return 4;
    default:                    return 8;
  }
}

} // namespace

/**
 * @brief Determine how many bytes each row occupies in a column's value buffer
 * @param[in] spec The column description
 * @return Bytes per row (string offsets count as 4), or TypeMismatch for encodings the type can't use
 */
arrow::Result<int> WireWidth(const ColumnSpec &spec) {

  switch(spec.type) {
    case LogicalType::BOOL:
      return 1;

    case LogicalType::TINYINT:
    case LogicalType::SMALLINT:
    case LogicalType::INT:
    case LogicalType::BIGINT: {
      int natural = naturalIntegerWidth(spec.type);
      if(spec.encoding==Encoding::NONE) return natural;
      if(spec.encoding!=Encoding::FIXED) return badSpec(spec, "integers only support NONE or FIXED encoding");
      if(spec.comp_param==0) return natural;
      if((spec.comp_param!=8) && (spec.comp_param!=16) && (spec.comp_param!=32))
        return badSpec(spec, "FIXED encoding needs 8, 16, or 32 bits");
      if(spec.comp_param/8 >= natural) return badSpec(spec, "FIXED encoding must be narrower than the type");
      return spec.comp_param/8;
    }

    case LogicalType::FLOAT:   return 4;
    case LogicalType::DOUBLE:  return 8;
    case LogicalType::DECIMAL:
      if(spec.precision>18) return badSpec(spec, "DECIMAL precision above 18 does not fit in 64 bits");
      if((spec.scale<0) || (spec.scale>spec.precision)) return badSpec(spec, "DECIMAL scale must be between 0 and precision");
      return 8;

    case LogicalType::STR:
      if(spec.encoding==Encoding::NONE) return 4;
      if(spec.encoding!=Encoding::DICT) return badSpec(spec, "strings only support NONE or DICT encoding");
      if(spec.comp_param==0) return 4;
      if((spec.comp_param!=8) && (spec.comp_param!=16) && (spec.comp_param!=32))
        return badSpec(spec, "DICT encoding needs 8, 16, or 32 bit codes");
      return spec.comp_param/8;

    case LogicalType::TIMESTAMP:
      if((spec.precision!=0) && (spec.precision!=3) && (spec.precision!=6) && (spec.precision!=9))
        return badSpec(spec, "TIMESTAMP precision must be 0, 3, 6, or 9");
      return 8;

    case LogicalType::DATE:
      if(spec.encoding==Encoding::NONE) return 8;
      if(spec.encoding!=Encoding::DATE_IN_DAYS) return badSpec(spec, "dates only support NONE or DATE_IN_DAYS encoding");
      if(spec.comp_param==16) return 2;
      if((spec.comp_param==0) || (spec.comp_param==32)) return 4;
      return badSpec(spec, "DATE_IN_DAYS encoding needs 16 or 32 bits");

    case LogicalType::TIME:
      return 8;
  }
  return badSpec(spec, "unknown logical type");
}

/**
 * @brief Get the canonical Arrow type a decoded column of this spec takes
 * @param[in] spec The column description
 * @return Arrow data type, or TypeMismatch if the spec is malformed
 * @note Strings always come back as plain utf8, regardless of DICT encoding
 */
arrow::Result<std::shared_ptr<arrow::DataType>> ArrowTypeForSpec(const ColumnSpec &spec) {

  ARROW_RETURN_NOT_OK(WireWidth(spec).status());

  switch(spec.type) {
    case LogicalType::BOOL:      return arrow::boolean();
    case LogicalType::TINYINT:   return arrow::int8();
    case LogicalType::SMALLINT:  return arrow::int16();
    case LogicalType::INT:       return arrow::int32();
    case LogicalType::BIGINT:    return arrow::int64();
    case LogicalType::FLOAT:     return arrow::float32();
    case LogicalType::DOUBLE:    return arrow::float64();
    case LogicalType::DECIMAL:   return arrow::decimal128((spec.precision==0) ? 18 : spec.precision, spec.scale);
    case LogicalType::STR:       return arrow::utf8();
    case LogicalType::TIME:      return arrow::time32(arrow::TimeUnit::SECOND);
    case LogicalType::DATE:      return arrow::date32();
    case LogicalType::TIMESTAMP:
      switch(spec.precision) {
        case 3:  return arrow::timestamp(arrow::TimeUnit::MILLI);
        case 6:  return arrow::timestamp(arrow::TimeUnit::MICRO);
        case 9:  return arrow::timestamp(arrow::TimeUnit::NANO);
        default: return arrow::timestamp(arrow::TimeUnit::SECOND);
      }
  }
  return badSpec(spec, "unknown logical type");
}

/// @brief Build the Arrow schema that a table of these columns decodes into
arrow::Result<std::shared_ptr<arrow::Schema>> ArrowSchemaForSpecs(const vector<ColumnSpec> &specs) {
  arrow::FieldVector fields;
  for(auto &spec : specs) {
    ARROW_ASSIGN_OR_RAISE(auto type, ArrowTypeForSpec(spec));
    fields.push_back(arrow::field(spec.name, type, spec.nullable));
  }
  return arrow::schema(fields);
}

/**
 * @brief Pick the column spec a server should create for an Arrow field
 * @param[in] field The source field
 * @return A spec, or TypeMismatch if the field's type has no server equivalent
 *
 * Strings become 32-bit dictionary columns and dates become 32-bit day
 * counts. Unsigned integers move up one size so every value fits.
 */
arrow::Result<ColumnSpec> SpecForArrowField(const arrow::Field &field) {

  ColumnSpec spec;
  spec.name = field.name();
  spec.nullable = field.nullable();

  const auto &type = *field.type();
  switch(type.id()) {
    case arrow::Type::BOOL:   spec.type = LogicalType::BOOL;     break;
    case arrow::Type::INT8:   spec.type = LogicalType::TINYINT;  break;
    case arrow::Type::INT16:
    case arrow::Type::UINT8:  spec.type = LogicalType::SMALLINT; break;
    case arrow::Type::INT32:
    case arrow::Type::UINT16: spec.type = LogicalType::INT;      break;
    case arrow::Type::INT64:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64: spec.type = LogicalType::BIGINT;   break;
    case arrow::Type::FLOAT:  spec.type = LogicalType::FLOAT;    break;
    case arrow::Type::DOUBLE: spec.type = LogicalType::DOUBLE;   break;

    case arrow::Type::DECIMAL128: {
      const auto &dt = static_cast<const arrow::Decimal128Type &>(type);
      if(dt.precision()>18)
        return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' has decimal precision "+std::to_string(dt.precision())+", only 18 digits are supported");
      spec.type = LogicalType::DECIMAL;
      spec.precision = dt.precision();
      spec.scale = dt.scale();
      break;
    }

    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      spec.type = LogicalType::STR;
      spec.encoding = Encoding::DICT;
      spec.comp_param = 32;
      break;

    case arrow::Type::DICTIONARY: {
      const auto &dt = static_cast<const arrow::DictionaryType &>(type);
      auto vid = dt.value_type()->id();
      if((vid!=arrow::Type::STRING) && (vid!=arrow::Type::LARGE_STRING))
        return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' is a dictionary of "+dt.value_type()->ToString()+", only string dictionaries are supported");
      spec.type = LogicalType::STR;
      spec.encoding = Encoding::DICT;
      spec.comp_param = 32;
      break;
    }

    case arrow::Type::TIMESTAMP: {
      const auto &dt = static_cast<const arrow::TimestampType &>(type);
      spec.type = LogicalType::TIMESTAMP;
      switch(dt.unit()) {
        case arrow::TimeUnit::SECOND: spec.precision = 0; break;
        case arrow::TimeUnit::MILLI:  spec.precision = 3; break;
        case arrow::TimeUnit::MICRO:  spec.precision = 6; break;
        case arrow::TimeUnit::NANO:   spec.precision = 9; break;
      }
      break;
    }

    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
      spec.type = LogicalType::DATE;
      spec.encoding = Encoding::DATE_IN_DAYS;
      spec.comp_param = 32;
      break;

    case arrow::Type::TIME32:
    case arrow::Type::TIME64:
      spec.type = LogicalType::TIME;
      break;

    default:
      return MakeError(ErrorCode::TypeMismatch, "Column '"+spec.name+"' has type "+type.ToString()+", which has no server column type");
  }
  return spec;
}

/**
 * @brief Infer a server schema that matches an Arrow schema column for column
 * @param[in] schema The source schema
 * @return One spec per field, in field order
 */
arrow::Result<vector<ColumnSpec>> InferColumnSpecs(const arrow::Schema &schema) {
  vector<ColumnSpec> specs;
  for(auto &field : schema.fields()) {
    ARROW_ASSIGN_OR_RAISE(auto spec, SpecForArrowField(*field));
    specs.push_back(std::move(spec));
  }
  return specs;
}

} // namespace tabxfer
