// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_LOAD_COLUMNSPEC_HH
#define TABXFER_LOAD_COLUMNSPEC_HH

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/result.h>
#include <arrow/type_fwd.h>


namespace tabxfer {

/**
 * @brief Logical column types the server understands
 */
enum class LogicalType : uint8_t {
  BOOL=0,
  TINYINT,
  SMALLINT,
  INT,
  BIGINT,
  FLOAT,
  DOUBLE,
  DECIMAL,
  STR,
  TIME,
  TIMESTAMP,
  DATE
};
std::string to_string(LogicalType type);

/**
 * @brief Storage encodings the server reports for a column
 */
enum class Encoding : uint8_t {
  NONE=0,
  FIXED,        //!< Integer narrowed to comp_param bits
  DICT,         //!< String stored as comp_param-bit dictionary codes
  DATE_IN_DAYS  //!< Date stored as comp_param-bit day counts
};
std::string to_string(Encoding encoding);


/**
 * @brief Server-declared type and storage metadata for one column
 *
 * Precision is the decimal precision for DECIMAL and the sub-second digits
 * (0, 3, 6, 9) for TIMESTAMP. comp_param is a bit width whose meaning depends
 * on the encoding. A value of 0 selects the natural width.
 */
struct ColumnSpec {
  std::string name;
  LogicalType type = LogicalType::INT;
  bool nullable = true;
  int precision = 0;
  int scale = 0;
  int comp_param = 0;
  Encoding encoding = Encoding::NONE;

  ColumnSpec() = default;
  ColumnSpec(std::string name, LogicalType type, bool nullable=true,
             int precision=0, int scale=0, int comp_param=0, Encoding encoding=Encoding::NONE)
    : name(std::move(name)), type(type), nullable(nullable), precision(precision),
      scale(scale), comp_param(comp_param), encoding(encoding) {}

  bool operator==(const ColumnSpec &other) const;
  bool operator!=(const ColumnSpec &other) const { return !(*this==other); }

  std::string str() const;
};

arrow::Result<int> WireWidth(const ColumnSpec &spec);

arrow::Result<std::shared_ptr<arrow::DataType>> ArrowTypeForSpec(const ColumnSpec &spec);
arrow::Result<std::shared_ptr<arrow::Schema>> ArrowSchemaForSpecs(const std::vector<ColumnSpec> &specs);

arrow::Result<ColumnSpec> SpecForArrowField(const arrow::Field &field);
arrow::Result<std::vector<ColumnSpec>> InferColumnSpecs(const arrow::Schema &schema);

} // namespace tabxfer

#endif // TABXFER_LOAD_COLUMNSPEC_HH
