// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/record_batch.h>
#include <arrow/scalar.h>
#include <arrow/table.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/TabularData.hh"

using namespace std;

namespace tabxfer {

string to_string(TabularData::Kind kind) {
  switch(kind) {
    case TabularData::Kind::ArrowTable:  return "ArrowTable";
    case TabularData::Kind::RecordBatch: return "RecordBatch";
    case TabularData::Kind::Rows:        return "Rows";
  }
  return "Unknown";
}

TabularData TabularData::FromTable(shared_ptr<arrow::Table> table) {
  TabularData d;
  d.kind_ = Kind::ArrowTable;
  d.table_ = std::move(table);
  return d;
}

TabularData TabularData::FromRecordBatch(shared_ptr<arrow::RecordBatch> batch) {
  TabularData d;
  d.kind_ = Kind::RecordBatch;
  d.batch_ = std::move(batch);
  return d;
}

TabularData TabularData::FromRows(RowSet rows, vector<string> column_names) {
  TabularData d;
  d.kind_ = Kind::Rows;
  d.rows_ = std::move(rows);
  d.names_ = std::move(column_names);
  return d;
}

/// @brief Number of columns (for rows: the supplied names, else the width of the first row)
int TabularData::num_columns() const {
  switch(kind_) {
    case Kind::ArrowTable:  return (table_) ? table_->num_columns() : 0;
    case Kind::RecordBatch: return (batch_) ? batch_->num_columns() : 0;
    case Kind::Rows:
      if(!names_.empty()) return static_cast<int>(names_.size());
      return (rows_.empty()) ? 0 : static_cast<int>(rows_[0].size());
  }
  return 0;
}

int64_t TabularData::num_rows() const {
  switch(kind_) {
    case Kind::ArrowTable:  return (table_) ? table_->num_rows() : 0;
    case Kind::RecordBatch: return (batch_) ? batch_->num_rows() : 0;
    case Kind::Rows:        return static_cast<int64_t>(rows_.size());
  }
  return 0;
}

vector<string> TabularData::column_names() const {
  switch(kind_) {
    case Kind::ArrowTable:  return (table_) ? table_->schema()->field_names() : vector<string>();
    case Kind::RecordBatch: return (batch_) ? batch_->schema()->field_names() : vector<string>();
    case Kind::Rows:        break;
  }
  if(!names_.empty()) return names_;
  vector<string> names;
  for(int i=0; i<num_columns(); i++)
    names.push_back("c"+std::to_string(i));
  return names;
}

/**
 * @brief Get the data as an Arrow table
 * @return The table. Record batches are wrapped. Rows are gathered into
 *         columns typed after their first non-null value (all-null columns
 *         become Arrow null columns)
 * @retval SchemaMismatch A row has the wrong number of values
 * @retval TypeMismatch Values in one column have different types
 */
arrow::Result<shared_ptr<arrow::Table>> TabularData::ToTable() const {

  if(kind_==Kind::ArrowTable) {
    if(!table_) return arrow::Status::Invalid("TabularData holds a null table");
    return table_;
  }
  if(kind_==Kind::RecordBatch) {
    if(!batch_) return arrow::Status::Invalid("TabularData holds a null record batch");
    return arrow::Table::FromRecordBatches(batch_->schema(), {batch_});
  }

  int ncols = num_columns();
  auto names = column_names();
  for(size_t r=0; r<rows_.size(); r++) {
    if(static_cast<int>(rows_[r].size())!=ncols)
      return MakeError(ErrorCode::SchemaMismatch, "Row "+std::to_string(r)+" has "+std::to_string(rows_[r].size())+
                                                  " values but the data has "+std::to_string(ncols)+" columns");
  }

  arrow::FieldVector fields;
  arrow::ArrayVector arrays;
  for(int c=0; c<ncols; c++) {

    shared_ptr<arrow::DataType> type = arrow::null();
    for(auto &row : rows_) {
      if(row[c] && row[c]->is_valid) { type = row[c]->type; break; }
    }

    ARROW_ASSIGN_OR_RAISE(auto builder, arrow::MakeBuilder(type));
    ARROW_RETURN_NOT_OK(builder->Reserve(static_cast<int64_t>(rows_.size())));
    for(size_t r=0; r<rows_.size(); r++) {
      const auto &value = rows_[r][c];
      if(!value || !value->is_valid) {
        ARROW_RETURN_NOT_OK(builder->AppendNull());
        continue;
      }
      if(!value->type->Equals(*type))
        return MakeError(ErrorCode::TypeMismatch, "Column '"+names[c]+"' row "+std::to_string(r)+" holds "+
                                                  value->type->ToString()+" but earlier rows hold "+type->ToString());
      ARROW_RETURN_NOT_OK(builder->AppendScalar(*value));
    }
    shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder->Finish(&array));
    fields.push_back(arrow::field(names[c], type));
    arrays.push_back(array);
  }
  return arrow::Table::Make(arrow::schema(fields), arrays, static_cast<int64_t>(rows_.size()));
}

/**
 * @brief Get the data as an Arrow table whose columns already have the target types
 * @param specs The target table's columns, in source column order
 * @return Arrow data is returned as is (the column encoder coerces it). Rows
 *         are converted value by value through their text form, so a column
 *         may mix compatible scalar types (eg int64 and double for a DOUBLE)
 * @retval SchemaMismatch Row width doesn't match the number of specs
 * @retval TypeMismatch A value can't be parsed as its column's type
 */
arrow::Result<shared_ptr<arrow::Table>> TabularData::ToTable(const vector<ColumnSpec> &specs) const {

  if(kind_!=Kind::Rows) return ToTable();

  for(size_t r=0; r<rows_.size(); r++) {
    if(rows_[r].size()!=specs.size())
      return MakeError(ErrorCode::SchemaMismatch, "Row "+std::to_string(r)+" has "+std::to_string(rows_[r].size())+
                                                  " values but the table has "+std::to_string(specs.size())+" columns");
  }

  ARROW_ASSIGN_OR_RAISE(auto schema, ArrowSchemaForSpecs(specs));
  arrow::ArrayVector arrays;
  for(size_t c=0; c<specs.size(); c++) {
    ARROW_ASSIGN_OR_RAISE(auto builder, arrow::MakeBuilder(schema->field(c)->type()));
    ARROW_RETURN_NOT_OK(builder->Reserve(static_cast<int64_t>(rows_.size())));
    for(auto &row : rows_) {
      RowValue text = RowValue::Null();
      if(row[c]) {
        ARROW_ASSIGN_OR_RAISE(text, FormatRowValue(*row[c]));
      }
      ARROW_ASSIGN_OR_RAISE(auto value, ParseRowValue(text, specs[c]));
      if(value->is_valid) {
        ARROW_RETURN_NOT_OK(builder->AppendScalar(*value));
      } else {
        ARROW_RETURN_NOT_OK(builder->AppendNull());
      }
    }
    shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder->Finish(&array));
    arrays.push_back(array);
  }
  return arrow::Table::Make(schema, arrays, static_cast<int64_t>(rows_.size()));
}

/**
 * @brief Render every row in the text form used by row-wise loads
 * @return One WireRow per source row, in source order
 */
arrow::Result<vector<WireRow>> TabularData::ToWireRows() const {

  vector<WireRow> out;
  out.reserve(num_rows());

  if(kind_==Kind::Rows) {
    for(auto &row : rows_) {
      WireRow wrow;
      for(auto &value : row) {
        if(!value) { wrow.push_back(RowValue::Null()); continue; }
        ARROW_ASSIGN_OR_RAISE(auto rv, FormatRowValue(*value));
        wrow.push_back(std::move(rv));
      }
      out.push_back(std::move(wrow));
    }
    return out;
  }

  ARROW_ASSIGN_OR_RAISE(auto table, ToTable());
  for(int64_t r=0; r<table->num_rows(); r++) {
    WireRow wrow;
    for(int c=0; c<table->num_columns(); c++) {
      ARROW_ASSIGN_OR_RAISE(auto scalar, table->column(c)->GetScalar(r));
      ARROW_ASSIGN_OR_RAISE(auto rv, FormatRowValue(*scalar));
      wrow.push_back(std::move(rv));
    }
    out.push_back(std::move(wrow));
  }
  return out;
}

/// @brief Infer the server schema a table created from this data should have
arrow::Result<vector<ColumnSpec>> TabularData::InferColumnSpecs() const {
  ARROW_ASSIGN_OR_RAISE(auto table, ToTable());
  vector<ColumnSpec> specs;
  for(auto &field : table->schema()->fields()) {
    if(field->type()->id()==arrow::Type::NA)
      return MakeError(ErrorCode::TypeMismatch, "Column '"+field->name()+"' holds only nulls, so its type can't be inferred");
    ARROW_ASSIGN_OR_RAISE(auto spec, SpecForArrowField(*field));
    specs.push_back(std::move(spec));
  }
  return specs;
}

} // namespace tabxfer
