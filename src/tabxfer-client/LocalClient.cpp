// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <algorithm>
#include <set>

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/scalar.h>
#include <arrow/table.h>

#include "tabxfer-common/Status.hh"
#include "tabxfer-common/StringHelpers.hh"
#include "tabxfer-ipc/ArrowStream.hh"
#include "tabxfer-client/LocalClient.hh"

using namespace std;

namespace tabxfer {

namespace {
//Collapse whitespace and drop trailing semicolons so equivalent query text matches
vector<string> queryTokens(const string &query) {
  string flat = query;
  replace_if(flat.begin(), flat.end(), [](char c) { return (c=='\t') || (c=='\n') || (c=='\r'); }, ' ');
  while((!flat.empty()) && ((flat.back()==';') || (flat.back()==' '))) flat.pop_back();
  return Split(flat, ' ');
}
}

LocalClient::LocalClient(const Configuration &config)
  : LoggingInterface("localclient") {
  ConfigureLogging(config);
}

LocalClient::~LocalClient() {
  lock_guard<std::mutex> lock(mtx);
  if(!results.empty())
    warn("Removing "+std::to_string(results.size())+" results that were never deallocated");
  //Segment destructors remove whatever is left
}

arrow::Result<vector<string>> LocalClient::GetTableList() {
  lock_guard<std::mutex> lock(mtx);
  vector<string> names;
  for(auto &name_table : tables)
    names.push_back(name_table.first);
  return names;
}

arrow::Result<vector<ColumnSpec>> LocalClient::GetColumnSpecs(const string &table_name) {
  lock_guard<std::mutex> lock(mtx);
  ARROW_ASSIGN_OR_RAISE(auto t, findTable_locked(table_name));
  return t->specs;
}

/**
 * @brief Create an empty table with the given columns
 * @retval TableExists A table with this name is already present
 * @retval Invalid No columns, or two columns share a name
 */
arrow::Status LocalClient::CreateTable(const string &table_name, const vector<ColumnSpec> &specs) {

  if(table_name.empty()) return arrow::Status::Invalid("Table names can't be empty");
  if(specs.empty()) return arrow::Status::Invalid("Table '", table_name, "' needs at least one column");

  set<string> seen;
  for(auto &spec : specs) {
    if(!seen.insert(spec.name).second)
      return arrow::Status::Invalid("Table '", table_name, "' has more than one column named '", spec.name, "'");
  }

  ARROW_ASSIGN_OR_RAISE(auto schema, ArrowSchemaForSpecs(specs));
  arrow::ArrayVector empty;
  for(auto &field : schema->fields()) {
    ARROW_ASSIGN_OR_RAISE(auto array, arrow::MakeArrayOfNull(field->type(), 0));
    empty.push_back(array);
  }

  lock_guard<std::mutex> lock(mtx);
  if(tables.find(table_name)!=tables.end())
    return MakeError(ErrorCode::TableExists, "Table '"+table_name+"' already exists");

  table_t t;
  t.specs = specs;
  t.data = arrow::Table::Make(schema, empty, 0);
  tables[table_name] = t;
  info("Created table "+table_name+" with "+std::to_string(specs.size())+" columns");
  return arrow::Status::OK();
}

/// @brief Load one batch of columns in the binary wire layout
arrow::Status LocalClient::LoadColumnarBinary(const string &table_name,
                                              const vector<EncodedColumn> &columns,
                                              const vector<string> &column_names) {
  lock_guard<std::mutex> lock(mtx);
  ARROW_RETURN_NOT_OK(checkInjectedFailure_locked(table_name));
  ARROW_ASSIGN_OR_RAISE(auto t, findTable_locked(table_name));
  if(columns.empty()) return arrow::Status::Invalid("Columnar load into '", table_name, "' has no columns");
  ARROW_ASSIGN_OR_RAISE(auto targets, targetColumns(*t, column_names, columns.size()));

  int64_t num_rows = columns[0].length;
  arrow::ArrayVector arrays;
  for(size_t i=0; i<columns.size(); i++) {
    if(columns[i].length!=num_rows)
      return arrow::Status::Invalid("Columnar load into '", table_name, "' has columns of different lengths");
    if(columns[i].spec.type!=t->specs[targets[i]].type)
      return MakeError(ErrorCode::TypeMismatch, "Column '"+t->specs[targets[i]].name+"' is "+
                                                to_string(t->specs[targets[i]].type)+" but the load sent "+
                                                to_string(columns[i].spec.type));
    ARROW_ASSIGN_OR_RAISE(auto array, DecodeColumn(columns[i]));
    arrays.push_back(array);
  }
  return appendColumns_locked(table_name, t, targets, arrays, num_rows);
}

/// @brief Load a whole Arrow IPC stream. Each column is coerced to its target type
arrow::Status LocalClient::LoadArrowBinary(const string &table_name,
                                           const shared_ptr<arrow::Buffer> &arrow_stream,
                                           const vector<string> &column_names) {
  lock_guard<std::mutex> lock(mtx);
  ARROW_RETURN_NOT_OK(checkInjectedFailure_locked(table_name));
  ARROW_ASSIGN_OR_RAISE(auto t, findTable_locked(table_name));
  ARROW_ASSIGN_OR_RAISE(auto incoming, arrowstream::ReadTable(arrow_stream));
  ARROW_ASSIGN_OR_RAISE(auto targets, targetColumns(*t, column_names, incoming->num_columns()));

  arrow::ArrayVector arrays;
  for(int i=0; i<incoming->num_columns(); i++) {
    ARROW_ASSIGN_OR_RAISE(auto encoded, EncodeColumn(*incoming->column(i), t->specs[targets[i]]));
    ARROW_ASSIGN_OR_RAISE(auto array, DecodeColumn(encoded));
    arrays.push_back(array);
  }
  return appendColumns_locked(table_name, t, targets, arrays, incoming->num_rows());
}

/// @brief Load rows of text values, parsing each into its target column's type
arrow::Status LocalClient::LoadRowWise(const string &table_name,
                                       const vector<WireRow> &rows,
                                       const vector<string> &column_names) {
  lock_guard<std::mutex> lock(mtx);
  ARROW_RETURN_NOT_OK(checkInjectedFailure_locked(table_name));
  ARROW_ASSIGN_OR_RAISE(auto t, findTable_locked(table_name));

  size_t width = (!rows.empty()) ? rows[0].size()
                                 : ((column_names.empty()) ? t->specs.size() : column_names.size());
  ARROW_ASSIGN_OR_RAISE(auto targets, targetColumns(*t, column_names, width));

  vector<unique_ptr<arrow::ArrayBuilder>> builders;
  for(size_t i=0; i<width; i++) {
    ARROW_ASSIGN_OR_RAISE(auto type, ArrowTypeForSpec(t->specs[targets[i]]));
    ARROW_ASSIGN_OR_RAISE(auto builder, arrow::MakeBuilder(type));
    ARROW_RETURN_NOT_OK(builder->Reserve(static_cast<int64_t>(rows.size())));
    builders.push_back(std::move(builder));
  }

  for(size_t r=0; r<rows.size(); r++) {
    if(rows[r].size()!=width)
      return arrow::Status::Invalid("Row ", r, " has ", rows[r].size(), " values but the load has ", width, " columns");
    for(size_t i=0; i<width; i++) {
      ARROW_ASSIGN_OR_RAISE(auto value, ParseRowValue(rows[r][i], t->specs[targets[i]]));
      if(value->is_valid) {
        ARROW_RETURN_NOT_OK(builders[i]->AppendScalar(*value));
      } else {
        ARROW_RETURN_NOT_OK(builders[i]->AppendNull());
      }
    }
  }

  arrow::ArrayVector arrays;
  for(auto &builder : builders) {
    shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder->Finish(&array));
    arrays.push_back(array);
  }
  return appendColumns_locked(table_name, t, targets, arrays, static_cast<int64_t>(rows.size()));
}

/**
 * @brief Run a query and stage its result for the requested transport
 * @retval Invalid Unknown query or table, or a transport the device kind can't use
 * @note Inline and SharedSegment results are CPU results. DeviceSegment results are GPU results
 */
arrow::Result<ResultDescriptor> LocalClient::ExecuteQueryForResult(const string &query,
                                                                   DeviceKind device_kind, int device_id,
                                                                   int64_t row_limit, TransportMode transport) {
  bool device_ok = (transport==TransportMode::DeviceSegment) ? (device_kind==DeviceKind::GPU)
                                                             : (device_kind==DeviceKind::CPU);
  if(!device_ok)
    return arrow::Status::Invalid("Transport ", to_string(transport), " can't deliver ", to_string(device_kind), " results");

  lock_guard<std::mutex> lock(mtx);
  ARROW_ASSIGN_OR_RAISE(auto table, runQuery_locked(query));
  if((row_limit>=0) && (row_limit<table->num_rows()))
    table = table->Slice(0, row_limit);

  result_t result;
  result.desc.result_id = next_result_id++;
  result.desc.num_rows = table->num_rows();
  result.desc.num_columns = table->num_columns();
  result.desc.device_kind = device_kind;
  result.desc.device_id = device_id;
  result.desc.transport = transport;

  if(transport==TransportMode::Inline) {
    ARROW_ASSIGN_OR_RAISE(result.desc.payload, arrowstream::SerializeTable(table));
  } else {
    ARROW_ASSIGN_OR_RAISE(auto size, arrowstream::GetSerializedTableSize(table));
    ARROW_ASSIGN_OR_RAISE(result.segment, SharedMemorySegment::Create(size));
    ARROW_ASSIGN_OR_RAISE(result.desc.segment_size,
                          arrowstream::SerializeTableInto(table, result.segment->data(), result.segment->size()));
    result.desc.segment_key = result.segment->key();
  }

  dbg("Query '"+query+"' staged as "+result.desc.str());
  ResultDescriptor desc = result.desc;
  results[desc.result_id] = std::move(result);
  return desc;
}

/**
 * @brief Free a staged result
 * @retval TransportFailure The result is unknown, was already freed, or lives on another device kind
 */
arrow::Status LocalClient::DeallocateResult(const ResultDescriptor &desc, DeviceKind device_kind, int device_id) {
  lock_guard<std::mutex> lock(mtx);
  if(fail_deallocations)
    return arrow::Status::IOError("Injected failure deallocating result ", desc.result_id);
  auto it = results.find(desc.result_id);
  if(it==results.end())
    return MakeError(ErrorCode::TransportFailure, "Result "+std::to_string(desc.result_id)+" is unknown or was already deallocated");
  if(it->second.desc.device_kind!=device_kind)
    return MakeError(ErrorCode::TransportFailure, "Result "+std::to_string(desc.result_id)+" is a "+
                                                  to_string(it->second.desc.device_kind)+" result, not "+to_string(device_kind));
  if(it->second.segment) {
    ARROW_RETURN_NOT_OK(it->second.segment->Remove());
  }
  dbg("Deallocated result "+std::to_string(desc.result_id)+" (device "+std::to_string(device_id)+")");
  results.erase(it);
  return arrow::Status::OK();
}

/// @brief Make a query string return a fixed table (matched after trimming whitespace)
void LocalClient::RegisterQuery(const string &query, shared_ptr<arrow::Table> result) {
  lock_guard<std::mutex> lock(mtx);
  registered_queries[Join(queryTokens(query), ' ')] = std::move(result);
}

arrow::Result<shared_ptr<arrow::Table>> LocalClient::GetTable(const string &table_name) const {
  lock_guard<std::mutex> lock(mtx);
  auto it = tables.find(table_name);
  if(it==tables.end()) return arrow::Status::KeyError("Table '", table_name, "' does not exist");
  return it->second.data;
}

/// @brief Let the next n loads succeed and fail every one after that. A negative n turns this off
void LocalClient::FailLoadAfter(int num_successful_loads) {
  lock_guard<std::mutex> lock(mtx);
  fail_load_after = (num_successful_loads<0) ? -1
                                             : static_cast<int>(load_call_rows.size())+num_successful_loads;
}

/// @brief Make every DeallocateResult fail (results stay open) until turned off
void LocalClient::FailDeallocations(bool fail) {
  lock_guard<std::mutex> lock(mtx);
  fail_deallocations = fail;
}

int LocalClient::NumberOfLoadCalls() const {
  lock_guard<std::mutex> lock(mtx);
  return static_cast<int>(load_call_rows.size());
}

/// @brief Rows delivered by each successful load call, in call order
vector<int64_t> LocalClient::GetLoadCallRows() const {
  lock_guard<std::mutex> lock(mtx);
  return load_call_rows;
}

size_t LocalClient::NumberOfOpenResults() const {
  lock_guard<std::mutex> lock(mtx);
  return results.size();
}

void LocalClient::sstr(stringstream &ss, int depth, int indent) const {
  if(depth<0) return;
  lock_guard<std::mutex> lock(mtx);
  ss << string(indent,' ') << "[LocalClient] Tables: " << tables.size()
     << " OpenResults: " << results.size()
     << " LoadCalls: " << load_call_rows.size() << endl;
  if(depth>0) {
    for(auto &name_table : tables) {
      ss << string(indent+2,' ') << name_table.first << " rows: " << name_table.second.data->num_rows() << endl;
      for(auto &spec : name_table.second.specs)
        ss << string(indent+4,' ') << spec.str() << endl;
    }
    for(auto &id_result : results)
      ss << string(indent+2,' ') << id_result.second.desc.str() << endl;
  }
}

arrow::Result<LocalClient::table_t *> LocalClient::findTable_locked(const string &table_name) {
  auto it = tables.find(table_name);
  if(it==tables.end()) return arrow::Status::KeyError("Table '", table_name, "' does not exist");
  return &it->second;
}

/// @brief Map each supplied column onto its table column index
arrow::Result<vector<int>> LocalClient::targetColumns(const table_t &t, const vector<string> &column_names,
                                                      size_t num_supplied) const {
  vector<int> targets;
  if(column_names.empty()) {
    if(num_supplied!=t.specs.size())
      return arrow::Status::Invalid("Load supplies ", num_supplied, " columns but the table has ", t.specs.size());
    for(size_t i=0; i<num_supplied; i++)
      targets.push_back(static_cast<int>(i));
    return targets;
  }

  if(column_names.size()!=num_supplied)
    return arrow::Status::Invalid("Load supplies ", num_supplied, " columns but names ", column_names.size());
  for(auto &name : column_names) {
    auto it = find_if(t.specs.begin(), t.specs.end(), [&name](const ColumnSpec &s) { return s.name==name; });
    if(it==t.specs.end())
      return arrow::Status::Invalid("Table has no column named '", name, "'");
    int idx = static_cast<int>(it - t.specs.begin());
    if(find(targets.begin(), targets.end(), idx)!=targets.end())
      return arrow::Status::Invalid("Column '", name, "' is named more than once");
    targets.push_back(idx);
  }
  return targets;
}

/// @brief Append a block of rows. Table columns the load didn't name are filled with nulls
arrow::Status LocalClient::appendColumns_locked(const string &table_name, table_t *t, const vector<int> &targets,
                                                const arrow::ArrayVector &arrays, int64_t num_rows) {
  auto schema = t->data->schema();
  arrow::ArrayVector full(t->specs.size());
  for(size_t i=0; i<targets.size(); i++) {
    auto &array = arrays[i];
    auto &field = schema->field(targets[i]);
    if(array->length()!=num_rows)
      return arrow::Status::Invalid("Column '", field->name(), "' has ", array->length(), " rows, expected ", num_rows);
    if(!array->type()->Equals(*field->type()))
      return MakeError(ErrorCode::TypeMismatch, "Column '"+field->name()+"' expects "+field->type()->ToString()+
                                                " but the load produced "+array->type()->ToString());
    full[targets[i]] = array;
  }
  for(size_t i=0; i<full.size(); i++) {
    if(full[i]) continue;
    if((!t->specs[i].nullable) && (num_rows>0))
      return MakeError(ErrorCode::TypeMismatch, "Column '"+t->specs[i].name+"' is NOT NULL but the load didn't supply it");
    ARROW_ASSIGN_OR_RAISE(full[i], arrow::MakeArrayOfNull(schema->field(i)->type(), num_rows));
  }

  auto block = arrow::Table::Make(schema, full, num_rows);
  ARROW_ASSIGN_OR_RAISE(t->data, arrow::ConcatenateTables({t->data, block}));
  load_call_rows.push_back(num_rows);
  dbg("Loaded "+std::to_string(num_rows)+" rows into "+table_name+" (now "+std::to_string(t->data->num_rows())+")");
  return arrow::Status::OK();
}

arrow::Status LocalClient::checkInjectedFailure_locked(const string &table_name) {
  if((fail_load_after>=0) && (static_cast<int>(load_call_rows.size())>=fail_load_after)) {
    warn("Injecting a load failure for "+table_name);
    return arrow::Status::IOError("Injected failure on load call ", load_call_rows.size()+1, " into '", table_name, "'");
  }
  return arrow::Status::OK();
}

/// @brief Answer a registered query or a "SELECT * FROM <table>"
arrow::Result<shared_ptr<arrow::Table>> LocalClient::runQuery_locked(const string &query) {

  auto tokens = queryTokens(query);
  auto rq = registered_queries.find(Join(tokens, ' '));
  if(rq!=registered_queries.end()) return rq->second;

  if((tokens.size()==4) && (ToLowercase(tokens[0])=="select") && (tokens[1]=="*") && (ToLowercase(tokens[2])=="from")) {
    auto it = tables.find(tokens[3]);
    if(it==tables.end()) return arrow::Status::Invalid("Query references unknown table '", tokens[3], "'");
    return it->second.data;
  }
  return arrow::Status::Invalid("LocalClient can't run query '", query, "'");
}

} // namespace tabxfer
