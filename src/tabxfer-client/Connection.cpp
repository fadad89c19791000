// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <algorithm>
#include <cerrno>

#include "tabxfer-common/Status.hh"
#include "tabxfer-load/ChunkPlanner.hh"
#include "tabxfer-load/ColumnEncoder.hh"
#include "tabxfer-ipc/ArrowStream.hh"
#include "tabxfer-client/Connection.hh"

using namespace std;

namespace tabxfer {

namespace {
//Stamp a phase on tabxfer errors that don't have one yet. Plain arrow errors are left alone
arrow::Status withPhase(const arrow::Status &status, Phase phase) {
  if(status.ok()) return status;
  if((GetErrorCode(status)==ErrorCode::None) || (GetPhase(status)!=Phase::None)) return status;
  return TagPhase(status, phase);
}
}

Connection::Connection(shared_ptr<Client> client, const Configuration &config)
  : LoggingInterface("tabxfer"),
    client(std::move(client)),
    resolver(config),
    tracker(config),
    default_chunk_size(0) {

  ConfigureLogging(config);
  if(!this->client) {
    config_status = arrow::Status::Invalid("Connection needs a client");
  } else {
    config_status = parseConfiguration(config);
  }
  if(!config_status.ok()) error("Connection is unusable: "+config_status.ToString());
}

Connection::~Connection() {
  auto num_open = tracker.NumberOfTrackedResults();
  if(num_open)
    warn("Closing connection with "+std::to_string(num_open)+" fetched results that were never released");
}

/**
 * @brief Create a connection, failing if its configuration has bad values
 * @retval InvalidMethod tabxfer.load.method is not a known method
 * @retval InvalidOption Another tabxfer setting is malformed
 */
arrow::Result<shared_ptr<Connection>> Connection::Make(shared_ptr<Client> client, const Configuration &config) {
  auto conn = make_shared<Connection>(std::move(client), config);
  ARROW_RETURN_NOT_OK(conn->config_status);
  return conn;
}

arrow::Status Connection::parseConfiguration(const Configuration &config) {

  config.GetLowercaseString(&default_method, "tabxfer.load.method", "infer");
  ARROW_RETURN_NOT_OK(ParseLoadMethod(default_method).status());

  config.GetLowercaseString(&default_create, "tabxfer.load.create", "infer");
  ARROW_RETURN_NOT_OK(ParseCreatePolicy(default_create).status());

  if((config.GetInt(&default_chunk_size, "tabxfer.load.chunk_size_bytes", "0")==EINVAL) || (default_chunk_size<0))
    return MakeError(ErrorCode::InvalidOption, "tabxfer.load.chunk_size_bytes must be a non-negative size");

  string transport;
  config.GetLowercaseString(&transport, "tabxfer.fetch.transport", "shared_memory");
  if(transport=="wire")               default_fetch.transport = TransportMode::Inline;
  else if(transport=="shared_memory") default_fetch.transport = TransportMode::SharedSegment;
  else return MakeError(ErrorCode::InvalidOption, "tabxfer.fetch.transport must be wire or shared_memory, not '"+transport+"'");

  if(config.GetInt(&default_fetch.first_n, "tabxfer.fetch.first_n", "-1")==EINVAL)
    return MakeError(ErrorCode::InvalidOption, "tabxfer.fetch.first_n must be an integer");

  if(config.GetBool(&default_fetch.release_memory, "tabxfer.fetch.release_memory", "false")==EINVAL)
    return MakeError(ErrorCode::InvalidOption, "tabxfer.fetch.release_memory must be true or false");

  dbg("Defaults: method="+default_method+" create="+default_create+
      " chunk_size_bytes="+std::to_string(default_chunk_size)+
      " transport="+to_string(default_fetch.transport)+
      " first_n="+std::to_string(default_fetch.first_n));
  return arrow::Status::OK();
}

arrow::Status Connection::resolveLoadOptions(const LoadOptions &options, LoadMethod *method,
                                             CreatePolicy *create, int64_t *chunk_size) const {
  ARROW_ASSIGN_OR_RAISE(*method, ParseLoadMethod((options.method.empty()) ? default_method : options.method));
  ARROW_ASSIGN_OR_RAISE(*create, ParseCreatePolicy((options.create.empty()) ? default_create : options.create));
  *chunk_size = (options.chunk_size_bytes<0) ? default_chunk_size : options.chunk_size_bytes;
  return arrow::Status::OK();
}

arrow::Result<vector<string>> Connection::GetTables() {
  ARROW_RETURN_NOT_OK(config_status);
  auto tables = client->GetTableList();
  if(!tables.ok()) return TagPhase(tables.status(), Phase::None);
  return tables;
}

arrow::Result<vector<ColumnSpec>> Connection::GetTableDetails(const string &table_name) {
  ARROW_RETURN_NOT_OK(config_status);
  auto specs = client->GetColumnSpecs(table_name);
  if(!specs.ok()) return TagPhase(specs.status(), Phase::None);
  return specs;
}

/**
 * @brief Create a table whose columns match the data's column names and types
 * @retval TableExists The server already has this table
 * @retval TypeMismatch A column's type has no server equivalent
 */
arrow::Status Connection::CreateTable(const string &table_name, const TabularData &data) {
  ARROW_RETURN_NOT_OK(config_status);
  return withPhase(doCreateTable(table_name, data), Phase::Create);
}

arrow::Status Connection::doCreateTable(const string &table_name, const TabularData &data) {
  ARROW_ASSIGN_OR_RAISE(auto specs, data.InferColumnSpecs());
  info("Creating table "+table_name+" with "+std::to_string(specs.size())+" columns");
  return TagPhase(client->CreateTable(table_name, specs), Phase::Create);
}

/**
 * @brief Load data into a table, creating the table and picking a load method as needed
 * @param[in] table_name The target table
 * @param[in] data The rows to append
 * @param[in] options Method, create policy, and chunking. Empty fields use the configured defaults
 * @retval InvalidMethod/InvalidOption Bad method or create literal (nothing is sent)
 * @retval TableExists create was true and the table exists
 * @retval SchemaMismatch Columnar load with the wrong number of columns (nothing is sent)
 * @retval TransportFailure The server rejected a request
 */
arrow::Status Connection::LoadTable(const string &table_name, const TabularData &data, const LoadOptions &options) {

  ARROW_RETURN_NOT_OK(config_status);

  LoadMethod method;
  CreatePolicy create;
  int64_t chunk_size;
  auto st = resolveLoadOptions(options, &method, &create, &chunk_size);
  if(!st.ok()) return withPhase(st, Phase::Load);

  bool do_create = (create==CreatePolicy::Always);
  if(create==CreatePolicy::Infer) {
    auto tables = client->GetTableList();
    if(!tables.ok()) return TagPhase(tables.status(), Phase::Create);
    do_create = (find(tables->begin(), tables->end(), table_name)==tables->end());
  }
  if(do_create) {
    ARROW_RETURN_NOT_OK(CreateTable(table_name, data));
  }

  auto strategy = SelectLoadStrategy(method, data);
  dbg("LoadTable "+table_name+": "+std::to_string(data.num_rows())+" rows from "+to_string(data.kind())+
      " using "+to_string(strategy)+" (method "+to_string(method)+")");

  switch(strategy) {
    case LoadStrategy::Arrow:    st = doLoadArrow(table_name, data, options); break;
    case LoadStrategy::Columnar: st = doLoadColumnar(table_name, data, options, chunk_size); break;
    case LoadStrategy::RowWise:  st = doLoadRowwise(table_name, data, options); break;
  }
  return withPhase(st, Phase::Load);
}

/**
 * @brief Load data as binary columns, split into batches of at most chunk_size_bytes
 *
 * The table's column list is fetched first and must have one column per
 * source column (or per name in options.column_names). Batches are sent in
 * row order. If a batch fails after earlier batches went through, the
 * earlier rows stay in the table: there is no rollback.
 *
 * @retval SchemaMismatch Column counts differ (nothing is sent)
 * @retval TypeMismatch A column can't be coerced into the table's type (nothing is sent)
 * @retval TransportFailure The server rejected a batch
 */
arrow::Status Connection::LoadTableColumnar(const string &table_name, const TabularData &data, const LoadOptions &options) {
  ARROW_RETURN_NOT_OK(config_status);
  int64_t chunk_size = (options.chunk_size_bytes<0) ? default_chunk_size : options.chunk_size_bytes;
  return withPhase(doLoadColumnar(table_name, data, options, chunk_size), Phase::Load);
}

/// @brief Load data as a single Arrow IPC stream
arrow::Status Connection::LoadTableArrow(const string &table_name, const TabularData &data, const LoadOptions &options) {
  ARROW_RETURN_NOT_OK(config_status);
  return withPhase(doLoadArrow(table_name, data, options), Phase::Load);
}

/// @brief Load data as rows of text values
arrow::Status Connection::LoadTableRowwise(const string &table_name, const TabularData &data, const LoadOptions &options) {
  ARROW_RETURN_NOT_OK(config_status);
  return withPhase(doLoadRowwise(table_name, data, options), Phase::Load);
}

arrow::Status Connection::doLoadColumnar(const string &table_name, const TabularData &data,
                                         const LoadOptions &options, int64_t chunk_size) {

  auto table_specs = client->GetColumnSpecs(table_name);
  if(!table_specs.ok()) return TagPhase(table_specs.status(), Phase::Load);

  vector<ColumnSpec> specs;
  if(options.column_names.empty()) {
    specs = *table_specs;
  } else {
    for(auto &name : options.column_names) {
      auto it = find_if(table_specs->begin(), table_specs->end(), [&name](const ColumnSpec &s) { return s.name==name; });
      if(it==table_specs->end())
        return MakeError(ErrorCode::SchemaMismatch, "Table "+table_name+" has no column named '"+name+"'");
      specs.push_back(*it);
    }
  }
  if(static_cast<int>(specs.size())!=data.num_columns()) {
    return MakeError(ErrorCode::SchemaMismatch, "Data has "+std::to_string(data.num_columns())+" columns but table "+
                                                table_name+" expects "+std::to_string(specs.size()));
  }

  ARROW_ASSIGN_OR_RAISE(auto table, data.ToTable(specs));
  auto source_names = data.column_names();

  vector<EncodedColumn> columns;
  for(size_t i=0; i<specs.size(); i++) {
    ColumnSpec spec = specs[i];
    if(!options.col_names_from_schema) spec.name = source_names[i];
    ARROW_ASSIGN_OR_RAISE(auto column, EncodeColumn(*table->column(static_cast<int>(i)), spec));
    columns.push_back(std::move(column));
  }

  ARROW_ASSIGN_OR_RAISE(auto batches, PlanBatches(columns, chunk_size));
  dbg("Columnar load of "+std::to_string(table->num_rows())+" rows into "+table_name+" as "+
      std::to_string(batches.size())+" batches (budget "+std::to_string(chunk_size)+" bytes)");

  for(size_t b=0; b<batches.size(); b++) {
    auto st = client->LoadColumnarBinary(table_name, batches[b].columns, options.column_names);
    if(!st.ok()) {
      if(b>0) {
        error("Partial load into "+table_name+": batch "+std::to_string(b+1)+" of "+std::to_string(batches.size())+
              " failed after "+std::to_string(batches[b].first_row)+" rows were stored. Table contents are now indeterminate. "+
              st.ToString());
      }
      return TagPhase(st, Phase::Load);
    }
  }
  info("Loaded "+std::to_string(table->num_rows())+" rows into "+table_name+" (columnar)");
  return arrow::Status::OK();
}

arrow::Status Connection::doLoadArrow(const string &table_name, const TabularData &data, const LoadOptions &options) {
  ARROW_ASSIGN_OR_RAISE(auto table, data.ToTable());
  ARROW_ASSIGN_OR_RAISE(auto stream, arrowstream::SerializeTable(table));
  dbg("Arrow load of "+std::to_string(table->num_rows())+" rows into "+table_name+" ("+
      std::to_string(stream->size())+" byte stream)");
  ARROW_RETURN_NOT_OK(TagPhase(client->LoadArrowBinary(table_name, stream, options.column_names), Phase::Load));
  info("Loaded "+std::to_string(table->num_rows())+" rows into "+table_name+" (arrow)");
  return arrow::Status::OK();
}

arrow::Status Connection::doLoadRowwise(const string &table_name, const TabularData &data, const LoadOptions &options) {
  ARROW_ASSIGN_OR_RAISE(auto rows, data.ToWireRows());
  ARROW_RETURN_NOT_OK(TagPhase(client->LoadRowWise(table_name, rows, options.column_names), Phase::Load));
  info("Loaded "+std::to_string(rows.size())+" rows into "+table_name+" (rows)");
  return arrow::Status::OK();
}

arrow::Result<shared_ptr<arrow::Table>> Connection::SelectIpc(const string &query) {
  return SelectIpc(query, default_fetch);
}

/**
 * @brief Run a query and decode its result from the server's inline stream or a shared memory segment
 * @param[in] query The query text
 * @param[in] options Transport (Inline or SharedSegment), row limit, and release behavior
 * @return The decoded table. Hand it to Release() (or DeallocateIpc()) when the server's copy can go
 * @note With release_memory set, a release the server refuses is logged as a warning and the
 *       table is still returned. It stays tracked and can be released later
 * @retval UnsupportedTransport A device transport was requested, or the server returned another transport
 * @retval TransportFailure The server failed the query or the segment couldn't be read
 */
arrow::Result<shared_ptr<arrow::Table>> Connection::SelectIpc(const string &query, const FetchOptions &options) {
  ARROW_RETURN_NOT_OK(config_status);
  if(options.transport==TransportMode::DeviceSegment)
    return MakeError(ErrorCode::UnsupportedTransport, "SelectIpc handles wire and shared memory results. Use SelectIpcGpu for device results", Phase::Fetch);
  return fetch(query, DeviceKind::CPU, options.transport, options);
}

arrow::Result<shared_ptr<arrow::Table>> Connection::SelectIpcGpu(const string &query) {
  return SelectIpcGpu(query, default_fetch);
}

/**
 * @brief Run a query whose result is left in device memory and decode it through the registered GPU attacher
 * @retval UnsupportedTransport No GPU attacher is registered (the query isn't run)
 */
arrow::Result<shared_ptr<arrow::Table>> Connection::SelectIpcGpu(const string &query, const FetchOptions &options) {
  ARROW_RETURN_NOT_OK(config_status);
  if(!resolver.HasAttacher(DeviceKind::GPU))
    return MakeError(ErrorCode::UnsupportedTransport, "No GPU segment attacher is registered with this connection", Phase::Fetch);
  return fetch(query, DeviceKind::GPU, TransportMode::DeviceSegment, options);
}

arrow::Result<shared_ptr<arrow::Table>> Connection::fetch(const string &query, DeviceKind kind,
                                                          TransportMode transport, const FetchOptions &options) {

  auto desc = client->ExecuteQueryForResult(query, kind, options.device_id, options.first_n, transport);
  if(!desc.ok()) return TagPhase(desc.status(), Phase::Fetch);
  dbg("Query returned "+desc->str());

  auto table = resolver.Resolve(*desc, transport);
  if(!table.ok()) {
    //Nobody will ever hold a table for this descriptor, so free it now
    auto st = client->DeallocateResult(*desc, desc->device_kind, desc->device_id);
    if(!st.ok()) warn("Could not free result "+std::to_string(desc->result_id)+" after a failed fetch: "+st.ToString());
    return TagPhase(table.status(), Phase::Fetch);
  }

  tracker.Track(*table, *desc);

  //A failed release keeps the table tracked, so the caller can release it again
  if(options.release_memory) {
    auto st = releaseAs(*table, nullptr, -1);
    if(!st.ok())
      warn("Fetched result "+std::to_string(desc->result_id)+" but could not release it: "+st.ToString());
  }
  return table;
}

/**
 * @brief Free the server memory behind a fetched table
 * @param[in] table A table returned by SelectIpc or SelectIpcGpu (any copy of the pointer)
 * @param[in] device_id Device to free on. Negative uses the device the result came from
 * @retval NoDescriptor The table didn't come from this connection
 * @retval AlreadyReleased The table's result was already freed
 * @retval TransportFailure The server refused the deallocation. The table can be released again later
 */
arrow::Status Connection::Release(const shared_ptr<arrow::Table> &table, int device_id) {
  ARROW_RETURN_NOT_OK(config_status);
  return withPhase(releaseAs(table, nullptr, device_id), Phase::Release);
}

/// @brief Release a table, telling the server it is a CPU (shared memory or wire) result
arrow::Status Connection::DeallocateIpc(const shared_ptr<arrow::Table> &table, int device_id) {
  ARROW_RETURN_NOT_OK(config_status);
  DeviceKind kind = DeviceKind::CPU;
  return withPhase(releaseAs(table, &kind, device_id), Phase::Release);
}

/// @brief Release a table, telling the server it is a GPU result
arrow::Status Connection::DeallocateIpcGpu(const shared_ptr<arrow::Table> &table, int device_id) {
  ARROW_RETURN_NOT_OK(config_status);
  DeviceKind kind = DeviceKind::GPU;
  return withPhase(releaseAs(table, &kind, device_id), Phase::Release);
}

arrow::Status Connection::releaseAs(const shared_ptr<arrow::Table> &table, const DeviceKind *kind, int device_id) {
  ARROW_ASSIGN_OR_RAISE(auto desc, tracker.Lookup(table));
  DeviceKind k = (kind) ? *kind : desc.device_kind;
  int dev = (device_id<0) ? desc.device_id : device_id;
  ARROW_RETURN_NOT_OK(TagPhase(client->DeallocateResult(desc, k, dev), Phase::Release));
  return tracker.MarkReleased(table);
}

void Connection::RegisterAttacher(DeviceKind kind, shared_ptr<SegmentAttacher> attacher) {
  resolver.RegisterAttacher(kind, std::move(attacher));
}

void Connection::sstr(stringstream &ss, int depth, int indent) const {
  if(depth<0) return;
  ss << string(indent,' ') << "[Connection]"
     << " Config: " << ((config_status.ok()) ? "ok" : config_status.ToString())
     << " Method: " << default_method
     << " Create: " << default_create
     << " ChunkSize: " << default_chunk_size
     << " Transport: " << to_string(default_fetch.transport)
     << " FirstN: " << default_fetch.first_n << endl;
  tracker.sstr(ss, depth-1, indent+2);
}

} // namespace tabxfer
