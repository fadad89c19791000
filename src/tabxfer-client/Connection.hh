// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_CLIENT_CONNECTION_HH
#define TABXFER_CLIENT_CONNECTION_HH

#include <memory>
#include <string>
#include <vector>

#include <arrow/result.h>
#include <arrow/table.h>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/InfoInterface.hh"
#include "tabxfer-common/LoggingInterface.hh"
#include "tabxfer-load/LoadStrategy.hh"
#include "tabxfer-load/TabularData.hh"
#include "tabxfer-ipc/ReleaseTracker.hh"
#include "tabxfer-ipc/TransportResolver.hh"
#include "tabxfer-client/Client.hh"


namespace tabxfer {

/**
 * @brief Settings for one ipc fetch. DefaultFetchOptions() fills these in from the configuration
 */
struct FetchOptions {
  TransportMode transport = TransportMode::SharedSegment;  //!< Inline or SharedSegment for SelectIpc
  int64_t first_n = -1;                                   //!< Row limit. Negative means all rows
  bool release_memory = false;                            //!< Release the server's copy right after decoding
  int device_id = 0;
};


/**
 * @brief A session with the database server for bulk loads and ipc fetches
 *
 * A Connection wraps a Client (the RPC session) and adds the load pipeline
 * (schema inference, strategy selection, encoding, and chunking) and the
 * fetch side (descriptor resolution and release tracking). Every failure is
 * an arrow::Status carrying an ErrorDetail. Errors from the Client are kept
 * verbatim and reported as TransportFailure with the phase they happened in.
 *
 * Configuration keys (all optional):
 * - **tabxfer.load.method**: infer, arrow, columnar, or rows (default infer)
 * - **tabxfer.load.create**: infer, true, or false (default infer)
 * - **tabxfer.load.chunk_size_bytes**: columnar batch budget, 0 for one batch (default 0)
 * - **tabxfer.fetch.transport**: wire or shared_memory (default shared_memory)
 * - **tabxfer.fetch.first_n**: default row limit (default -1)
 * - **tabxfer.fetch.release_memory**: release right after each fetch (default false)
 *
 * A Connection is meant for one caller at a time.
 */
class Connection
        : public LoggingInterface,
          public InfoInterface {

public:
  Connection(std::shared_ptr<Client> client, const Configuration &config);
  ~Connection() override;

  static arrow::Result<std::shared_ptr<Connection>> Make(std::shared_ptr<Client> client, const Configuration &config);

  //Catalog
  arrow::Result<std::vector<std::string>> GetTables();
  arrow::Result<std::vector<ColumnSpec>> GetTableDetails(const std::string &table_name);
  arrow::Status CreateTable(const std::string &table_name, const TabularData &data);

  //Loads
  arrow::Status LoadTable(const std::string &table_name, const TabularData &data, const LoadOptions &options = LoadOptions());
  arrow::Status LoadTableColumnar(const std::string &table_name, const TabularData &data, const LoadOptions &options = LoadOptions());
  arrow::Status LoadTableArrow(const std::string &table_name, const TabularData &data, const LoadOptions &options = LoadOptions());
  arrow::Status LoadTableRowwise(const std::string &table_name, const TabularData &data, const LoadOptions &options = LoadOptions());

  //Fetches
  FetchOptions DefaultFetchOptions() const { return default_fetch; }
  arrow::Result<std::shared_ptr<arrow::Table>> SelectIpc(const std::string &query);
  arrow::Result<std::shared_ptr<arrow::Table>> SelectIpc(const std::string &query, const FetchOptions &options);
  arrow::Result<std::shared_ptr<arrow::Table>> SelectIpcGpu(const std::string &query);
  arrow::Result<std::shared_ptr<arrow::Table>> SelectIpcGpu(const std::string &query, const FetchOptions &options);

  //Releases
  arrow::Status Release(const std::shared_ptr<arrow::Table> &table, int device_id = -1);
  arrow::Status DeallocateIpc(const std::shared_ptr<arrow::Table> &table, int device_id = -1);
  arrow::Status DeallocateIpcGpu(const std::shared_ptr<arrow::Table> &table, int device_id = -1);
  size_t NumberOfTrackedResults() const { return tracker.NumberOfTrackedResults(); }

  void RegisterAttacher(DeviceKind kind, std::shared_ptr<SegmentAttacher> attacher);

  //InfoInterface
  void sstr(std::stringstream &ss, int depth=0, int indent=0) const override;

private:
  arrow::Status parseConfiguration(const Configuration &config);
  arrow::Status resolveLoadOptions(const LoadOptions &options, LoadMethod *method, CreatePolicy *create, int64_t *chunk_size) const;

  arrow::Status doCreateTable(const std::string &table_name, const TabularData &data);
  arrow::Status doLoadColumnar(const std::string &table_name, const TabularData &data, const LoadOptions &options, int64_t chunk_size);
  arrow::Status doLoadArrow(const std::string &table_name, const TabularData &data, const LoadOptions &options);
  arrow::Status doLoadRowwise(const std::string &table_name, const TabularData &data, const LoadOptions &options);

  arrow::Result<std::shared_ptr<arrow::Table>> fetch(const std::string &query, DeviceKind kind,
                                                     TransportMode transport, const FetchOptions &options);
  arrow::Status releaseAs(const std::shared_ptr<arrow::Table> &table, const DeviceKind *kind, int device_id);

  std::shared_ptr<Client> client;
  TransportResolver resolver;
  ReleaseTracker tracker;

  arrow::Status config_status;
  std::string default_method;
  std::string default_create;
  int64_t default_chunk_size;
  FetchOptions default_fetch;
};

} // namespace tabxfer

#endif // TABXFER_CLIENT_CONNECTION_HH
