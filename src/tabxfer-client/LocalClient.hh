// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_CLIENT_LOCALCLIENT_HH
#define TABXFER_CLIENT_LOCALCLIENT_HH

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <arrow/table.h>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/InfoInterface.hh"
#include "tabxfer-common/LoggingInterface.hh"
#include "tabxfer-client/Client.hh"
#include "tabxfer-ipc/MemorySegment.hh"


namespace tabxfer {

/**
 * @brief An in-process stand-in for the database server
 *
 * LocalClient keeps each table as an Arrow table with the canonical types of
 * its ColumnSpecs. All three load paths decode into that form, so a table
 * reads back the same way no matter how it was loaded. Queries are limited
 * to "SELECT * FROM <table>" plus any text registered with RegisterQuery.
 *
 * Segment results are staged in System V shared memory. Device results are
 * staged the same way, since this server has no device memory of its own.
 * A staged segment lives until DeallocateResult or the client is destroyed.
 */
class LocalClient
        : public Client,
          public LoggingInterface,
          public InfoInterface {

public:
  explicit LocalClient(const Configuration &config = Configuration());
  ~LocalClient() override;

  //Client API
  arrow::Result<std::vector<std::string>> GetTableList() override;
  arrow::Result<std::vector<ColumnSpec>> GetColumnSpecs(const std::string &table_name) override;
  arrow::Status CreateTable(const std::string &table_name, const std::vector<ColumnSpec> &specs) override;

  arrow::Status LoadColumnarBinary(const std::string &table_name,
                                   const std::vector<EncodedColumn> &columns,
                                   const std::vector<std::string> &column_names) override;
  arrow::Status LoadArrowBinary(const std::string &table_name,
                                const std::shared_ptr<arrow::Buffer> &arrow_stream,
                                const std::vector<std::string> &column_names) override;
  arrow::Status LoadRowWise(const std::string &table_name,
                            const std::vector<WireRow> &rows,
                            const std::vector<std::string> &column_names) override;

  arrow::Result<ResultDescriptor> ExecuteQueryForResult(const std::string &query,
                                                        DeviceKind device_kind, int device_id,
                                                        int64_t row_limit, TransportMode transport) override;
  arrow::Status DeallocateResult(const ResultDescriptor &desc, DeviceKind device_kind, int device_id) override;

  //Local extras
  void RegisterQuery(const std::string &query, std::shared_ptr<arrow::Table> result);
  arrow::Result<std::shared_ptr<arrow::Table>> GetTable(const std::string &table_name) const;
  void FailLoadAfter(int num_successful_loads);
  void FailDeallocations(bool fail);

  int NumberOfLoadCalls() const;
  std::vector<int64_t> GetLoadCallRows() const;
  size_t NumberOfOpenResults() const;

  //InfoInterface
  void sstr(std::stringstream &ss, int depth=0, int indent=0) const override;

private:
  struct table_t {
    std::vector<ColumnSpec> specs;
    std::shared_ptr<arrow::Table> data;
  };
  struct result_t {
    ResultDescriptor desc;
    std::unique_ptr<SharedMemorySegment> segment;
  };

  arrow::Result<table_t *> findTable_locked(const std::string &table_name);
  arrow::Result<std::vector<int>> targetColumns(const table_t &t, const std::vector<std::string> &column_names,
                                                size_t num_supplied) const;
  arrow::Status appendColumns_locked(const std::string &table_name, table_t *t, const std::vector<int> &targets,
                                     const arrow::ArrayVector &arrays, int64_t num_rows);
  arrow::Status checkInjectedFailure_locked(const std::string &table_name);
  arrow::Result<std::shared_ptr<arrow::Table>> runQuery_locked(const std::string &query);

  mutable std::mutex mtx;
  std::map<std::string, table_t> tables;
  std::map<std::string, std::shared_ptr<arrow::Table>> registered_queries;
  std::map<uint64_t, result_t> results;
  uint64_t next_result_id = 1;

  int fail_load_after = -1;
  bool fail_deallocations = false;
  std::vector<int64_t> load_call_rows;
};

} // namespace tabxfer

#endif // TABXFER_CLIENT_LOCALCLIENT_HH
