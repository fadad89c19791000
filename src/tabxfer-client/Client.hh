// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_CLIENT_CLIENT_HH
#define TABXFER_CLIENT_CLIENT_HH

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include "tabxfer-common/Types.hh"
#include "tabxfer-load/ColumnEncoder.hh"
#include "tabxfer-load/ColumnSpec.hh"
#include "tabxfer-load/RowValue.hh"
#include "tabxfer-ipc/ResultDescriptor.hh"


namespace tabxfer {

/**
 * @brief The RPC session a Connection talks to the database server through
 *
 * Implementations own the transport, the session handshake, and the
 * server's error reporting. Every call is synchronous. A failed call
 * returns its error status unchanged so the connection can pass it on.
 *
 * An empty column_names list on a load means "every column of the table,
 * in table order". Otherwise the loaded columns go to the named target
 * columns and the remaining target columns receive nulls.
 */
class Client {

public:
  virtual ~Client() = default;

  virtual arrow::Result<std::vector<std::string>> GetTableList() = 0;
  virtual arrow::Result<std::vector<ColumnSpec>> GetColumnSpecs(const std::string &table_name) = 0;

  /**
   * @brief Create an empty table with the given columns
   * @retval TableExists The server already has a table with this name. Implementations must
   *         attach this ErrorDetail (see MakeError) so LoadTable's create policies can tell
   *         it apart from other failures, which the connection reports as TransportFailure
   */
  virtual arrow::Status CreateTable(const std::string &table_name, const std::vector<ColumnSpec> &specs) = 0;


  virtual arrow::Status LoadColumnarBinary(const std::string &table_name,
                                           const std::vector<EncodedColumn> &columns,
                                           const std::vector<std::string> &column_names) = 0;
  virtual arrow::Status LoadArrowBinary(const std::string &table_name,
                                        const std::shared_ptr<arrow::Buffer> &arrow_stream,
                                        const std::vector<std::string> &column_names) = 0;
  virtual arrow::Status LoadRowWise(const std::string &table_name,
                                    const std::vector<WireRow> &rows,
                                    const std::vector<std::string> &column_names) = 0;

  /// Run a query and stage its result for the requested transport. A negative row_limit means no limit
  virtual arrow::Result<ResultDescriptor> ExecuteQueryForResult(const std::string &query,
                                                                DeviceKind device_kind, int device_id,
                                                                int64_t row_limit, TransportMode transport) = 0;
  virtual arrow::Status DeallocateResult(const ResultDescriptor &desc, DeviceKind device_kind, int device_id) = 0;
};

} // namespace tabxfer

#endif // TABXFER_CLIENT_CLIENT_HH
