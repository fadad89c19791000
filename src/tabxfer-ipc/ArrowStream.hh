// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_IPC_ARROWSTREAM_HH
#define TABXFER_IPC_ARROWSTREAM_HH

#include <cstdint>
#include <memory>

#include <arrow/buffer.h>
#include <arrow/ipc/api.h>
#include <arrow/result.h>
#include <arrow/table.h>


namespace tabxfer {

/// Helpers for moving tables through the Arrow IPC stream format (a schema message followed by record batches)
namespace arrowstream {

arrow::Result<int64_t> GetSerializedTableSize(
        const std::shared_ptr<arrow::Table> &table,
        const arrow::ipc::IpcWriteOptions &options = arrow::ipc::IpcWriteOptions::Defaults());

arrow::Result<std::shared_ptr<arrow::Buffer>> SerializeTable(
        const std::shared_ptr<arrow::Table> &table,
        const arrow::ipc::IpcWriteOptions &options = arrow::ipc::IpcWriteOptions::Defaults());

arrow::Result<int64_t> SerializeTableInto(
        const std::shared_ptr<arrow::Table> &table, uint8_t *dst, int64_t capacity,
        const arrow::ipc::IpcWriteOptions &options = arrow::ipc::IpcWriteOptions::Defaults());

arrow::Result<std::shared_ptr<arrow::Table>> ReadTable(
        const std::shared_ptr<arrow::Buffer> &buffer,
        arrow::ipc::IpcReadOptions options = arrow::ipc::IpcReadOptions::Defaults());

arrow::Result<std::shared_ptr<arrow::Table>> ReadTableCopy(
        const uint8_t *data, int64_t size,
        arrow::ipc::IpcReadOptions options = arrow::ipc::IpcReadOptions::Defaults());

} // namespace arrowstream
} // namespace tabxfer

#endif // TABXFER_IPC_ARROWSTREAM_HH
