// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cstring>

#include <arrow/io/memory.h>

#include "tabxfer-ipc/ArrowStream.hh"

namespace tabxfer {
namespace arrowstream {

/// @brief Serialize an arrow table to a mock stream to calculate how big it is
/// @param table The Apache Arrow table to serialize
/// @param options Serialization options
/// @return An Arrow result with error conditions or the size in bytes of the serialized data
/// @note This walks through serialization, but does not write anything. Running serialization
///       twice is cheaper than serializing to a tmp buffer and copying it into a segment
arrow::Result<int64_t> GetSerializedTableSize(
        const std::shared_ptr<arrow::Table> &table,
        const arrow::ipc::IpcWriteOptions &options) {
   if(!table) return arrow::Status::Invalid("Cannot serialize a null table");
   arrow::io::MockOutputStream sink;
   ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeStreamWriter(
           &sink, table->schema(), options));
   ARROW_RETURN_NOT_OK(writer->WriteTable(*table));
   ARROW_RETURN_NOT_OK(writer->Close());
   ARROW_RETURN_NOT_OK(sink.Close());
   return sink.GetExtentBytesWritten();
}

/// @brief Serialize a table into a freshly allocated buffer that is exactly the stream's size
arrow::Result<std::shared_ptr<arrow::Buffer>> SerializeTable(
        const std::shared_ptr<arrow::Table> &table,
        const arrow::ipc::IpcWriteOptions &options) {
   ARROW_ASSIGN_OR_RAISE(auto size, GetSerializedTableSize(table, options));
   ARROW_ASSIGN_OR_RAISE(std::shared_ptr<arrow::ResizableBuffer> buf,
                         arrow::AllocateResizableBuffer(size, options.memory_pool));
   ARROW_ASSIGN_OR_RAISE(auto written, SerializeTableInto(table, buf->mutable_data(), size, options));
   ARROW_RETURN_NOT_OK(buf->Resize(written, false));
   return std::static_pointer_cast<arrow::Buffer>(buf);
}

/// @brief Serialize a table into caller-owned memory (eg, a shared memory segment)
/// @param table The table to write
/// @param dst Start of the destination memory
/// @param capacity Number of bytes available at dst
/// @param options Serialization options
/// @return Number of bytes written
/// @retval CapacityError The stream doesn't fit in capacity
arrow::Result<int64_t> SerializeTableInto(
        const std::shared_ptr<arrow::Table> &table, uint8_t *dst, int64_t capacity,
        const arrow::ipc::IpcWriteOptions &options) {

   ARROW_ASSIGN_OR_RAISE(auto needed, GetSerializedTableSize(table, options));
   if(needed > capacity) {
      return arrow::Status::CapacityError("Serialized table needs ", needed,
                                          " bytes but only ", capacity, " are available");
   }

   auto sink = std::make_unique<arrow::io::FixedSizeBufferWriter>(
       std::make_shared<arrow::MutableBuffer>(dst, capacity));
   ARROW_ASSIGN_OR_RAISE(
       auto writer,
       arrow::ipc::MakeStreamWriter(sink.get(), table->schema(), options));
   ARROW_RETURN_NOT_OK(writer->WriteTable(*table));
   ARROW_RETURN_NOT_OK(writer->Close());
   ARROW_ASSIGN_OR_RAISE(auto written, sink->Tell());
   ARROW_RETURN_NOT_OK(sink->Close());
   return written;
}

/// @brief Decode an Arrow IPC stream. The table references the buffer's memory
arrow::Result<std::shared_ptr<arrow::Table>> ReadTable(
        const std::shared_ptr<arrow::Buffer> &buffer,
        arrow::ipc::IpcReadOptions options) {

   if((!buffer) || (buffer->size()==0))
      return arrow::Status::Invalid("Cannot read a table from an empty stream");

   auto buffer_reader = std::make_shared<arrow::io::BufferReader>(buffer);

   options.use_threads = true;
   ARROW_ASSIGN_OR_RAISE(auto reader,
                         arrow::ipc::RecordBatchStreamReader::Open(buffer_reader, options));
   return reader->ToTable();
}

/// @brief Decode an Arrow IPC stream from memory the caller is about to unmap
/// @note The bytes are copied into a pool buffer first, so the table stays valid after detach
arrow::Result<std::shared_ptr<arrow::Table>> ReadTableCopy(
        const uint8_t *data, int64_t size,
        arrow::ipc::IpcReadOptions options) {

   if((!data) || (size<=0))
      return arrow::Status::Invalid("Cannot read a table from an empty stream");

   ARROW_ASSIGN_OR_RAISE(std::shared_ptr<arrow::Buffer> buf,
                         arrow::AllocateBuffer(size, options.memory_pool));
   memcpy(buf->mutable_data(), data, size);
   return ReadTable(buf, options);
}

} // namespace arrowstream
} // namespace tabxfer
