// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_IPC_RESULTDESCRIPTOR_HH
#define TABXFER_IPC_RESULTDESCRIPTOR_HH

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/buffer.h>

#include "tabxfer-common/Types.hh"


namespace tabxfer {

/**
 * @brief The server's handle for one executed query result
 *
 * An Inline result carries its Arrow stream in payload. Segment results
 * carry the key the client attaches to and the exact number of bytes the
 * stream occupies in that segment. The descriptor is what the client hands
 * back to the server when it deallocates the result.
 */
struct ResultDescriptor {
  uint64_t result_id = 0;
  int64_t num_rows = 0;
  int num_columns = 0;

  DeviceKind device_kind = DeviceKind::CPU;
  int device_id = 0;
  TransportMode transport = TransportMode::Inline;

  std::shared_ptr<arrow::Buffer> payload;  //!< Inline only
  int64_t segment_key = -1;                //!< Segment only
  int64_t segment_size = 0;                //!< Segment only

  bool UsesSegment() const { return transport!=TransportMode::Inline; }

  std::string str() const;
};

} // namespace tabxfer

#endif // TABXFER_IPC_RESULTDESCRIPTOR_HH
