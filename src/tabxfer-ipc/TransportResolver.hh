// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_IPC_TRANSPORTRESOLVER_HH
#define TABXFER_IPC_TRANSPORTRESOLVER_HH

#include <map>
#include <memory>

#include <arrow/result.h>
#include <arrow/table.h>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/LoggingInterface.hh"
#include "tabxfer-common/Types.hh"
#include "tabxfer-ipc/MemorySegment.hh"
#include "tabxfer-ipc/ResultDescriptor.hh"


namespace tabxfer {

/**
 * @brief Turns a result descriptor into a decoded Arrow table
 *
 * Inline descriptors are decoded straight from their payload. Segment
 * descriptors are attached with the SegmentAttacher registered for their
 * device kind, decoded, and detached before Resolve returns. The host
 * (CPU) attacher is registered at construction. Device (GPU) memory needs
 * a caller-supplied attacher.
 */
class TransportResolver : public LoggingInterface {

public:
  explicit TransportResolver(const Configuration &config = Configuration());
  ~TransportResolver() override = default;

  void RegisterAttacher(DeviceKind kind, std::shared_ptr<SegmentAttacher> attacher);
  bool HasAttacher(DeviceKind kind) const;

  arrow::Result<std::shared_ptr<arrow::Table>> Resolve(const ResultDescriptor &desc, TransportMode mode) const;

private:
  arrow::Result<std::shared_ptr<arrow::Table>> resolveSegment(const ResultDescriptor &desc) const;

  std::map<DeviceKind, std::shared_ptr<SegmentAttacher>> attachers;
};

} // namespace tabxfer

#endif // TABXFER_IPC_TRANSPORTRESOLVER_HH
