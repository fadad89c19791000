// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include "tabxfer-common/Status.hh"
#include "tabxfer-ipc/ArrowStream.hh"
#include "tabxfer-ipc/TransportResolver.hh"

using namespace std;

namespace tabxfer {

TransportResolver::TransportResolver(const Configuration &config)
  : LoggingInterface("tabxfer.fetch") {
  ConfigureLogging(config);
  attachers[DeviceKind::CPU] = make_shared<SharedMemoryAttacher>();
}

/// @brief Use a different attacher for one kind of device. A null attacher unregisters the kind
void TransportResolver::RegisterAttacher(DeviceKind kind, shared_ptr<SegmentAttacher> attacher) {
  if(!attacher) {
    dbg("Removing attacher for "+to_string(kind));
    attachers.erase(kind);
    return;
  }
  dbg("Registering attacher "+attacher->Name()+" for "+to_string(kind));
  attachers[kind] = std::move(attacher);
}

bool TransportResolver::HasAttacher(DeviceKind kind) const {
  return attachers.find(kind)!=attachers.end();
}

/**
 * @brief Fetch and decode the table a descriptor points to
 * @param[in] desc The server's descriptor for the result
 * @param[in] mode The transport the caller asked the server for
 * @return The decoded table. It owns its memory, so it stays valid after any segment is detached
 * @retval UnsupportedTransport The mode doesn't match the descriptor, or no attacher handles its device
 * @retval IOError/Invalid The segment couldn't be attached or the stream couldn't be decoded
 */
arrow::Result<shared_ptr<arrow::Table>> TransportResolver::Resolve(const ResultDescriptor &desc, TransportMode mode) const {

  dbg("Resolve "+desc.str()+" as "+to_string(mode));

  if(mode!=desc.transport) {
    return MakeError(ErrorCode::UnsupportedTransport,
                     "Requested "+to_string(mode)+" transport but the server returned a "+to_string(desc.transport)+" result");
  }

  switch(mode) {
    case TransportMode::Inline:
      if(!desc.payload)
        return MakeError(ErrorCode::UnsupportedTransport, "Inline result "+std::to_string(desc.result_id)+" has no payload");
      return arrowstream::ReadTable(desc.payload);

    case TransportMode::SharedSegment:
      if(desc.device_kind!=DeviceKind::CPU)
        return MakeError(ErrorCode::UnsupportedTransport, "Shared segment transport needs a CPU result, got "+to_string(desc.device_kind));
      return resolveSegment(desc);

    case TransportMode::DeviceSegment:
      if(desc.device_kind!=DeviceKind::GPU)
        return MakeError(ErrorCode::UnsupportedTransport, "Device segment transport needs a GPU result, got "+to_string(desc.device_kind));
      return resolveSegment(desc);
  }
  return MakeError(ErrorCode::UnsupportedTransport, "Unknown transport mode "+std::to_string(static_cast<int>(mode)));
}

arrow::Result<shared_ptr<arrow::Table>> TransportResolver::resolveSegment(const ResultDescriptor &desc) const {

  auto it = attachers.find(desc.device_kind);
  if(it==attachers.end()) {
    return MakeError(ErrorCode::UnsupportedTransport,
                     "No segment attacher is registered for "+to_string(desc.device_kind)+" results");
  }

  ARROW_ASSIGN_OR_RAISE(auto attachment,
                        ScopedAttachment::Attach(it->second, desc.segment_key, desc.segment_size,
                                                 [this, &desc](const arrow::Status &st) {
                                                   error("Detach of segment "+std::to_string(desc.segment_key)+" failed: "+st.ToString());
                                                 }));
  dbg("Attached segment "+std::to_string(desc.segment_key)+" with "+it->second->Name());

  //Decode copies out of the segment, and attachment detaches on every return path
  auto table = arrowstream::ReadTableCopy(attachment.data(), attachment.size());
  if(!table.ok()) warn("Decode of segment "+std::to_string(desc.segment_key)+" failed: "+table.status().ToString());
  return table;
}

} // namespace tabxfer
