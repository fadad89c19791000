// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include "tabxfer-common/Types.hh"

using namespace std;

namespace tabxfer {

string to_string(DeviceKind kind) {
  switch(kind) {
    case DeviceKind::CPU: return "CPU";
    case DeviceKind::GPU: return "GPU";
  }
  return "Unknown("+std::to_string(static_cast<int>(kind))+")";
}

string to_string(TransportMode mode) {
  switch(mode) {
    case TransportMode::Inline:        return "Inline";
    case TransportMode::SharedSegment: return "SharedSegment";
    case TransportMode::DeviceSegment: return "DeviceSegment";
  }
  return "Unknown("+std::to_string(static_cast<int>(mode))+")";
}

} // namespace tabxfer
