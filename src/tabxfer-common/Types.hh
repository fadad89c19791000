// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_TYPES_HH
#define TABXFER_COMMON_TYPES_HH

#include <cstdint>
#include <string>

namespace tabxfer {

using rc_t = int; //!< Mark integer return codes with rc_t for more clarity


/** @brief A marking used to designate API calls that must be visible, but are not expected to be used by end users */
struct internal_use_only_t {}; static constexpr internal_use_only_t internal_use_only = {};


/**
 * @brief Where a result table lives on the server side
 */
enum class DeviceKind : uint8_t {
  CPU = 0,
  GPU = 1
};
std::string to_string(DeviceKind kind);


/**
 * @brief How the bytes of a result table are handed to the client
 */
enum class TransportMode : uint8_t {
  Inline        = 0,   //!< Serialized stream is returned inside the query reply
  SharedSegment = 1,   //!< Stream is placed in a host shared-memory segment
  DeviceSegment = 2    //!< Stream is placed in device (GPU) memory exported through an ipc handle
};
std::string to_string(TransportMode mode);

} // namespace tabxfer

#endif // TABXFER_COMMON_TYPES_HH
