// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <sstream>

#include "tabxfer-ipc/ResultDescriptor.hh"

using namespace std;

namespace tabxfer {

string ResultDescriptor::str() const {
  stringstream ss;
  ss << "result " << result_id
     << " [" << num_rows << " rows x " << num_columns << " cols]"
     << " on " << to_string(device_kind) << ":" << device_id
     << " via " << to_string(transport);
  if(UsesSegment()) {
    ss << " key " << segment_key << " size " << segment_size;
  } else {
    ss << " payload " << ((payload) ? payload->size() : 0) << " bytes";
  }
  return ss.str();
}

} // namespace tabxfer
