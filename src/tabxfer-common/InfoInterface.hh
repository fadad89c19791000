// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_INFOINTERFACE_HH
#define TABXFER_COMMON_INFOINTERFACE_HH

#include <sstream>
#include <string>

namespace tabxfer {

/**
 * @brief A simple interface for returning status info about tabxfer components
 *
 * Components that hold state (the release tracker, the local client, a
 * connection) implement sstr so their bookkeeping can be dumped while
 * debugging a transfer.
 */
class InfoInterface {

public:
  virtual void sstr(std::stringstream &ss, int depth=0, int indent=0) const = 0;
  virtual ~InfoInterface() = default;

  /**
   * @brief Get debug info about this object
   * @param[in] depth How many more steps in hierarchy to go down (default=0)
   * @param[in] indent How many spaces to put in front of this line (default=0)
   * @returns string with info
   */
  std::string str(int depth=0, int indent=0) const {
    std::stringstream ss;
    sstr(ss,depth,indent);
    return ss.str();
  }

};

} // namespace tabxfer

#endif // TABXFER_COMMON_INFOINTERFACE_HH
