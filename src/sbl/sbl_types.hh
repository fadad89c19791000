// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef SBL_TYPES_HH_
#define SBL_TYPES_HH_

#include <ostream>

namespace sbl  {

enum severity_level
{
    debug,
    info,
    warning,
    error,
    fatal
};

std::ostream& operator<< (std::ostream& strm, severity_level severity);

} /* namespace sbl */

#endif /* SBL_TYPES_HH_ */
