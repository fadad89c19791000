// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_HH
#define TABXFER_COMMON_HH

#include "tabxfer-common/Types.hh"
#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/Debug.hh"
#include "tabxfer-common/InfoInterface.hh"
#include "tabxfer-common/LoggingInterface.hh"
#include "tabxfer-common/Status.hh"
#include "tabxfer-common/StringHelpers.hh"

#endif // TABXFER_COMMON_HH
