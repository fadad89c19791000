// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_DEBUG_HH
#define TABXFER_COMMON_DEBUG_HH

#include <string>

#include "tabxferConfig.h"


// Assertions are for programming faults only (eg a planner handing back a
// batch with mismatched column lengths). Errors a caller can cause are
// reported through arrow::Status instead.
//
// cassert (default):  just handle with standard assert macro (drops the message)
// debugWarn:          Dump the message, but continue on.
// debugExit:          Dump the message and exit.
#if TABXFER_ASSERT_METHOD_NONE
#define F_ASSERT(a,msg) {}
#elif (TABXFER_ASSERT_METHOD_DEBUG_WARN || TABXFER_ASSERT_METHOD_DEBUG_EXIT)
#define F_ASSERT(a,msg) { tabxfer::_f_assert(a, msg, __FILE__, __LINE__); }
#else
#include <cassert>
#define F_ASSERT(a,msg) { assert(a); }
#endif


namespace tabxfer {

void _f_assert(bool true_or_die, const std::string &message, const char *file, int line);

const std::string TXT_RED = "\033[1;31m";
const std::string TXT_NORMAL = "\033[0m";

} // namespace tabxfer

#endif // TABXFER_COMMON_DEBUG_HH
