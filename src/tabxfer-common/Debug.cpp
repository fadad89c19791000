// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cstdlib>
#include <iostream>

#include "tabxfer-common/Debug.hh"

using namespace std;

namespace tabxfer {


void _f_assert(bool true_or_die, const std::string &message, const char *file, int line) {

  if(true_or_die) return;

  static int  _f_fail_count=0;
  _f_fail_count++;

  cout <<TXT_RED<<"tabxfer assert #("<<_f_fail_count<<"): "<<TXT_NORMAL<<message<<" in "<<file<<":"<<line<<endl;
  if(TABXFER_ASSERT_METHOD_DEBUG_WARN) return;
  exit(-1);
}

} // namespace tabxfer
