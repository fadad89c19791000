// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_STRINGHELPERS_HH
#define TABXFER_COMMON_STRINGHELPERS_HH

#include <vector>
#include <string>

#include "tabxfer-common/Types.hh"

namespace tabxfer {

//Note: These all convert k/m/g suffixes to x1024 etc
int StringToInt64(int64_t *val, const std::string &token);
int StringToBoolean(bool *val, const std::string &token);

bool StringEndsWith(const std::string &s, const std::string &search_suffix);

std::vector<std::string> Split(const std::string &text, char sep, bool remove_empty=true);
void Split(std::vector<std::string> &tokens, const std::string &text, char sep, bool remove_empty=true);
std::string Join(const std::vector<std::string> &tokens, char sep);

std::string ToLowercase(std::string const &s);

std::string ExpandPathSafely(std::string const &s);

} // namespace tabxfer

#endif // TABXFER_COMMON_STRINGHELPERS_HH
