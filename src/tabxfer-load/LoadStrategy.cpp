// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include "tabxfer-common/Status.hh"
#include "tabxfer-common/StringHelpers.hh"
#include "tabxfer-load/LoadStrategy.hh"

using namespace std;

namespace tabxfer {

string to_string(LoadMethod method) {
  switch(method) {
    case LoadMethod::Infer:    return "infer";
    case LoadMethod::Arrow:    return "arrow";
    case LoadMethod::Columnar: return "columnar";
    case LoadMethod::Rows:     return "rows";
  }
  return "unknown";
}

string to_string(CreatePolicy policy) {
  switch(policy) {
    case CreatePolicy::Infer:  return "infer";
    case CreatePolicy::Always: return "true";
    case CreatePolicy::Never:  return "false";
  }
  return "unknown";
}

string to_string(LoadStrategy strategy) {
  switch(strategy) {
    case LoadStrategy::Arrow:    return "Arrow";
    case LoadStrategy::Columnar: return "Columnar";
    case LoadStrategy::RowWise:  return "RowWise";
  }
  return "Unknown";
}

/**
 * @brief Convert a method literal (case insensitive) into a LoadMethod
 * @retval InvalidMethod The literal isn't infer, arrow, columnar, or rows
 */
arrow::Result<LoadMethod> ParseLoadMethod(const string &text) {
  string s = ToLowercase(text);
  if(s=="infer")    return LoadMethod::Infer;
  if(s=="arrow")    return LoadMethod::Arrow;
  if(s=="columnar") return LoadMethod::Columnar;
  if(s=="rows")     return LoadMethod::Rows;
  return MakeError(ErrorCode::InvalidMethod, "Unknown load method '"+text+"' (expected infer, arrow, columnar, or rows)");
}

/**
 * @brief Convert a create literal (case insensitive) into a CreatePolicy
 * @retval InvalidOption The literal isn't infer, true, or false
 */
arrow::Result<CreatePolicy> ParseCreatePolicy(const string &text) {
  string s = ToLowercase(text);
  if(s=="infer") return CreatePolicy::Infer;
  if(s=="true")  return CreatePolicy::Always;
  if(s=="false") return CreatePolicy::Never;
  return MakeError(ErrorCode::InvalidOption, "Unknown create option '"+text+"' (expected infer, true, or false)");
}

LoadStrategy SelectLoadStrategy(LoadMethod method, const TabularData &data) {
  switch(method) {
    case LoadMethod::Arrow:    return LoadStrategy::Arrow;
    case LoadMethod::Columnar: return LoadStrategy::Columnar;
    case LoadMethod::Rows:     return LoadStrategy::RowWise;
    case LoadMethod::Infer:    break;
  }
  return (data.IsArrow()) ? LoadStrategy::Arrow : LoadStrategy::RowWise;
}

} // namespace tabxfer
