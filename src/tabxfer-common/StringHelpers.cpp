// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <algorithm>

#include <wordexp.h>

#include "tabxfer-common/Debug.hh"
#include "tabxfer-common/StringHelpers.hh"

using namespace std;

namespace tabxfer {

namespace {
/// @brief Peel a k/m/g suffix off a numeric token and return its multiplier (0 if suffix is bad)
int64_t suffixMultiplier(string *digits) {
  unsigned char last_char = static_cast<unsigned char>(*digits->rbegin());
  if(isdigit(last_char)) return 1;
  digits->pop_back();
  switch(tolower(last_char)) {
    case 'k': return 1024;
    case 'm': return 1024*1024;
    case 'g': return 1024*1024*1024;
    default: break;
  }
  return 0;
}
} // namespace

/**
 * @brief Convert a numerical string (eg "100" "4K") into an int64 value (eg 100, 4096)
 * @param[out] val The output variable to set
 * @param[in] token Input string to parse
 * @retval 0 If input could be parsed
 * @retval EINVAL If input string couldn't be parsed
 */
int StringToInt64(int64_t *val, string const &token) {
  F_ASSERT(val, "Null val ptr handed to StringToInt64");
  if(token.empty()) return EINVAL;

  string digits = token;
  int64_t multiplier = suffixMultiplier(&digits);
  if((multiplier==0) || digits.empty()) {
    cerr << "Parsing problem decyphering " << token << " as an integer string\n";
    return EINVAL;
  }

  char *end = nullptr;
  errno = 0;
  long long parsed = strtoll(digits.c_str(), &end, 0);
  if((errno==ERANGE) || (end==nullptr) || (*end!='\0')) return EINVAL;

  int64_t scaled;
  if(__builtin_mul_overflow(static_cast<int64_t>(parsed), multiplier, &scaled)) return EINVAL;
  *val = scaled;
  return 0;
}

/**
 * @brief Convert a string (true/false, yes/no, on/off, 1/0) into a boolean
 * @param[out] val The output variable to set
 * @param[in] token Input string to parse
 * @retval 0 If input could be parsed
 * @retval EINVAL If input string wasn't a recognized boolean
 */
int StringToBoolean(bool *val, string const &token) {
  F_ASSERT(val, "Null val ptr handed to StringToBoolean");
  string s = ToLowercase(token);
  if((s=="true")  || (s=="t") || (s=="yes") || (s=="on")  || (s=="1")) { *val=true;  return 0; }
  if((s=="false") || (s=="f") || (s=="no")  || (s=="off") || (s=="0")) { *val=false; return 0; }
  return EINVAL;
}

/**
 * @brief Split a string into a vector of components
 * @param text[in] -  String to parse
 * @param sep[in] - Delimiter used to split the string
 * @param remove_empty - Allow user to specify whether empy fields are removed (eg. a:b::c gives "a","b","","c" or "a","b","c")
 * @retval vector<string> - Tokens extracted from operation
 */
vector<string> Split(const string &text, char sep, bool remove_empty) {
  vector<string> tokens;
  Split(tokens, text, sep, remove_empty);
  return tokens;
}

void Split(vector<string> &tokens, const string &text, char sep, bool remove_empty) {

  size_t start=0, end=0;
  while((end = text.find(sep, start)) != string::npos) {
    if((!remove_empty) || (start!=end)) {
      tokens.push_back(text.substr(start, end-start));
    }
    start = end+1;
  }
  if((!remove_empty) || (start!=text.size())) {
    tokens.push_back(text.substr(start));
  }
}

string Join(const vector<string> &tokens, char sep) {
  stringstream ss;
  for(size_t i=0; i<tokens.size(); i++) {
    ss<<tokens[i];
    if(i+1<tokens.size())
      ss<<sep;
  }
  return ss.str();
}

string ToLowercase(string const &s) {
  string tmp = s;
  std::transform(tmp.begin(), tmp.end(), tmp.begin(),
                 [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return tmp;
}

bool StringEndsWith(const std::string &s, const std::string &search_suffix) {
  if(search_suffix.size() > s.size()) return false;
  return std::equal(s.begin()+s.size() - search_suffix.size(),
                    s.end(),
                    search_suffix.begin());
}

/**
 * @brief Expand environment variables and ~ in a path, without running any commands
 * @param s The path to expand
 * @return The expanded path, or an empty string if expansion failed
 */
string ExpandPathSafely(string const &s) {
  if(s.empty()) return "";

  wordexp_t p;
  int rc = wordexp(s.c_str(), &p, WRDE_NOCMD | WRDE_UNDEF);
  if(rc!=0) {
    if(rc==WRDE_NOSPACE) wordfree(&p);
    return "";
  }
  string result;
  if(p.we_wordc>0) result = p.we_wordv[0];
  wordfree(&p);
  return result;
}

} // namespace tabxfer
