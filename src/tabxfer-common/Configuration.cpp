// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cerrno>
#include <cstdlib>
#include <vector>
#include <map>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/StringHelpers.hh"

using namespace std;

namespace tabxfer {

/**
 * @brief Parse a user-supplied Configuration
 * @param[in] config_str A multi-line string with different config settings in it
 * @param[in] env_variable_for_extra_settings Name of an environment variable that points to a file with additional settings
 * @throws runtime_error if the initialization string cannot be parsed
 * @note The env file is NOT loaded here. Call AppendFromReferences to pull it in.
 */
Configuration::Configuration(const string &config_str,
                             const string &env_variable_for_extra_settings)
  : node_role("default") {

  if(!env_variable_for_extra_settings.empty()) {
    Append("config.additional_files.env_name.if_defined", env_variable_for_extra_settings);
  }
  if(!config_str.empty()) {
    rc_t rc = Append(config_str);
    if(rc!=0) throw std::runtime_error("Configuration's initialization string had errors");
  }
}

Configuration::~Configuration() = default;

/**
 * @brief Parse a multi-line string and append configuration data
 * @param[in] config_str One or more lines of configuration data (separated by \n)
 * @retval 0 Always works
 */
rc_t Configuration::Append(const string &config_str) {
  addConfigToMap(config_str);
  return 0;
}

rc_t Configuration::Append(const string &name, const string &val) {
  return Set(name,val);
}

/**
 * @brief Parse one or more files and load in their configuration data
 * @param[in] file_name One or more ";" separated file names to load
 * @retval 0 All files were read
 * @retval ENOENT One or more files could not be opened (others are still loaded)
 */
rc_t Configuration::AppendFromFile(const string &file_name) {
  stringstream ssout;
  rc_t rc = 0;

  for(auto &segment : Split(file_name, ';')) {
    string expanded = ExpandPathSafely(segment);
    if(expanded.empty()) { rc = ENOENT; continue; }
    ifstream src(expanded.c_str());
    if(!src.is_open()) { rc = ENOENT; continue; }
    ssout << src.rdbuf() << "\n";
  }
  Append(ssout.str());
  return rc;
}

/**
 * @brief Load additional settings from files, including those defined by
 *        environment variables
 * @retval 0 Files loaded (or none requested)
 * @throws runtime_error if config.additional_files.env_name names an undefined variable
 *
 * - **config.additional_files abc;def**: append data from files abc and def
 * - **config.additional_files.env_name ABC**: read the file name from env var ABC (must exist)
 * - **config.additional_files.env_name.if_defined ABC**: same, but skip if ABC isn't set
 *
 * @note The markers are removed once this runs in order to avoid endless loops
 */
rc_t Configuration::AppendFromReferences() {

  string additional_filenames;
  string env_name1,env_name2;
  GetString(&additional_filenames, "config.additional_files","");
  GetString(&env_name1,            "config.additional_files.env_name","");
  GetString(&env_name2,            "config.additional_files.env_name.if_defined","");

  config_map.erase("config.additional_files");
  config_map.erase("config.additional_files.env_name");
  config_map.erase("config.additional_files.env_name.if_defined");

  vector<string> files;
  if(!additional_filenames.empty()) files.push_back(additional_filenames);

  if(!env_name1.empty()) {
    char *config_file = getenv(env_name1.c_str());
    if(config_file== nullptr) {
      throw std::runtime_error("Configuration error: config.additional_files.env_name set to "+env_name1+
                               " but that environment variable is not defined");
    }
    files.push_back(config_file);
  }

  if(!env_name2.empty()) {
    char *config_file = getenv(env_name2.c_str());
    if(config_file!= nullptr) files.push_back(config_file);
  }

  if(files.empty()) return 0;
  return AppendFromFile(Join(files, ';'));
}

/**
 * @brief Set a field in the configuration to a string value
 * @param[in] name Name of the field (a "<>" suffix appends to a ";" list)
 * @param[in] val String value to set
 * @retval 0 Always works
 */
rc_t Configuration::Set(const string &name, const string &val) {

  string target_name = ToLowercase(name);
  string target_val  = val;

  if(StringEndsWith(target_name, "<>")) {
    target_name = target_name.substr(0, target_name.size()-2);
    auto ii = config_map.find(target_name);
    if(ii != config_map.end())
      target_val = ii->second + ";" + val;
  }

  config_map[target_name]=target_val;
  if(target_name == "node_role")
    node_role = val;
  return 0;
}

rc_t Configuration::Set(const string &name, const char *val) {
  return Set(name, string(val));
}

int Configuration::findBestMatch(string *val, const string &name, const string &default_value) const {

  string lname=ToLowercase(name);
  vector<string> search_list = { node_role+"."+lname,
                                 "default."+lname,
                                 lname};
  for(auto &s : search_list) {
    auto it=config_map.find(s);
    if(it!=config_map.end()) {
      if(val) *val = it->second;
      return 0;
    }
  }
  if(val) *val=default_value;
  return ENOENT;
}

/**
 * @brief Search configuration data and return string of value, or default if not found
 * @retval 0 If Found value in configuration
 * @retval ENOENT Data wasn't found, result is default value
 */
rc_t Configuration::GetString(string *val, const string &name,
                              const string &default_value) const {
  return findBestMatch(val, name, default_value);
}

rc_t Configuration::GetLowercaseString(string *val, const string &name, const string &default_value) const {
  string tmp;
  int rc = GetString(&tmp, name, default_value);
  if(val) *val = ToLowercase(tmp);
  return rc;
}

/**
 * @brief Search through configuration and return an integer value (k/m/g suffixes allowed)
 * @retval 0 If Found value in configuration
 * @retval ENOENT Data wasn't found, using default value
 * @retval EINVAL Data or default value could not be parsed to Int
 */
rc_t Configuration::GetInt(int64_t *val, const string &name,
                           const string &default_value) const {
  string tmp;
  int rc = findBestMatch(&tmp, name, default_value);
  int64_t parsed=0;
  int rc2 = StringToInt64(&parsed, tmp);
  if(rc2 != 0) return rc2;
  if(val) *val = parsed;
  return rc;
}

/**
 * @brief Search through configuration and return a boolean value
 * @retval 0 If Found value in configuration
 * @retval ENOENT Data wasn't found, using default value
 * @retval EINVAL Data or default value could not be parsed to Bool
 */
rc_t Configuration::GetBool(bool *val, const string &name,
                            const string &default_value) const {
  string tmp;
  int rc = findBestMatch(&tmp, name, default_value);
  bool parsed=false;
  int rc2 = StringToBoolean(&parsed, tmp);
  if(rc2 != 0) return rc2;
  if(val) *val = parsed;
  return rc;
}

/**
 * @brief Parse a single line and generate a vector of strings, stripping
          out comments (#)
 */
vector<string> Configuration::tokenizeLine(const string &str) {

  vector<string> tokens;
  string line = str.substr(0, str.find_first_of('#'));

  size_t p0 = line.find_first_not_of(" \t\r");
  while(p0 != string::npos) {
    size_t p1 = line.find_first_of(" \t\r", p0);
    tokens.push_back(line.substr(p0, (p1==string::npos) ? string::npos : p1-p0));
    p0 = line.find_first_not_of(" \t\r", p1);
  }
  return tokens;
}

/**
 * @brief Convert a (multi-line) configuration string to the map of config vals
 * @returns number of items found
 */
int Configuration::addConfigToMap(const string &config) {

  stringstream ss(config);
  int items_found=0;
  string item;

  while(getline(ss, item, '\n')) {
    vector<string> res = tokenizeLine(item);
    if(res.size()>1) {
      //Join the value back together with uniform spacing
      vector<string> vals(res.begin()+1, res.end());
      Append(ToLowercase(res[0]), Join(vals, ' '));
      items_found++;
    }
  }
  return items_found;
}

string Configuration::GetRole() const {
  return node_role;
}

/**
 * @brief Write debug info into a stream
 * @param[in] ss String Stream to append info into
 * @param[in] depth How many more steps in hierarchy to go down (default=0)
 * @param[in] indent How many spaces to put in front of this line (default=0)
 */
void Configuration::sstr(stringstream &ss, int depth, int indent) const {
  if(depth<0) return;

  ss << string(indent,' ') << "[Configuration]" <<endl;
  for(auto &k_v : config_map)
    ss << string(indent+2,' ') << k_v.first << " " << k_v.second << endl;
}

} // namespace tabxfer
