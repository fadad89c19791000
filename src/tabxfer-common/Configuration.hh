// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_CONFIGURATION_HH
#define TABXFER_COMMON_CONFIGURATION_HH

#include <string>
#include <vector>
#include <map>

#include "tabxfer-common/Types.hh"
#include "tabxfer-common/InfoInterface.hh"


namespace tabxfer {

/**
 * @brief Provides an object for storing configuration information used by different components
 *
 * Configuration stores all settings as strings in a key/value map. Users
 * typically pass a multiline block of text into Configuration to define
 * common settings, and then append a few site-specific settings. Some
 * fundamental details:
 *
 * - **Lowercase Names**: Each key is converted to lowercase.
 *
 * - **Appends Overwrite**: New additions overwrite previous values. Appending
 *   "<>" to a name appends the value to a ";" separated list instead.
 *
 * - **Numerical Modifiers**: Integer getters understand k=1024, m=1024*1024,
 *   and g=1024*1024*1024 (eg, "tabxfer.load.chunk_size_bytes 64m").
 *
 * - **Node Role**: When a "node_role" is set, a request for "x" checks
 *   "role.x", then "default.x", then "x".
 *
 * - **Appending from Other Sources**: "config.additional_files" and
 *   "config.additional_files.env_name[.if_defined]" name extra files that
 *   are pulled in by AppendFromReferences.
 */
class Configuration : public InfoInterface {

public:
  Configuration() : Configuration("") {}
  Configuration(const std::string &config_str, const std::string &env_variable_for_extra_settings="TABXFER_CONFIG");
  ~Configuration() override;

  //Pass in additional configuration data
  rc_t Append(const std::string &config_str);
  rc_t Append(const std::string &name, const std::string &val);
  rc_t AppendFromFile(const std::string &file_name);
  rc_t AppendFromReferences();

  //Update the config after it's been generated
  rc_t Set(const std::string &name, const std::string &val);
  rc_t Set(const std::string &name, const char *val);

  //Get values out of the config. Returns 0 if ok, ENOENT if default used, EINVAL if unparsable
  rc_t GetString(std::string *val, const std::string &name, const std::string &default_value="") const;
  rc_t GetLowercaseString(std::string *val, const std::string &name, const std::string &default_value="") const;
  rc_t GetInt(int64_t *val, const std::string &name, const std::string &default_value="0") const;
  rc_t GetBool(bool *val, const std::string &name, const std::string &default_value="false") const;

  std::string GetRole() const;

  //InfoInterface function
  void sstr(std::stringstream &ss, int depth=0, int indent=0) const override;

private:
  std::string node_role;

  int findBestMatch(std::string *val, const std::string &name, const std::string &default_value) const;
  static std::vector<std::string> tokenizeLine(const std::string &str);
  int addConfigToMap(const std::string &config);

  std::map<std::string, std::string> config_map; //Holds all the config k/vs

};

} // namespace tabxfer

#endif // TABXFER_COMMON_CONFIGURATION_HH
