// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_LOGGINGINTERFACE_HH
#define TABXFER_COMMON_LOGGINGINTERFACE_HH

#include <memory>
#include <string>

#include "tabxferConfig.h"


//Forward references
namespace sbl { class logger; }
namespace tabxfer { class Configuration; }


namespace tabxfer {

/**
 * @brief A standard logging interface for tabxfer components
 *
 * Inherit this from your class and specify the name of this component. The
 * owner then hands the Configuration to ConfigureLogging, which looks for:
 *
 * - **<component>.debug**: shorthand for turning on all messages
 * - **<component>.log.debug / .log.info / .log.warn**: individual levels
 * - **<component>.log.filename**: send this component's output to a file
 *
 * Errors are always emitted. fatal() logs and then throws runtime_error.
 */
class LoggingInterface {

public:
  explicit LoggingInterface(std::string component_name);
  LoggingInterface(std::string component_name, std::string subcomponent_name);
  virtual ~LoggingInterface();

  //Allow externals to turn debug output on or off
  void ConfigureLoggingDebug(bool enable_debug);

  void SetLoggingLevel(int log_level);
  static int GetLoggingLevelFromConfiguration(const Configuration &config, const std::string &component_name);

  bool GetDebug() const { return debug_enabled; }
  std::string GetFullName() const { if (subcomponent_name.empty()) return component_name; else return component_name+"."+subcomponent_name;}
  std::string GetComponentName() const { return component_name; }
  std::string GetSubcomponentName() const { return subcomponent_name; }

protected:

  //Only allow component to set its configuration
  void ConfigureLogging(const Configuration &config);

#if TABXFER_LOGGINGINTERFACE_DISABLED==1
  void dbg(const std::string &s) const {}
  void info(const std::string &s) const {}
  void warn(const std::string &s) const {}
  void error(const std::string &s) const {}
  void fatal(const std::string &s) const;
#else
  void dbg(const std::string &s) const;
  void info(const std::string &s) const;
  void warn(const std::string &s) const;
  void error(const std::string &s) const;
  void fatal(const std::string &s) const;
#endif

private:
  std::string component_name;
  std::string subcomponent_name;
  bool debug_enabled;
  bool info_enabled;
  bool warn_enabled;

#if TABXFER_LOGGINGINTERFACE_DISABLED==0 && TABXFER_LOGGINGINTERFACE_USE_SBL==1
  std::shared_ptr<sbl::logger> sbl_logger;
#endif

};

} // namespace tabxfer

#endif // TABXFER_COMMON_LOGGINGINTERFACE_HH
