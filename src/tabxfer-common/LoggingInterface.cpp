// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/LoggingInterface.hh"


#if TABXFER_LOGGINGINTERFACE_DISABLED==0 && TABXFER_LOGGINGINTERFACE_USE_SBL==1

#include "sbl/sbl_logger.hh"

#define LI_LOG_DEBUG(s)  sbl_logger->log(sbl::severity_level::debug,   GetFullName(), s);
#define LI_LOG_INFO(s)   sbl_logger->log(sbl::severity_level::info,    GetFullName(), s);
#define LI_LOG_WARN(s)   sbl_logger->log(sbl::severity_level::warning, GetFullName(), s);
#define LI_LOG_ERROR(s)  sbl_logger->log(sbl::severity_level::error,   GetFullName(), s);
#define LI_LOG_FATAL(s)  sbl_logger->log(sbl::severity_level::fatal,   GetFullName(), s);

#else

#define LI_LOG_DEBUG(s)  std::cout << "\033[1;31mD " << GetFullName() << ":\033[0m " << (s) << std::endl;
#define LI_LOG_INFO(s)   std::cout << "\033[1;31mI " << GetFullName() << ":\033[0m " << (s) << std::endl;
#define LI_LOG_WARN(s)   std::cout << "\033[1;31mW " << GetFullName() << ":\033[0m " << (s) << std::endl;
#define LI_LOG_ERROR(s)  std::cerr << "E " << GetFullName() << ": " << (s) << std::endl;
#define LI_LOG_FATAL(s)  std::cerr << "F " << GetFullName() << ": " << (s) << std::endl;

#endif


using namespace std;

namespace tabxfer {

#if TABXFER_LOGGINGINTERFACE_DISABLED==0 && TABXFER_LOGGINGINTERFACE_USE_SBL==1
namespace {

//All components share one console logger. File loggers are shared by name
//so two components writing to the same file don't truncate each other.
std::mutex logger_mutex;

shared_ptr<sbl::logger> consoleLogger() {
  lock_guard<mutex> lock(logger_mutex);
  static shared_ptr<sbl::logger> console = make_shared<sbl::logger>(sbl::severity_level::debug);
  return console;
}

shared_ptr<sbl::logger> fileLogger(const string &filename) {
  lock_guard<mutex> lock(logger_mutex);
  static map<string, weak_ptr<sbl::logger>> file_loggers;
  auto existing = file_loggers[filename].lock();
  if(existing) return existing;
  auto fresh = make_shared<sbl::logger>(filename, sbl::severity_level::debug);
  file_loggers[filename] = fresh;
  return fresh;
}

} // namespace
#endif


LoggingInterface::LoggingInterface(string component_name)
  : LoggingInterface(std::move(component_name), "") {
}

LoggingInterface::LoggingInterface(string component_name, string subcomponent_name)
  : component_name(std::move(component_name)),
    subcomponent_name(std::move(subcomponent_name)),
    debug_enabled(false),
    info_enabled(false),
    warn_enabled(true) {

#if TABXFER_LOGGINGINTERFACE_DISABLED==0 && TABXFER_LOGGINGINTERFACE_USE_SBL==1
  // Use the console until ConfigureLogging says otherwise
  sbl_logger = consoleLogger();
#endif
}

LoggingInterface::~LoggingInterface() = default;

void LoggingInterface::ConfigureLogging(const Configuration &config) {

  SetLoggingLevel(GetLoggingLevelFromConfiguration(config, component_name));

#if TABXFER_LOGGINGINTERFACE_DISABLED==0 && TABXFER_LOGGINGINTERFACE_USE_SBL==1
  string logfile;
  if(0 == config.GetString(&logfile, component_name+".log.filename")) {
    sbl_logger = fileLogger(logfile);
  }
#endif
}

/**
 * @brief Static function for inspecting a config and pulling out as log level for a component
 * @param config The config to inspect
 * @param component_name The component for the log level
 * @return log_level An integer value that encodes debug(0x1)/info(0x2)/warn(0x4) settings
 * @note Warnings stay on unless a setting turns them off
 */
int LoggingInterface::GetLoggingLevelFromConfiguration(const Configuration &config, const string &component_name) {
  //Usually we want to be explicit about all our names, like x.log.info.
  //However, we also want to be able to be lazy and just tag a
  //component as being in debug mode.
  bool dbg_enabled=false, nfo_enabled=false, wrn_enabled=true;

  //Allow user to do "component.debug" instead of "component.log.debug"
  config.GetBool(&dbg_enabled, component_name+".debug", "false");
  string default_setting=(dbg_enabled) ? "true" : "false";

  //But still trust log.debug as an override.
  config.GetBool(&dbg_enabled, component_name+".log.debug", default_setting);
  config.GetBool(&nfo_enabled, component_name+".log.info",  default_setting);
  config.GetBool(&wrn_enabled, component_name+".log.warn",  "true");

  int loglevel = 0;
  if(dbg_enabled) loglevel  = 0x01;
  if(nfo_enabled) loglevel |= 0x02;
  if(wrn_enabled) loglevel |= 0x04;

  return loglevel;
}

void LoggingInterface::SetLoggingLevel(int log_level) {
  debug_enabled = (log_level & 0x01);
  info_enabled  = (log_level & 0x02);
  warn_enabled  = (log_level & 0x04);
}

void LoggingInterface::ConfigureLoggingDebug(bool enable_debug) {
  debug_enabled=enable_debug;
}


#if TABXFER_LOGGINGINTERFACE_DISABLED==0
void LoggingInterface::dbg(const string &s) const {
  if(debug_enabled) {
    LI_LOG_DEBUG(s);
  }
}
void LoggingInterface::info(const string &s) const {
  if(info_enabled) {
    LI_LOG_INFO(s);
  }
}
void LoggingInterface::warn(const string &s) const {
  if(warn_enabled) {
    LI_LOG_WARN(s);
  }
}
void LoggingInterface::error(const string &s) const {
  LI_LOG_ERROR(s);
}
void LoggingInterface::fatal(const string &s) const {
  LI_LOG_FATAL(s);
  throw std::runtime_error("F "+GetFullName()+": "+s);
}

#else
void LoggingInterface::fatal(const string &s) const {
  throw std::runtime_error("F "+GetFullName()+": "+s);
}
#endif

} // namespace tabxfer
