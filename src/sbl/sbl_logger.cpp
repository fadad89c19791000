// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <atomic>

#include "sbl/sbl_logger.hh"


namespace {
std::atomic<uint64_t> next_logger_id(1);
}


namespace sbl  {

    logger::logger(
        const severity_level severity)
    : logger_id_(next_logger_id++),
      stream_(severity),
      debug_source_(severity_level::debug),
      info_source_(severity_level::info),
      warning_source_(severity_level::warning),
      error_source_(severity_level::error),
      fatal_source_(severity_level::fatal)
    {
        init();
    }
    logger::logger(
        std::ostream&        stream,
        const severity_level severity)
    : logger_id_(next_logger_id++),
      stream_(stream, severity),
      debug_source_(severity_level::debug),
      info_source_(severity_level::info),
      warning_source_(severity_level::warning),
      error_source_(severity_level::error),
      fatal_source_(severity_level::fatal)
    {
        init();
    }
    logger::logger(
        const std::string&   filename,
        const severity_level severity)
    : logger_id_(next_logger_id++),
      stream_(filename, severity),
      debug_source_(severity_level::debug),
      info_source_(severity_level::info),
      warning_source_(severity_level::warning),
      error_source_(severity_level::error),
      fatal_source_(severity_level::fatal)
    {
        init();
    }
    logger::~logger()
    {
    }

    void
    logger::set_severity(
            const severity_level severity)
    {
        stream_.set_severity(severity);
    }

    severity_level
    logger::severity(void) const
    {
        return stream_.severity();
    }

    void
    logger::set_channel_severity(
            const std::string&   channel,
            const severity_level severity)
    {
        stream_.set_channel_severity(channel, severity);
    }

    void
    logger::flush(void)
    {
        stream_.flush();
    }

    void
    logger::log(
        const severity_level severity,
        const std::string   &channel,
        const std::string   &msg)
    {
        source_for(severity).log(channel, msg);
    }

    sbl::source&
    logger::source_for(const severity_level severity)
    {
        switch (severity) {
            case severity_level::debug:   return debug_source_;
            case severity_level::info:    return info_source_;
            case severity_level::warning: return warning_source_;
            case severity_level::error:   return error_source_;
            default:                      return fatal_source_;
        }
    }

    /* private methods */
    void
    logger::init(void)
    {
        stream_.set_logger_id(logger_id_);

        debug_source_.set_logger_id(logger_id_);
        info_source_.set_logger_id(logger_id_);
        warning_source_.set_logger_id(logger_id_);
        error_source_.set_logger_id(logger_id_);
        fatal_source_.set_logger_id(logger_id_);
    }
}
