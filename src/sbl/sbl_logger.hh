// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef SBL_LOGGER_HH_
#define SBL_LOGGER_HH_

#include <cstdint>
#include <ostream>
#include <string>

#include "sbl/sbl_types.hh"
#include "sbl/sbl_source.hh"
#include "sbl/sbl_stream.hh"

namespace sbl  {

/*
 * This is the simplified logger class.  It creates one stream with a
 * severity threshold and a source for each severity level.
 */
class logger {
public:
    explicit logger(
        const severity_level severity);
    logger(
        std::ostream&        stream,
        const severity_level severity);
    logger(
        const std::string&   filename,
        const severity_level severity);
    ~logger();

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    void set_severity(
            const severity_level severity);
    severity_level severity(void) const;
    void set_channel_severity(
            const std::string&   channel,
            const severity_level severity);
    void flush(void);

    void log(
        const severity_level severity,
        const std::string   &channel,
        const std::string   &msg);

    sbl::source& source_for(const severity_level severity);
    sbl::source& debug_source(void)   { return debug_source_; }
    sbl::source& info_source(void)    { return info_source_; }
    sbl::source& warning_source(void) { return warning_source_; }
    sbl::source& error_source(void)   { return error_source_; }
    sbl::source& fatal_source(void)   { return fatal_source_; }

private:
    void init(void);

private:
    uint64_t logger_id_;

    sbl::stream stream_;

    sbl::source debug_source_;
    sbl::source info_source_;
    sbl::source warning_source_;
    sbl::source error_source_;
    sbl::source fatal_source_;
};

} /* namespace sbl */

#endif /* SBL_LOGGER_HH_ */
