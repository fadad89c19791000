// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef SBL_STREAM_HH_
#define SBL_STREAM_HH_

#include <cstdint>
#include <map>
#include <string>

#include "sbl/sbl_boost_headers.hh"
#include "sbl/sbl_types.hh"

namespace sbl  {

typedef boost::log::sinks::synchronous_sink< boost::log::sinks::text_ostream_backend > text_sink;

// Attribute keywords shared by the sink formatter and the filters
BOOST_LOG_ATTRIBUTE_KEYWORD(line_id_attr,   "LineID",   unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity_attr,  "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(channel_attr,   "Channel",  std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(logger_id_attr, "LoggerID", uint64_t)

/*
 * A stream owns one Boost.Log sink.  The sink only accepts records that
 * carry this stream's logger id and that pass either the per-channel
 * threshold or the default threshold.
 */
class stream {
public:
    explicit stream(
        const severity_level severity);
    stream(
        std::ostream&        stream,
        const severity_level severity);
    stream(
        const std::string&   filename,
        const severity_level severity);
    ~stream();

    stream(const stream&) = delete;
    stream& operator=(const stream&) = delete;

    void set_severity(
            const severity_level severity);
    severity_level severity(void) const;
    void set_channel_severity(
            const std::string&   channel,
            const severity_level severity);
    void set_logger_id(uint64_t id);
    void flush(void);

private:
    void init(
            boost::shared_ptr< std::ostream > stream,
            const severity_level              severity);
    void update_filter(void);

private:
    uint64_t                          logger_id_;
    severity_level                    severity_;
    boost::shared_ptr< std::ostream > stream_;

    std::map< std::string, severity_level > channel_severity_;

    boost::shared_ptr< boost::log::sinks::text_ostream_backend > backend_;
    boost::shared_ptr< text_sink >                               sink_;
};

} /* namespace sbl */

#endif /* SBL_STREAM_HH_ */
