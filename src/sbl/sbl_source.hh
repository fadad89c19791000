// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef SBL_SOURCE_HH_
#define SBL_SOURCE_HH_

#include <cstdint>
#include <string>

#include "sbl/sbl_boost_headers.hh"
#include "sbl/sbl_types.hh"

/*
 * Opens a record on a source and hands back an ostream-like object, so
 * callers can write SBL_LOG_STREAM(src, "channel") << "text" << value;
 */
#define SBL_LOG_STREAM(s, c) BOOST_LOG_CHANNEL_SEV((s).boostlogger(), c, (s).severity())

namespace sbl  {

typedef boost::log::sources::severity_channel_logger_mt< severity_level, std::string > sbl_logger;

/*
 * A source emits records at one fixed severity.  Every record is tagged
 * with the id of the logger that owns the source so that only that
 * logger's stream picks it up.
 */
class source {
public:
    explicit source(
        severity_level  severity);
    ~source();

    sbl_logger& boostlogger(void);
    severity_level severity(void) const;
    void set_logger_id(uint64_t id);

    void log(
        const std::string &channel,
        const std::string &msg);

private:
    uint64_t                                           logger_id_;
    boost::log::attributes::mutable_constant<uint64_t> logger_id_attr_;

    severity_level severity_;
    sbl_logger     boostlogger_;

    bool disabled_;
};

} /* namespace sbl */

#endif /* SBL_SOURCE_HH_ */
