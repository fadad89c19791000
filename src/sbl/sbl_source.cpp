// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <iostream>

#include "sbl/sbl_source.hh"


namespace sbl  {

    source::source(
        severity_level  severity)
    : logger_id_(0),
      logger_id_attr_(logger_id_),
      severity_(severity),
      disabled_(false)
    {
        boostlogger_.add_attribute("LoggerID", logger_id_attr_);
    }
    source::~source()
    {
    }

    sbl_logger& source::boostlogger(void)
    {
        return(boostlogger_);
    }

    severity_level source::severity(void) const
    {
        return(severity_);
    }

    void source::set_logger_id(uint64_t id)
    {
        logger_id_ = id;
        logger_id_attr_.set(logger_id_);
    }

    void source::log(
        const std::string &channel,
        const std::string &msg)
    {
        if (disabled_) {
            return;
        }
        try {
            BOOST_LOG_CHANNEL_SEV(boostlogger_, channel, severity_) << msg;
        }
        catch (std::exception &e) {
            // Boost.Log tears down its core at exit. Stop using it rather than crash.
            disabled_ = true;
            std::cerr << "sbl: Boost.Log threw (" << e.what() << "), logging disabled for this source\n";
        }
    }
}
