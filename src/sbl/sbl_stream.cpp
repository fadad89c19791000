// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <fstream>
#include <iostream>

#include "sbl/sbl_stream.hh"


namespace sbl  {

    stream::stream(
        const severity_level severity)
    : logger_id_(0),
      severity_(severity)
    {
        init(
            boost::shared_ptr< std::ostream > (&std::clog, boost::null_deleter()),
            severity);
    }
    stream::stream(
        std::ostream&        stream,
        const severity_level severity)
    : logger_id_(0),
      severity_(severity)
    {
        init(
            boost::shared_ptr< std::ostream > (&stream, boost::null_deleter()),
            severity);
    }
    stream::stream(
        const std::string&   filename,
        const severity_level severity)
    : logger_id_(0),
      severity_(severity)
    {
        init(
            boost::make_shared< std::ofstream > (filename),
            severity);
    }
    stream::~stream()
    {
        sink_->flush();
        boost::log::core::get()->remove_sink(sink_);
    }

    void stream::set_severity(
            const severity_level severity)
    {
        severity_ = severity;
        // debug output is usually read while chasing a problem, so don't buffer it
        backend_->auto_flush(severity_level::debug == severity_);
        update_filter();
    }

    severity_level stream::severity(void) const
    {
        return severity_;
    }

    void stream::set_channel_severity(
            const std::string&   channel,
            const severity_level severity)
    {
        channel_severity_[channel] = severity;
        if (severity_level::debug == severity) {
            backend_->auto_flush(true);
        }
        update_filter();
    }

    void stream::set_logger_id(uint64_t id)
    {
        logger_id_ = id;
        update_filter();
    }

    void stream::flush(void)
    {
        sink_->flush();
    }

    /* private methods */
    void stream::init(
            boost::shared_ptr< std::ostream > stream,
            const severity_level              severity)
    {
        stream_ = stream;

        backend_ = boost::make_shared< boost::log::sinks::text_ostream_backend >();
        backend_->auto_flush(severity_level::debug == severity);
        backend_->add_stream(stream_);

        sink_ = boost::make_shared< text_sink >(backend_);
        sink_->set_formatter
        (
            boost::log::expressions::stream
            << line_id_attr
            << ": <" << severity_attr
            << "> [" << channel_attr << "] "
            << boost::log::expressions::smessage
        );
        update_filter();

        boost::log::core::get()->add_sink(sink_);
        boost::log::add_common_attributes();
    }

    void stream::update_filter(void)
    {
        // The filter captures copies so later changes need a fresh filter
        uint64_t id = logger_id_;
        severity_level fallback = severity_;
        std::map< std::string, severity_level > channels = channel_severity_;

        sink_->set_filter(
            [id, fallback, channels](const boost::log::attribute_value_set &attrs) {
                auto rec_id = attrs[logger_id_attr];
                if (!rec_id || (rec_id.get() != id)) return false;
                auto rec_sev = attrs[severity_attr];
                if (!rec_sev) return false;
                severity_level threshold = fallback;
                auto rec_chan = attrs[channel_attr];
                if (rec_chan) {
                    auto it = channels.find(rec_chan.get());
                    if (it != channels.end()) threshold = it->second;
                }
                return rec_sev.get() >= threshold;
            });
    }

    std::ostream& operator<< (std::ostream& strm, severity_level severity)
    {
        static const char* strings[] =
        {
            "DEBUG",
            "INFO",
            "WARN",
            "ERROR",
            "FATAL"
        };

        if (static_cast< std::size_t >(severity) < sizeof(strings) / sizeof(*strings))
            strm << strings[severity];
        else
            strm << static_cast< int >(severity);

        return strm;
    }
}
