#include "../include/kridge_bits/logging.hpp"

#include <iostream>
#include <stdexcept>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace kridge {

namespace {

bool sink_installed = false;

void install_console_sink() {
    typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend> sink_t;

    auto core = boost::log::core::get();
    core->remove_all_sinks();

    auto sink = boost::make_shared<sink_t>();
    sink->locked_backend()->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    sink->locked_backend()->auto_flush(true);
    sink->set_formatter(boost::log::expressions::stream
                        << boost::log::expressions::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%b-%d %H:%M:%S.%f")
                        << " [" << boost::log::trivial::severity << "] "
                        << boost::log::expressions::smessage);
    core->add_sink(sink);
    boost::log::add_common_attributes();
    sink_installed = true;
}

}

boost::log::trivial::severity_level parse_log_level(const std::string& level) {
    if (level == "trace") return boost::log::trivial::trace;
    if (level == "debug") return boost::log::trivial::debug;
    if (level == "info") return boost::log::trivial::info;
    if (level == "warning" || level == "warn") return boost::log::trivial::warning;
    if (level == "error") return boost::log::trivial::error;
    throw std::invalid_argument("unknown log level: " + level);
}

void init_logging(const std::string& level) {
    const auto threshold = parse_log_level(level);
    if (!sink_installed) {
        install_console_sink();
    }
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= threshold);
}

}
