#ifndef KRIDGE_LOGGING_H
#define KRIDGE_LOGGING_H

#include <string>
#include <boost/log/trivial.hpp>

namespace kridge {

// Installs the console sink on first call and sets the severity threshold.
// level: trace, debug, info, warning, error
void init_logging(const std::string& level);

boost::log::trivial::severity_level parse_log_level(const std::string& level);

}

#define KRIDGE_LOG_TRACE(msg) BOOST_LOG_TRIVIAL(trace) << msg
#define KRIDGE_LOG_DEBUG(msg) BOOST_LOG_TRIVIAL(debug) << msg
#define KRIDGE_LOG_INFO(msg) BOOST_LOG_TRIVIAL(info) << msg
#define KRIDGE_LOG_WARN(msg) BOOST_LOG_TRIVIAL(warning) << msg
#define KRIDGE_LOG_ERROR(msg) BOOST_LOG_TRIVIAL(error) << msg

#endif
