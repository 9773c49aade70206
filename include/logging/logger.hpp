#ifndef TILEPOOL_LOGGING_LOGGER_HPP
#define TILEPOOL_LOGGING_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace tilepool { namespace logging {

typedef boost::log::trivial::severity_level severity;

// messages below this level are dropped by the logging core. until
// this is called, everything is logged.
void set_level(severity level);
severity level();

// parses a level name such as "debug", "info", "warning" or "error".
// throws std::runtime_error for anything else.
severity severity_from_string(const std::string &str);

} } // namespace tilepool::logging

#define LOG_DEBUG(x)   BOOST_LOG_TRIVIAL(debug) << (x)
#define LOG_INFO(x)    BOOST_LOG_TRIVIAL(info) << (x)
#define LOG_WARNING(x) BOOST_LOG_TRIVIAL(warning) << (x)
#define LOG_ERROR(x)   BOOST_LOG_TRIVIAL(error) << (x)

#endif // TILEPOOL_LOGGING_LOGGER_HPP
