#ifndef DATASTORE_LOGGER_HPP
#define DATASTORE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace datastore::logging {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

// Initialize logging system with a rotating file sink and an optional console sink
void init_logging(const std::string& log_file = "datastore.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// ---- RUNTIME CONTROL ----
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace datastore::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LOG_INFO BOOST_LOG_TRIVIAL(info)
#define LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // DATASTORE_LOGGER_HPP
