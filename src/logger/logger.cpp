#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace datastore::logging {

namespace {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

// Shared record layout for every sink
const auto record_format =
    expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage;

} // namespace

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

severity_level parse_severity(const std::string& name) {
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "fatal") return severity_level::fatal;
    throw std::invalid_argument("Logger: Unknown severity level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Convert to absolute path
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        boost::log::add_file_log(
            keywords::file_name = log_path.string(),
            keywords::open_mode = std::ios::out | std::ios::app,
            keywords::format = record_format,
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );

        if (console) {
            boost::log::add_console_log(
                std::clog,
                keywords::format = record_format,
                keywords::auto_flush = true
            );
        }

        boost::log::add_common_attributes();
        set_log_level(min_level);
        enable_logging();

        BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized at level " << logging::to_string(min_level)
                                << " with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace datastore::logging
