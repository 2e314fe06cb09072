#ifndef CASTORE_LOGGER_HPP
#define CASTORE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace castore::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a truncating, auto-flushing text file sink
void init_logging(const std::string& log_file = "castore.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

// Drops records below min_level
void set_log_level(severity_level min_level);

} // namespace castore::logging

#endif // CASTORE_LOGGER_HPP
