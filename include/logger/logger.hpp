#ifndef IMGXFER_LOGGER_HPP
#define IMGXFER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace imgxfer {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a file sink, or a console sink when log_file is empty, and applies min_level
void init_logging(const std::string& log_file = "imgxfer.log",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity of the installed sinks
void set_log_level(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_log_level(const std::string& name, severity_level& level);

} // namespace logging
} // namespace imgxfer

#endif // IMGXFER_LOGGER_HPP
