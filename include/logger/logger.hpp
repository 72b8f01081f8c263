#ifndef QULOUD_LOGGER_HPP
#define QULOUD_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace quloud::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink and, when log_file is non-empty, a text file sink.
// Existing sinks are removed first so repeated calls do not duplicate output.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::info);

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning, error, fatal (case-insensitive).
// Throws std::invalid_argument for anything else.
severity_level parse_log_level(const std::string& text);

} // namespace quloud::logging

#endif // QULOUD_LOGGER_HPP
