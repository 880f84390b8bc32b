#ifndef BIOWIKI_LOGGER_HPP
#define BIOWIKI_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace biowiki::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink and, when log_file is not empty, a text file sink.
// Formatting: "<timestamp> [<severity>] <message>"
void init_logging(const std::string& log_file = "", severity_level min_level = severity_level::info);

// Drops every record below level
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning, error, fatal
std::optional<severity_level> parse_log_level(const std::string& name);

} // namespace biowiki::logging

#endif // BIOWIKI_LOGGER_HPP
