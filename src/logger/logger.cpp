#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace biowiki::logging {

namespace {

template <typename Sink>
void set_format(Sink& sink) {
  namespace expr = boost::log::expressions;
  sink.set_formatter(
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage
  );
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  auto core = boost::log::core::get();

  // Clear any existing sinks
  core->remove_all_sinks();

  // Console sink
  using console_sink_t = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
  auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  console_backend->auto_flush(true);
  auto console_sink = boost::make_shared<console_sink_t>(console_backend);
  set_format(*console_sink);
  core->add_sink(console_sink);

  // Optional file sink
  if (!log_file.empty()) {
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto file_backend = boost::make_shared<boost::log::sinks::text_file_backend>(
      boost::log::keywords::file_name = log_path.string(),
      boost::log::keywords::rotation_size = 10 * 1024 * 1024,
      boost::log::keywords::open_mode = std::ios::out | std::ios::app
    );
    file_backend->auto_flush(true);

    using file_sink_t = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto file_sink = boost::make_shared<file_sink_t>(file_backend);
    set_format(*file_sink);
    core->add_sink(file_sink);
  }

  boost::log::add_common_attributes();
  set_log_level(min_level);
  core->set_logging_enabled(true);

  BOOST_LOG_TRIVIAL(debug) << "Logging initialized" << (log_file.empty() ? "" : " with file: ") << log_file;
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

std::optional<severity_level> parse_log_level(const std::string& name) {
  severity_level level;
  if (boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    return level;
  }
  return std::nullopt;
}

} // namespace biowiki::logging
