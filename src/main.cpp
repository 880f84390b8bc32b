#include "config/options.hpp"
#include "logger/logger.hpp"
#include "server/http_server.hpp"
#include "server/request_handler.hpp"
#include "store/web.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

bool run_server(const biowiki::config::ProgramOptions& options) {
  try {
    biowiki::store::WebCollection webs(options.directory);
    biowiki::server::RequestHandler handler(webs);
    biowiki::server::HttpServer server(options.port, options.host, handler);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to listen on " << options.host << ":" << options.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int signal_number) {
      BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
    });
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server terminated: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = biowiki::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.help) {
    biowiki::config::print_usage(std::cout, argv[0]);
    return 0;
  }

  try {
    biowiki::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
