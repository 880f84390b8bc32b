#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "server/request_handler.hpp"

namespace biowiki {
namespace server {

class HttpServer {
public:
  static constexpr std::size_t MAX_BODY_BYTES = 8 * 1024 * 1024;

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // port 0 binds an ephemeral port, see local_port()
  HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler,
             const std::size_t thread_count = 4);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Port actually bound, 0 when not listening
  uint16_t local_port() const;

private:

  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  const std::size_t thread_count_;

  // Server state
  std::vector<std::thread> io_threads_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  RequestHandler& handler_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace server
} // namespace biowiki
