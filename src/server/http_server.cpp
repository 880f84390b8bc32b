#include "server/http_server.hpp"
#include <optional>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// One client connection. Reads a whole request, hands it to the
// RequestHandler and writes the response, looping while keep-alive holds.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket socket, RequestHandler& handler)
    : socket_(std::move(socket))
    , handler_(handler) {}

  void run() { do_read(); }

private:
  tcp::socket socket_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  http::response<http::string_body> response_;
  RequestHandler& handler_;

  void do_read() {
    parser_.emplace();
    parser_->body_limit(HttpServer::MAX_BODY_BYTES);

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, *parser_,
      [self](beast::error_code ec, std::size_t) {
        self->on_read(ec);
      });
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      close();
      return;
    }
    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Request body too large";
      response_ = http::response<http::string_body>(http::status::payload_too_large, 11);
      response_.keep_alive(false);
      response_.prepare_payload();
      do_write(false);
      return;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read failed: " << ec.message();
      close();
      return;
    }

    http::request<http::string_body> request = parser_->release();
    const std::string method(request.method_string());
    const std::string target(request.target());

    Response result = handler_.handle(method, target, request.body());
    BOOST_LOG_TRIVIAL(info) << "HTTP server: " << method << " " << target << " " << static_cast<unsigned>(result.status);

    response_ = http::response<http::string_body>(result.status, request.version());
    response_.set(http::field::server, "biowiki");
    if (!result.content_type.empty()) {
      response_.set(http::field::content_type, result.content_type);
    }
    if (!result.location.empty()) {
      response_.set(http::field::location, result.location);
    }
    response_.keep_alive(request.keep_alive());
    response_.body() = std::move(result.body);
    response_.prepare_payload();

    do_write(request.keep_alive());
  }

  void do_write(bool keep_alive) {
    auto self = shared_from_this();
    http::async_write(socket_, response_,
      [self, keep_alive](beast::error_code ec, std::size_t) {
        self->on_write(ec, keep_alive);
      });
  }

  void on_write(beast::error_code ec, bool keep_alive) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write failed: " << ec.message();
      close();
      return;
    }
    if (!keep_alive) {
      close();
      return;
    }
    do_read();
  }

  void close() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    socket_.close(ec);
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const uint16_t port, const std::string& address, RequestHandler& handler,
                       const std::size_t thread_count)
  : port_(port)
  , address_(address)
  , thread_count_(thread_count == 0 ? 1 : thread_count)
  , is_running_(false)
  , handler_(handler) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    io_context_.restart();
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Run io_context on a small pool of threads
    for (std::size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          auto work = boost::asio::make_work_guard(io_context_);
          io_context_.run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!error) {
        std::make_shared<Session>(std::move(socket), handler_)->run();
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      if (error != boost::asio::error::operation_aborted) {
        start_accept();  // Continue accepting new connections
      }
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

uint16_t HttpServer::local_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace server
} // namespace biowiki
