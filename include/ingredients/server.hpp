#pragma once

#include "ingredients/ingredient_handler.hpp"
#include "ingredients/logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace ingredients {

struct ServerOptions {
  std::string host = "0.0.0.0";
  unsigned short port = 8080;
  std::size_t threads = 4;
  std::chrono::seconds idle_timeout{30};
};

class Server {
public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  Server(const IngredientHandler& handler, ServerOptions options, Logger logger = {});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /// Binds and listens. Throws ServerError when the address cannot be used.
  void init();

  /// The bound port; differs from the configured one when that was 0.
  unsigned short port() const;

  /// Serves connections on `threads` threads until stop() is called.
  void run();

  /// Thread-safe; makes run() return.
  void stop();

  /// Routes one parsed request. Only `POST /ingredients` reaches the handler.
  Response handle_request(const Request& request) const;

  const Logger& logger() const { return logger_; }
  std::chrono::seconds idle_timeout() const { return options_.idle_timeout; }

private:
  void do_accept();

  const IngredientHandler& handler_;
  ServerOptions options_;
  Logger logger_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
};

}  // namespace ingredients
