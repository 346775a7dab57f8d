#include "ingredients/server.hpp"

#include "ingredients/error.hpp"
#include "ingredients/version.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace ingredients {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr const char* kIngredientsTarget = "/ingredients";

Server::Response make_response(const Server::Request& request, http::status status, std::string body) {
  Server::Response response(status, request.version());
  response.set(http::field::server, kUserAgent);
  response.set(http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

Server::Response bad_request_response() {
  Server::Response response(http::status::bad_request, 11);
  response.set(http::field::server, kUserAgent);
  response.set(http::field::content_type, "application/json");
  response.keep_alive(false);
  response.body() = nlohmann::json{{"error", "Bad Request"}}.dump();
  response.prepare_payload();
  return response;
}

bool is_parse_error(const beast::error_code& ec) {
  return ec.category() == http::make_error_code(http::error::bad_method).category();
}

std::string target_path(beast::string_view target) {
  auto query = target.find('?');
  if (query != beast::string_view::npos) {
    target = target.substr(0, query);
  }
  return std::string(target);
}

class Session : public std::enable_shared_from_this<Session> {
public:
  Session(tcp::socket&& socket, const Server& server)
      : stream_(std::move(socket)), server_(server) {}

  void run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&Session::do_read, shared_from_this()));
  }

private:
  void do_read() {
    request_ = {};
    stream_.expires_after(server_.idle_timeout());
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
      do_close();
      return;
    }
    if (ec) {
      server_.logger().log(LogLevel::Warn, "failed to read request", {{"error", ec.message()}});
      if (!is_parse_error(ec)) {
        do_close();
        return;
      }
      response_ = bad_request_response();
    } else {
      response_ = server_.handle_request(request_);
    }

    bool keep_alive = response_.keep_alive();
    stream_.expires_after(server_.idle_timeout());
    http::async_write(stream_, response_,
                      [self = shared_from_this(), keep_alive](beast::error_code write_ec, std::size_t) {
                        self->on_write(keep_alive, write_ec);
                      });
  }

  void on_write(bool keep_alive, beast::error_code ec) {
    if (ec) {
      server_.logger().log(LogLevel::Warn, "failed to write response", {{"error", ec.message()}});
      return;
    }
    if (!keep_alive) {
      do_close();
      return;
    }
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  Server::Request request_;
  Server::Response response_;
  const Server& server_;
};

}  // namespace

Server::Server(const IngredientHandler& handler, ServerOptions options, Logger logger)
    : handler_(handler),
      options_(std::move(options)),
      logger_(std::move(logger)),
      ioc_(static_cast<int>(std::max<std::size_t>(1, options_.threads))),
      acceptor_(net::make_strand(ioc_)) {}

Server::~Server() {
  stop();
}

void Server::init() {
  beast::error_code ec;
  auto address = net::ip::make_address(options_.host, ec);
  if (ec) {
    throw ServerError("Invalid listen address '" + options_.host + "': " + ec.message());
  }
  tcp::endpoint endpoint(address, options_.port);

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw ServerError("Failed to open acceptor: " + ec.message());
  }
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw ServerError("Failed to set SO_REUSEADDR: " + ec.message());
  }
  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw ServerError("Failed to bind " + options_.host + ":" + std::to_string(options_.port) + ": " + ec.message());
  }
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw ServerError("Failed to listen: " + ec.message());
  }

  logger_.log(LogLevel::Info, "server listening", {{"host", options_.host}, {"port", port()}});
}

unsigned short Server::port() const {
  beast::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  if (ec) {
    return options_.port;
  }
  return endpoint.port();
}

void Server::run() {
  if (!acceptor_.is_open()) {
    throw ServerError("Server::init() must succeed before run()");
  }
  do_accept();

  const std::size_t thread_count = std::max<std::size_t>(1, options_.threads);
  std::vector<std::thread> workers;
  workers.reserve(thread_count - 1);
  for (std::size_t i = 1; i < thread_count; ++i) {
    workers.emplace_back([this] { ioc_.run(); });
  }
  ioc_.run();
  for (auto& worker : workers) {
    worker.join();
  }
  logger_.log(LogLevel::Info, "server stopped");
}

void Server::stop() {
  ioc_.stop();
}

void Server::do_accept() {
  acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        logger_.log(LogLevel::Error, "accept failed", {{"error", ec.message()}});
      }
    } else {
      beast::error_code remote_ec;
      auto remote = socket.remote_endpoint(remote_ec);
      if (!remote_ec) {
        logger_.log(LogLevel::Debug, "connection accepted", {{"remote", remote.address().to_string()}});
      }
      std::make_shared<Session>(std::move(socket), *this)->run();
    }
    if (acceptor_.is_open()) {
      do_accept();
    }
  });
}

Server::Response Server::handle_request(const Request& request) const {
  const std::string path = target_path(request.target());
  logger_.log(LogLevel::Info, "handling request",
              {{"method", std::string(request.method_string())}, {"path", path}});

  if (path != kIngredientsTarget) {
    return make_response(request, http::status::not_found, nlohmann::json{{"error", "Not Found"}}.dump());
  }
  if (request.method() != http::verb::post) {
    auto response = make_response(request, http::status::method_not_allowed,
                                  nlohmann::json{{"error", "Method Not Allowed"}}.dump());
    response.set(http::field::allow, "POST");
    return response;
  }

  HandlerResponse result = handler_.handle(request.body());
  return make_response(request, static_cast<http::status>(result.status), std::move(result.body));
}

}  // namespace ingredients
