#include <gtest/gtest.h>

#include "ingredients/classification_service.hpp"
#include "ingredients/completion_client.hpp"
#include "ingredients/error.hpp"
#include "ingredients/ingredient_handler.hpp"
#include "ingredients/server.hpp"

#include "support/mock_http_client.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using ingredients::ClassificationService;
using ingredients::ClientOptions;
using ingredients::CompletionClient;
using ingredients::IngredientHandler;
using ingredients::Server;
using ingredients::ServerOptions;
using json = nlohmann::json;
namespace mock = ingredients::testing;

namespace {

class ServerTest : public ::testing::Test {
protected:
  ServerTest()
      : client_(make_options(), make_transport()),
        service_(client_),
        handler_(service_),
        server_(handler_, make_server_options()) {}

  static ClientOptions make_options() {
    ClientOptions options;
    options.api_key = "sk-test";
    return options;
  }

  static ServerOptions make_server_options() {
    ServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.threads = 2;
    return options;
  }

  std::unique_ptr<mock::MockHttpClient> make_transport() {
    auto transport = std::make_unique<mock::MockHttpClient>();
    transport_ = transport.get();
    return transport;
  }

  static Server::Request make_request(http::verb method, const std::string& target, const std::string& body = {}) {
    Server::Request request(method, target, 11);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
    return request;
  }

  mock::MockHttpClient* transport_ = nullptr;
  CompletionClient client_;
  ClassificationService service_;
  IngredientHandler handler_;
  Server server_;
};

}  // namespace

TEST_F(ServerTest, RoutesPostIngredientsToHandler) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"vegan"})"));

  auto response = server_.handle_request(make_request(http::verb::post, "/ingredients", R"({"ingredient":"tofu"})"));
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response[http::field::content_type], "application/json");
  EXPECT_EQ(json::parse(response.body()), json::parse(R"({"ingredient":"tofu","classification":"vegan"})"));
}

TEST_F(ServerTest, IgnoresQueryStringWhenRouting) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"vegan"})"));

  auto response = server_.handle_request(make_request(http::verb::post, "/ingredients?trace=1", R"({"ingredient":"tofu"})"));
  EXPECT_EQ(response.result(), http::status::ok);
}

TEST_F(ServerTest, UnknownTargetIsNotFound) {
  auto response = server_.handle_request(make_request(http::verb::post, "/recipes", R"({"ingredient":"tofu"})"));
  EXPECT_EQ(response.result(), http::status::not_found);
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ServerTest, OtherMethodsAreNotAllowed) {
  auto response = server_.handle_request(make_request(http::verb::get, "/ingredients"));
  EXPECT_EQ(response.result(), http::status::method_not_allowed);
  EXPECT_EQ(response[http::field::allow], "POST");
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ServerTest, HandlerFailuresMapToHttpStatus) {
  transport_->enqueue_error("connection refused");
  auto failed = server_.handle_request(make_request(http::verb::post, "/ingredients", R"({"ingredient":"tofu"})"));
  EXPECT_EQ(failed.result(), http::status::internal_server_error);

  auto invalid = server_.handle_request(make_request(http::verb::post, "/ingredients", "tofu"));
  EXPECT_EQ(invalid.result(), http::status::bad_request);
}

TEST_F(ServerTest, RunWithoutInitThrows) {
  EXPECT_THROW(server_.run(), ingredients::ServerError);
}

TEST_F(ServerTest, ServesClassificationOverTcp) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"regular"})"));

  server_.init();
  const unsigned short port = server_.port();
  ASSERT_NE(port, 0);
  std::thread server_thread([this] { server_.run(); });

  net::io_context ioc;
  beast::tcp_stream stream(ioc);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

  auto request = make_request(http::verb::post, "/ingredients", R"({"ingredient":"cheese"})");
  request.set(http::field::host, "127.0.0.1");
  request.keep_alive(false);
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(stream, buffer, response);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  server_.stop();
  server_thread.join();

  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(json::parse(response.body()), json::parse(R"({"ingredient":"cheese","classification":"regular"})"));
  EXPECT_EQ(transport_->call_count(), 1u);
}

TEST_F(ServerTest, MalformedRequestGetsBadRequest) {
  server_.init();
  const unsigned short port = server_.port();
  std::thread server_thread([this] { server_.run(); });

  net::io_context ioc;
  beast::tcp_stream stream(ioc);
  stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  net::write(stream.socket(), net::buffer(std::string("NOT AN HTTP REQUEST\r\n\r\n")));

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  beast::error_code read_ec;
  http::read(stream, buffer, response, read_ec);

  server_.stop();
  server_thread.join();

  ASSERT_FALSE(read_ec) << read_ec.message();
  EXPECT_EQ(response.result(), http::status::bad_request);
  EXPECT_EQ(response[http::field::content_type], "application/json");
  EXPECT_EQ(json::parse(response.body()), json::parse(R"({"error":"Bad Request"})"));
  EXPECT_FALSE(response.keep_alive());
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST(ServerInitTest, RejectsInvalidListenAddress) {
  ClientOptions client_options;
  client_options.api_key = "sk-test";
  CompletionClient client(client_options, std::make_unique<mock::MockHttpClient>());
  ClassificationService service(client);
  IngredientHandler handler(service);

  ServerOptions options;
  options.host = "not-an-address";
  Server server(handler, options);
  EXPECT_THROW(server.init(), ingredients::ServerError);
}
