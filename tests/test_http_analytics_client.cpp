#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <future>
#include <string>
#include <thread>

#include "analytics/analytics_client.hpp"
#include "analytics/analytics_errors.hpp"
#include "conf/clientid_config.hpp"
#include "util/platform_info.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

struct CapturedRequest {
  http::verb method{http::verb::unknown};
  std::string target;
  std::string content_type;
  std::string user_agent;
  std::string body;
};

// Accepts exactly one connection on 127.0.0.1, records the request and
// answers with the given status.
class OneShotHttpServer {
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::promise<CapturedRequest> captured_;
  std::thread worker_;

public:
  explicit OneShotHttpServer(http::status status)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    worker_ = std::thread([this, status]() {
      CapturedRequest out;
      try {
        tcp::socket socket(ioc_);
        acceptor_.accept(socket);
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req);
        out.method = req.method();
        out.target = std::string(req.target());
        out.content_type = std::string(req[http::field::content_type]);
        out.user_agent = std::string(req[http::field::user_agent]);
        out.body = req.body();

        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = "{\"ok\":true}";
        res.prepare_payload();
        http::write(socket, res);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
      } catch (const std::exception &) {
      }
      captured_.set_value(std::move(out));
    });
  }

  ~OneShotHttpServer() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

  CapturedRequest captured() { return captured_.get_future().get(); }
};

clientid::ClientIdConfig config_for(const std::string &endpoint) {
  clientid::ClientIdConfig cfg;
  cfg.analytics_endpoint = endpoint;
  cfg.request_timeout_seconds = 5;
  return cfg;
}

std::uint16_t unused_local_port() {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc,
                         tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

TEST(HttpEndpointTest, ParsesHttpsDefaults) {
  auto ep = clientid::analytics::parse_http_endpoint(
      "https://backend.valuecell.ai/api/v1/analytics/event");
  EXPECT_TRUE(ep.secure);
  EXPECT_EQ(ep.host, "backend.valuecell.ai");
  EXPECT_EQ(ep.port, "443");
  EXPECT_EQ(ep.target, "/api/v1/analytics/event");
}

TEST(HttpEndpointTest, ParsesHttpPortAndQuery) {
  auto ep = clientid::analytics::parse_http_endpoint(
      "http://127.0.0.1:8080/event?src=desktop");
  EXPECT_FALSE(ep.secure);
  EXPECT_EQ(ep.host, "127.0.0.1");
  EXPECT_EQ(ep.port, "8080");
  EXPECT_EQ(ep.target, "/event?src=desktop");
}

TEST(HttpEndpointTest, RejectsUnsupportedScheme) {
  EXPECT_THROW(clientid::analytics::parse_http_endpoint("ftp://host/event"),
               clientid::ConfigError);
  EXPECT_THROW(clientid::analytics::parse_http_endpoint("not a url"),
               clientid::ConfigError);
}

TEST(HttpAnalyticsClientTest, PostsJsonInitEvent) {
  OneShotHttpServer server(http::status::no_content);
  clientid::analytics::HttpAnalyticsClient client(config_for(
      "http://127.0.0.1:" + std::to_string(server.port()) +
      "/api/v1/analytics/event"));

  EXPECT_NO_THROW(
      clientid::analytics::send_analytics_event(client, "client-abc"));

  auto req = server.captured();
  EXPECT_EQ(req.method, http::verb::post);
  EXPECT_EQ(req.target, "/api/v1/analytics/event");
  EXPECT_EQ(req.content_type, "application/json");
  EXPECT_EQ(req.user_agent, clientid::platform::user_agent());

  auto jv = boost::json::parse(req.body);
  const auto &obj = jv.as_object();
  EXPECT_EQ(obj.at("event").as_string(), "init");
  EXPECT_EQ(obj.at("client_id").as_string(), "client-abc");
  EXPECT_EQ(obj.at("os").as_string(), clientid::platform::os_platform());
}

TEST(HttpAnalyticsClientTest, NonSuccessStatusRaisesHttpStatusError) {
  OneShotHttpServer server(http::status::internal_server_error);
  clientid::analytics::HttpAnalyticsClient client(config_for(
      "http://127.0.0.1:" + std::to_string(server.port()) + "/event"));

  try {
    clientid::analytics::send_analytics_event(client, "client-abc");
    FAIL() << "expected HttpStatusError";
  } catch (const clientid::analytics::HttpStatusError &ex) {
    EXPECT_EQ(ex.status(), 500);
    EXPECT_EQ(ex.code(), my_errors::NETWORK::HTTP_STATUS);
  }
}

TEST(HttpAnalyticsClientTest, RefusedConnectionRaisesNetworkError) {
  auto port = unused_local_port();
  clientid::analytics::HttpAnalyticsClient client(
      config_for("http://127.0.0.1:" + std::to_string(port) + "/event"));

  try {
    clientid::analytics::send_analytics_event(client, "client-abc");
    FAIL() << "expected NetworkError";
  } catch (const clientid::analytics::NetworkError &ex) {
    EXPECT_EQ(ex.code(), my_errors::NETWORK::CONNECT_ERROR);
  }
}

TEST(HttpAnalyticsClientTest, InvalidEndpointFailsAtConstruction) {
  EXPECT_THROW(
      clientid::analytics::HttpAnalyticsClient(config_for("wss://host/x")),
      clientid::ConfigError);
}

} // namespace
