#include "analytics/analytics_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>
#include <memory>
#include <openssl/err.h>
#include <type_traits>
#include <utility>

#include "analytics/analytics_errors.hpp"
#include "util/platform_info.hpp"

namespace clientid::analytics {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// One resolve -> connect -> [TLS handshake] -> write -> read exchange driven
// on a caller-owned io_context. The outcome is inspected after run() returns.
template <typename Stream>
class PostCall : public std::enable_shared_from_this<PostCall<Stream>> {
  static constexpr bool kSecure = !std::is_same_v<Stream, beast::tcp_stream>;

public:
  template <typename... StreamArgs>
  PostCall(net::io_context &ioc, const HttpEndpoint &endpoint, Request request,
           std::chrono::seconds timeout, StreamArgs &&...stream_args)
      : resolver_(ioc), stream_(std::forward<StreamArgs>(stream_args)...),
        endpoint_(endpoint), request_(std::move(request)), timeout_(timeout) {}

  Stream &stream() { return stream_; }

  void start() {
    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        beast::bind_front_handler(&PostCall::on_resolve,
                                  this->shared_from_this()));
  }

  bool failed() const { return error_code_ != 0; }
  int error_code() const { return error_code_; }
  const std::string &error_message() const { return error_message_; }
  const Response &response() const { return response_; }

private:
  beast::tcp_stream &lowest() { return beast::get_lowest_layer(stream_); }

  void arm_timer() {
    if (timeout_.count() > 0) {
      lowest().expires_after(timeout_);
    } else {
      lowest().expires_never();
    }
  }

  void fail(int code, const char *stage, const beast::error_code &ec) {
    error_code_ = ec == beast::error::timeout
                      ? my_errors::NETWORK::TIMEOUT_ERROR
                      : code;
    error_message_ = fmt::format("{} {}:{} failed: {}", stage, endpoint_.host,
                                 endpoint_.port, ec.message());
  }

  void on_resolve(const beast::error_code &ec,
                  tcp::resolver::results_type results) {
    if (ec) {
      fail(my_errors::NETWORK::RESOLVE_ERROR, "resolve", ec);
      return;
    }
    arm_timer();
    lowest().async_connect(
        results, beast::bind_front_handler(&PostCall::on_connect,
                                           this->shared_from_this()));
  }

  void on_connect(const beast::error_code &ec,
                  const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      fail(my_errors::NETWORK::CONNECT_ERROR, "connect", ec);
      return;
    }
    if constexpr (kSecure) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        fail(my_errors::NETWORK::SSL_ERROR, "set_sni", sni_error);
        return;
      }
      arm_timer();
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&PostCall::on_handshake,
                                    this->shared_from_this()));
    } else {
      do_write();
    }
  }

  void on_handshake(const beast::error_code &ec) {
    if (ec) {
      fail(my_errors::NETWORK::SSL_HANDSHAKE_ERROR, "tls_handshake", ec);
      return;
    }
    do_write();
  }

  void do_write() {
    arm_timer();
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&PostCall::on_write,
                                                this->shared_from_this()));
  }

  void on_write(const beast::error_code &ec, std::size_t) {
    if (ec) {
      fail(my_errors::NETWORK::WRITE_ERROR, "write", ec);
      return;
    }
    arm_timer();
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&PostCall::on_read,
                                               this->shared_from_this()));
  }

  void on_read(const beast::error_code &ec, std::size_t) {
    if (ec) {
      fail(my_errors::NETWORK::READ_ERROR, "read", ec);
      return;
    }
    // Connection: close was requested; a TLS close_notify is not awaited.
    beast::error_code ignore;
    lowest().socket().shutdown(tcp::socket::shutdown_both, ignore);
  }

  tcp::resolver resolver_;
  Stream stream_;
  HttpEndpoint endpoint_;
  Request request_;
  std::chrono::seconds timeout_;
  beast::flat_buffer buffer_;
  Response response_;
  int error_code_{0};
  std::string error_message_;
};

Request build_request(const HttpEndpoint &endpoint, const std::string &body,
                      const std::string &user_agent) {
  Request req{http::verb::post, endpoint.target, 11};
  std::string host_header = endpoint.host;
  if (endpoint.port != (endpoint.secure ? "443" : "80")) {
    host_header += ':';
    host_header += endpoint.port;
  }
  req.set(http::field::host, host_header);
  req.set(http::field::user_agent, user_agent);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::connection, "close");
  req.body() = body;
  req.prepare_payload();
  return req;
}

void throw_on_failure(int error_code, const std::string &message) {
  if (error_code != 0) {
    throw NetworkError(error_code,
                       fmt::format("Failed to send HTTP request: {}", message));
  }
}

} // namespace

HttpEndpoint parse_http_endpoint(const std::string &url_text) {
  auto parsed = urls::parse_uri(url_text);
  if (!parsed) {
    throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                      fmt::format("invalid analytics endpoint '{}': {}",
                                  url_text, parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw ConfigError(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("analytics endpoint missing host: '{}'", url_text));
  }

  HttpEndpoint parts;
  const auto scheme = url.scheme();
  if (scheme == "https") {
    parts.secure = true;
  } else if (scheme == "http") {
    parts.secure = false;
  } else {
    throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                      fmt::format("analytics endpoint must use http:// or "
                                  "https:// scheme (got '{}')",
                                  scheme));
  }
  parts.host = std::string(url.host());
  if (url.has_port()) {
    parts.port = std::string(url.port());
  } else {
    parts.port = parts.secure ? "443" : "80";
  }
  std::string target = std::string(url.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (url.has_query()) {
    target += "?";
    target += std::string(url.encoded_query());
  }
  parts.target = target;
  return parts;
}

HttpAnalyticsClient::HttpAnalyticsClient(const ClientIdConfig &config)
    : endpoint_url_(config.analytics_endpoint),
      endpoint_(parse_http_endpoint(config.analytics_endpoint)),
      timeout_(config.request_timeout_seconds),
      verify_tls_(config.verify_tls), user_agent_(platform::user_agent()) {}

void HttpAnalyticsClient::post_event(const AnalyticsEvent &event) {
  net::io_context ioc;
  Request req = build_request(endpoint_, serialize_event(event), user_agent_);

  int error_code = 0;
  std::string error_message;
  Response response;

  if (endpoint_.secure) {
    ssl::context ssl_ctx(ssl::context::tls_client);
    if (verify_tls_) {
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(ssl::verify_peer);
    } else {
      ssl_ctx.set_verify_mode(ssl::verify_none);
    }
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;
    auto call = std::make_shared<PostCall<TlsStream>>(
        ioc, endpoint_, std::move(req), timeout_, ioc, ssl_ctx);
    if (verify_tls_) {
      call->stream().set_verify_callback(
          ssl::host_name_verification(endpoint_.host));
    }
    call->start();
    ioc.run();
    error_code = call->error_code();
    error_message = call->error_message();
    response = call->response();
  } else {
    auto call = std::make_shared<PostCall<beast::tcp_stream>>(
        ioc, endpoint_, std::move(req), timeout_, ioc);
    call->start();
    ioc.run();
    error_code = call->error_code();
    error_message = call->error_message();
    response = call->response();
  }

  throw_on_failure(error_code, error_message);

  const int status = response.result_int();
  if (status < 200 || status >= 300) {
    throw HttpStatusError(
        status, fmt::format("Server returned error status {} from {}", status,
                            endpoint_url_));
  }
}

void send_analytics_event(IAnalyticsClient &client,
                          const std::string &client_id) {
  client.post_event(make_init_event(client_id));
}

} // namespace clientid::analytics
