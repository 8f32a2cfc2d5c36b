#pragma once

#include <chrono>
#include <string>

#include "analytics/analytics_event.hpp"
#include "conf/clientid_config.hpp"

namespace clientid::analytics {

class IAnalyticsClient {
public:
  virtual ~IAnalyticsClient() = default;

  // One POST of the event. Throws NetworkError or HttpStatusError.
  virtual void post_event(const AnalyticsEvent &event) = 0;

  virtual const std::string &endpoint() const = 0;
};

struct HttpEndpoint {
  bool secure{true};
  std::string host;
  std::string port{"443"};
  std::string target{"/"};
};

// Accepts http:// and https:// URLs with a host. Throws ConfigError otherwise.
HttpEndpoint parse_http_endpoint(const std::string &url);

// Synchronous caller, asynchronous inside: every post_event runs its own
// io_context until the exchange finishes, so callers should be on a worker
// thread rather than a UI thread.
class HttpAnalyticsClient : public IAnalyticsClient {
  std::string endpoint_url_;
  HttpEndpoint endpoint_;
  std::chrono::seconds timeout_;
  bool verify_tls_;
  std::string user_agent_;

public:
  explicit HttpAnalyticsClient(const ClientIdConfig &config);

  void post_event(const AnalyticsEvent &event) override;

  const std::string &endpoint() const override { return endpoint_url_; }
};

// Builds the init event for client_id and posts it. Errors propagate to the
// caller.
void send_analytics_event(IAnalyticsClient &client,
                          const std::string &client_id);

} // namespace clientid::analytics
