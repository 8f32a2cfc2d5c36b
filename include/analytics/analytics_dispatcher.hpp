#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <memory>
#include <string>

#include "analytics/analytics_client.hpp"

namespace clientid::analytics {

// Told once per newly created client identifier.
class IAnalyticsNotifier {
public:
  virtual ~IAnalyticsNotifier() = default;

  // Must return without waiting for any network activity.
  virtual void notify_created(const std::string &client_id) = 0;
};

// Fire-and-forget: notify_created posts one send onto the host executor. The
// posted task shares ownership of the client, so neither the dispatcher nor
// the caller has to outlive it. Failures end in a warning log line; there is
// no retry.
class AnalyticsDispatcher : public IAnalyticsNotifier {
  std::shared_ptr<IAnalyticsClient> client_;
  boost::asio::any_io_executor executor_;

public:
  AnalyticsDispatcher(std::shared_ptr<IAnalyticsClient> client,
                      boost::asio::any_io_executor executor);

  void notify_created(const std::string &client_id) override;
};

// Used when analytics are switched off; logs and drops the notification.
class NullAnalyticsNotifier : public IAnalyticsNotifier {
public:
  void notify_created(const std::string &client_id) override;
};

} // namespace clientid::analytics
