#include "analytics/analytics_dispatcher.hpp"

#include <boost/asio/post.hpp>
#include <exception>
#include <utility>

#include "util/my_logging.hpp"

namespace clientid::analytics {

AnalyticsDispatcher::AnalyticsDispatcher(
    std::shared_ptr<IAnalyticsClient> client,
    boost::asio::any_io_executor executor)
    : client_(std::move(client)), executor_(std::move(executor)) {}

void AnalyticsDispatcher::notify_created(const std::string &client_id) {
  boost::asio::post(executor_, [client = client_, client_id]() {
    try {
      send_analytics_event(*client, client_id);
      BOOST_LOG_SEV(app_logger(), trivial::debug)
          << "Analytics init event delivered to " << client->endpoint();
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Failed to send analytics event to " << client->endpoint()
          << ": " << ex.what();
    }
  });
}

void NullAnalyticsNotifier::notify_created(const std::string &client_id) {
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Analytics disabled; not reporting client id " << client_id;
}

} // namespace clientid::analytics
