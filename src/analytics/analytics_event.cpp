#include "analytics/analytics_event.hpp"

#include "util/platform_info.hpp"

namespace clientid::analytics {

AnalyticsEvent make_init_event(const std::string &client_id) {
  AnalyticsEvent event;
  event.event = "init";
  event.client_id = client_id;
  event.os = platform::os_platform();
  return event;
}

std::string serialize_event(const AnalyticsEvent &event) {
  return boost::json::serialize(boost::json::value_from(event));
}

} // namespace clientid::analytics
