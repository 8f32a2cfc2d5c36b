#pragma once

#include <boost/json.hpp>
#include <string>

namespace clientid::analytics {

// Built once when a new client identifier is created; never persisted.
struct AnalyticsEvent {
  std::string event{"init"};
  std::string client_id;
  std::string os;

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const AnalyticsEvent &e) {
    jv = boost::json::object{
        {"event", e.event}, {"client_id", e.client_id}, {"os", e.os}};
  }
};

// {"event":"init","client_id":<client_id>,"os":<current platform>}
AnalyticsEvent make_init_event(const std::string &client_id);

std::string serialize_event(const AnalyticsEvent &event);

} // namespace clientid::analytics
