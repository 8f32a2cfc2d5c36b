#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "my_error_codes.hpp"

namespace clientid {
namespace fs = std::filesystem;
namespace json = boost::json;

inline constexpr const char *kDefaultAnalyticsEndpoint =
    "https://backend.valuecell.ai/api/v1/analytics/event";
inline constexpr const char *kDefaultAppIdentifier = "com.valuecell.valuecellapp";

class ConfigError : public std::runtime_error {
  int code_;

public:
  ConfigError(int code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  int code() const noexcept { return code_; }
};

namespace detail {

inline const json::value *config_field(const json::object &jo,
                                       const char *key) {
  return jo.if_contains(key);
}

inline std::string config_string(const json::value &v, const char *key) {
  if (!v.is_string()) {
    throw ConfigError(my_errors::JSON::TYPE_MISMATCH,
                      std::string("configuration key '") + key +
                          "' must be a string");
  }
  return std::string(v.as_string().c_str());
}

inline bool config_bool(const json::value &v, const char *key) {
  if (!v.is_bool()) {
    throw ConfigError(my_errors::JSON::TYPE_MISMATCH,
                      std::string("configuration key '") + key +
                          "' must be a boolean");
  }
  return v.as_bool();
}

inline std::int64_t config_int(const json::value &v, const char *key) {
  if (v.is_int64()) {
    return v.as_int64();
  }
  if (v.is_uint64()) {
    return static_cast<std::int64_t>(v.as_uint64());
  }
  throw ConfigError(my_errors::JSON::TYPE_MISMATCH,
                    std::string("configuration key '") + key +
                        "' must be an integer");
}

inline int config_int32(const json::value &v, const char *key) {
  if (v.is_uint64() && v.as_uint64() > static_cast<std::uint64_t>(
                                            std::numeric_limits<int>::max())) {
    throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                      std::string("configuration key '") + key +
                          "' is out of range");
  }
  auto value = config_int(v, key);
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                      std::string("configuration key '") + key +
                          "' is out of range");
  }
  return static_cast<int>(value);
}

} // namespace detail

// application.json
struct ClientIdConfig {
  std::string app_identifier{kDefaultAppIdentifier};
  // Overrides platform data directory resolution when non-empty.
  fs::path data_dir{};
  bool analytics_enabled{true};
  std::string analytics_endpoint{kDefaultAnalyticsEndpoint};
  // 0 means the request never times out.
  int request_timeout_seconds{0};
  bool verify_tls{true};
  int threads_num{1};

  friend ClientIdConfig tag_invoke(const json::value_to_tag<ClientIdConfig> &,
                                   const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw ConfigError(my_errors::JSON::TYPE_MISMATCH,
                        "ClientIdConfig is not an object");
    }
    ClientIdConfig cc{};
    if (auto *p = detail::config_field(*jo_p, "app_identifier"))
      cc.app_identifier = detail::config_string(*p, "app_identifier");
    if (auto *p = detail::config_field(*jo_p, "data_dir"))
      cc.data_dir = fs::path(detail::config_string(*p, "data_dir"));
    if (auto *p = detail::config_field(*jo_p, "analytics_enabled"))
      cc.analytics_enabled = detail::config_bool(*p, "analytics_enabled");
    if (auto *p = detail::config_field(*jo_p, "analytics_endpoint"))
      cc.analytics_endpoint = detail::config_string(*p, "analytics_endpoint");
    if (auto *p = detail::config_field(*jo_p, "request_timeout_seconds"))
      cc.request_timeout_seconds =
          detail::config_int32(*p, "request_timeout_seconds");
    if (auto *p = detail::config_field(*jo_p, "verify_tls"))
      cc.verify_tls = detail::config_bool(*p, "verify_tls");
    if (auto *p = detail::config_field(*jo_p, "threads_num"))
      cc.threads_num = detail::config_int32(*p, "threads_num");

    if (cc.request_timeout_seconds < 0) {
      throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                        "request_timeout_seconds must not be negative");
    }
    if (cc.threads_num < 1) {
      throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                        "threads_num must be at least 1");
    }
    return cc;
  }
};

// log_config.json
struct LoggingConfig {
  std::string level{"info"};
  // Empty keeps Boost.Log's console sink.
  std::string log_dir{};
  std::string log_file{"client-id"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw ConfigError(my_errors::JSON::TYPE_MISMATCH,
                        "LoggingConfig is not an object");
    }
    LoggingConfig lc{};
    if (auto *p = detail::config_field(*jo_p, "level"))
      lc.level = detail::config_string(*p, "level");
    if (auto *p = detail::config_field(*jo_p, "log_dir"))
      lc.log_dir = detail::config_string(*p, "log_dir");
    if (auto *p = detail::config_field(*jo_p, "log_file"))
      lc.log_file = detail::config_string(*p, "log_file");
    if (auto *p = detail::config_field(*jo_p, "rotation_size")) {
      auto size = detail::config_int(*p, "rotation_size");
      if (size <= 0) {
        throw ConfigError(my_errors::GENERAL::INVALID_ARGUMENT,
                          "rotation_size must be positive");
      }
      lc.rotation_size = static_cast<std::uint64_t>(size);
    }
    return lc;
  }
};

class IClientIdConfigProvider {
public:
  virtual ~IClientIdConfigProvider() = default;

  virtual const ClientIdConfig &get() const = 0;
  virtual ClientIdConfig &get() = 0;
  virtual const LoggingConfig &logging() const = 0;
};

// Reads application.json and log_config.json from one configuration
// directory. A missing file leaves the defaults in place; a file that does not
// parse throws ConfigError.
class ClientIdConfigProviderFile : public IClientIdConfigProvider {
  ClientIdConfig config_;
  LoggingConfig logging_;
  fs::path config_dir_;

public:
  explicit ClientIdConfigProviderFile(fs::path config_dir);

  const ClientIdConfig &get() const override { return config_; }
  ClientIdConfig &get() override { return config_; }
  const LoggingConfig &logging() const override { return logging_; }

  const fs::path &config_dir() const { return config_dir_; }
};

// In-memory provider for embedding hosts and tests.
class ClientIdConfigProviderValue : public IClientIdConfigProvider {
  ClientIdConfig config_;
  LoggingConfig logging_;

public:
  explicit ClientIdConfigProviderValue(ClientIdConfig config,
                                       LoggingConfig logging = {})
      : config_(std::move(config)), logging_(std::move(logging)) {}

  const ClientIdConfig &get() const override { return config_; }
  ClientIdConfig &get() override { return config_; }
  const LoggingConfig &logging() const override { return logging_; }
};

// $CLIENTID_CONFIG_DIR, else the per-user configuration directory.
fs::path resolve_default_config_dir();

} // namespace clientid
