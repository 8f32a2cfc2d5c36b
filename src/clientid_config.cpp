#include "conf/clientid_config.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace clientid {

namespace {

// Parses one optional JSON file into T. A missing file yields T{}.
template <typename T> T load_json_file(const fs::path &file) {
  std::error_code exists_ec;
  if (!fs::exists(file, exists_ec)) {
    return T{};
  }
  auto content = stringutil::read_file_contents(file);
  if (!content) {
    throw ConfigError(my_errors::GENERAL::FILE_READ_WRITE,
                      fmt::format("Unable to read configuration file: {}",
                                  file.string()));
  }
  boost::system::error_code ec;
  json::value jv = json::parse(*content, ec);
  if (ec) {
    throw ConfigError(my_errors::JSON::MALFORMED,
                      fmt::format("Malformed JSON in {}: {}", file.string(),
                                  ec.message()));
  }
  try {
    return json::value_to<T>(jv);
  } catch (const ConfigError &ex) {
    throw ConfigError(ex.code(),
                      fmt::format("{}: {}", file.string(), ex.what()));
  }
}

} // namespace

ClientIdConfigProviderFile::ClientIdConfigProviderFile(fs::path config_dir)
    : config_dir_(std::move(config_dir)) {
  config_ = load_json_file<ClientIdConfig>(config_dir_ / "application.json");
  logging_ = load_json_file<LoggingConfig>(config_dir_ / "log_config.json");
}

// Environment variable precedence (highest to lowest):
// 1. CLIENTID_CONFIG_DIR
// 2. Platform per-user configuration directory
//    - Linux: $XDG_CONFIG_HOME/client-id or $HOME/.config/client-id
//    - macOS: $HOME/Library/Preferences/client-id
//    - Windows: %APPDATA%/client-id
// An empty path is returned when none of these can be determined.
fs::path resolve_default_config_dir() {
  fs::path override_dir = stringutil::get_env_path("CLIENTID_CONFIG_DIR");
  if (!override_dir.empty()) {
    return override_dir;
  }
#ifdef _WIN32
  fs::path app_data = stringutil::get_env_path("APPDATA");
  return app_data.empty() ? fs::path{} : app_data / "client-id";
#elif defined(__APPLE__)
  fs::path home = stringutil::get_env_path("HOME");
  return home.empty() ? fs::path{}
                      : home / "Library" / "Preferences" / "client-id";
#else
  fs::path xdg = stringutil::get_env_path("XDG_CONFIG_HOME");
  if (!xdg.empty() && xdg.is_absolute()) {
    return xdg / "client-id";
  }
  fs::path home = stringutil::get_env_path("HOME");
  return home.empty() ? fs::path{} : home / ".config" / "client-id";
#endif
}

} // namespace clientid
