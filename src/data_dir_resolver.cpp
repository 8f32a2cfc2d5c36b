#include "identity/data_dir_resolver.hpp"

#include "identity/client_id_errors.hpp"
#include "util/string_util.hpp"

namespace clientid {

namespace fs = std::filesystem;

PlatformDataDirResolver::PlatformDataDirResolver(std::string app_identifier)
    : app_identifier_(std::move(app_identifier)) {}

fs::path PlatformDataDirResolver::resolve_data_dir() const {
  if (app_identifier_.empty()) {
    throw DirectoryResolutionError(
        "Failed to resolve app data directory: empty application identifier");
  }
#ifdef _WIN32
  fs::path base = stringutil::get_env_path("APPDATA");
  if (base.empty()) {
    throw DirectoryResolutionError(
        "Failed to resolve app data directory: APPDATA is not set");
  }
  return base / app_identifier_;
#elif defined(__APPLE__)
  fs::path home = stringutil::get_env_path("HOME");
  if (home.empty()) {
    throw DirectoryResolutionError(
        "Failed to resolve app data directory: HOME is not set");
  }
  return home / "Library" / "Application Support" / app_identifier_;
#else
  // XDG_DATA_HOME must be absolute; a relative value is ignored.
  fs::path xdg = stringutil::get_env_path("XDG_DATA_HOME");
  if (!xdg.empty() && xdg.is_absolute()) {
    return xdg / app_identifier_;
  }
  fs::path home = stringutil::get_env_path("HOME");
  if (home.empty()) {
    throw DirectoryResolutionError(
        "Failed to resolve app data directory: neither XDG_DATA_HOME nor "
        "HOME is set");
  }
  return home / ".local" / "share" / app_identifier_;
#endif
}

fs::path FixedDataDirResolver::resolve_data_dir() const {
  if (data_dir_.empty()) {
    throw DirectoryResolutionError(
        "Failed to resolve app data directory: configured path is empty");
  }
  return data_dir_;
}

std::unique_ptr<IDataDirResolver>
make_data_dir_resolver(const ClientIdConfig &config) {
  fs::path env_dir = stringutil::get_env_path("CLIENTID_DATA_DIR");
  if (!env_dir.empty()) {
    return std::make_unique<FixedDataDirResolver>(std::move(env_dir));
  }
  if (!config.data_dir.empty()) {
    return std::make_unique<FixedDataDirResolver>(config.data_dir);
  }
  return std::make_unique<PlatformDataDirResolver>(config.app_identifier);
}

} // namespace clientid
