#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "conf/clientid_config.hpp"

namespace clientid {

// Supplies the application's private data directory. Implementations throw
// DirectoryResolutionError when the environment cannot provide one.
class IDataDirResolver {
public:
  virtual ~IDataDirResolver() = default;

  virtual std::filesystem::path resolve_data_dir() const = 0;
};

// Per-user application data directory for app_identifier:
// - Linux: $XDG_DATA_HOME/<id> or $HOME/.local/share/<id>
// - macOS: $HOME/Library/Application Support/<id>
// - Windows: %APPDATA%/<id>
class PlatformDataDirResolver : public IDataDirResolver {
  std::string app_identifier_;

public:
  explicit PlatformDataDirResolver(std::string app_identifier);

  std::filesystem::path resolve_data_dir() const override;
};

class FixedDataDirResolver : public IDataDirResolver {
  std::filesystem::path data_dir_;

public:
  explicit FixedDataDirResolver(std::filesystem::path data_dir)
      : data_dir_(std::move(data_dir)) {}

  std::filesystem::path resolve_data_dir() const override;
};

// CLIENTID_DATA_DIR wins over config.data_dir; with neither set the platform
// resolver is used.
std::unique_ptr<IDataDirResolver>
make_data_dir_resolver(const ClientIdConfig &config);

} // namespace clientid
