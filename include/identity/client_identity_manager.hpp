#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "analytics/analytics_dispatcher.hpp"
#include "identity/data_dir_resolver.hpp"

namespace clientid {

inline constexpr const char *kClientIdFilename = "client_id.txt";

// Owns the lookup of the per-installation identifier stored at
// <data_dir>/client_id.txt.
//
// An existing file with non-empty trimmed content is authoritative and never
// rewritten or validated. Only a missing, unreadable or blank file leads to a
// new UUIDv7 being written and announced to the notifier. Two processes
// racing on a first run are not coordinated; the last writer wins.
class ClientIdentityManager {
  const IDataDirResolver &resolver_;
  analytics::IAnalyticsNotifier &notifier_;

public:
  ClientIdentityManager(const IDataDirResolver &resolver,
                        analytics::IAnalyticsNotifier &notifier);

  // Throws DirectoryResolutionError, DirectoryCreationError or
  // FileWriteError.
  std::string get_or_create_client_id();

  // Throws DirectoryResolutionError.
  std::filesystem::path client_id_path() const;

private:
  static std::optional<std::string>
  read_existing(const std::filesystem::path &path);
  static void persist(const std::filesystem::path &path,
                      const std::string &client_id);
};

// Outcome of the externally invocable command: exactly one of the two is set.
struct ClientIdReply {
  std::optional<std::string> client_id;
  std::optional<std::string> error;

  bool ok() const { return client_id.has_value(); }
};

// get_or_create_client_id() with its failure turned into the error message.
ClientIdReply get_client_id(ClientIdentityManager &manager);

} // namespace clientid
