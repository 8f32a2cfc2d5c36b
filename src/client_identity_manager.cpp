#include "identity/client_identity_manager.hpp"

#include <fmt/format.h>
#include <exception>
#include <fstream>
#include <system_error>

#include "identity/client_id_errors.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"
#include "util/uuid_v7.hpp"

namespace clientid {

namespace fs = std::filesystem;

ClientIdentityManager::ClientIdentityManager(
    const IDataDirResolver &resolver, analytics::IAnalyticsNotifier &notifier)
    : resolver_(resolver), notifier_(notifier) {}

fs::path ClientIdentityManager::client_id_path() const {
  return resolver_.resolve_data_dir() / kClientIdFilename;
}

std::optional<std::string>
ClientIdentityManager::read_existing(const fs::path &path) {
  auto content = stringutil::read_file_contents(path);
  if (!content) {
    return std::nullopt;
  }
  std::string trimmed = stringutil::trim_copy(*content);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

void ClientIdentityManager::persist(const fs::path &path,
                                    const std::string &client_id) {
  if (auto parent = path.parent_path(); !parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw DirectoryCreationError(fmt::format(
          "Failed to create directory: {}: {}", parent.string(), ec.message()));
    }
  }

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    throw FileWriteError(
        fmt::format("Failed to write client ID to: {}", path.string()));
  }
  ofs.write(client_id.data(), static_cast<std::streamsize>(client_id.size()));
  ofs.close();
  if (!ofs) {
    throw FileWriteError(
        fmt::format("Failed to write client ID to: {}", path.string()));
  }
}

std::string ClientIdentityManager::get_or_create_client_id() {
  const fs::path path = client_id_path();

  if (auto existing = read_existing(path)) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Loaded client id from " << path.string();
    return *existing;
  }

  std::string client_id = uuidutil::generate_uuid_v7_string();
  persist(path, client_id);
  BOOST_LOG_SEV(app_logger(), trivial::info)
      << "Created client id " << client_id << " at " << path.string();

  notifier_.notify_created(client_id);
  return client_id;
}

ClientIdReply get_client_id(ClientIdentityManager &manager) {
  ClientIdReply reply;
  try {
    reply.client_id = manager.get_or_create_client_id();
  } catch (const ClientIdError &ex) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "get_client_id failed (" << ex.code() << "): " << ex.what();
    reply.error = ex.what();
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "get_client_id failed: " << ex.what();
    reply.error = ex.what();
  }
  return reply;
}

} // namespace clientid
