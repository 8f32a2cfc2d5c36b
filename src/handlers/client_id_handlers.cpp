#include "handlers/client_id_handlers.hpp"

#include <cstdlib>

#include "identity/client_id_errors.hpp"

namespace clientid {

int GetClientIdHandler::start() {
  ClientIdReply reply = get_client_id(manager_);
  if (!reply.ok()) {
    err_ << "Failed to get client id: " << *reply.error << std::endl;
    return EXIT_FAILURE;
  }
  out_ << *reply.client_id << std::endl;
  return EXIT_SUCCESS;
}

int ClientIdPathHandler::start() {
  try {
    out_ << manager_.client_id_path().string() << std::endl;
    return EXIT_SUCCESS;
  } catch (const ClientIdError &ex) {
    err_ << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}

std::unique_ptr<IHandler> make_handler(const std::string &subcmd,
                                       ClientIdentityManager &manager,
                                       std::ostream &out, std::ostream &err) {
  if (subcmd == "get") {
    return std::make_unique<GetClientIdHandler>(manager, out, err);
  }
  if (subcmd == "path") {
    return std::make_unique<ClientIdPathHandler>(manager, out, err);
  }
  return nullptr;
}

} // namespace clientid
