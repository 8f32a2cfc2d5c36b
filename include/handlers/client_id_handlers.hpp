#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "handlers/i_handler.hpp"
#include "identity/client_identity_manager.hpp"

namespace clientid {

// "get": prints the identifier, creating it on first run.
class GetClientIdHandler : public IHandler {
  ClientIdentityManager &manager_;
  std::ostream &out_;
  std::ostream &err_;

public:
  GetClientIdHandler(ClientIdentityManager &manager, std::ostream &out,
                     std::ostream &err)
      : manager_(manager), out_(out), err_(err) {}

  std::string command() const override { return "get"; }

  int start() override;
};

// "path": prints where the identifier file lives without touching it.
class ClientIdPathHandler : public IHandler {
  ClientIdentityManager &manager_;
  std::ostream &out_;
  std::ostream &err_;

public:
  ClientIdPathHandler(ClientIdentityManager &manager, std::ostream &out,
                      std::ostream &err)
      : manager_(manager), out_(out), err_(err) {}

  std::string command() const override { return "path"; }

  int start() override;
};

// nullptr for an unknown subcommand.
std::unique_ptr<IHandler> make_handler(const std::string &subcmd,
                                       ClientIdentityManager &manager,
                                       std::ostream &out = std::cout,
                                       std::ostream &err = std::cerr);

} // namespace clientid
