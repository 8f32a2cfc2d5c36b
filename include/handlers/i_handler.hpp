#pragma once

#include <string>

namespace clientid {

// Minimal common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "get", "path")
  virtual std::string command() const = 0;
  // Execute the handler's main work; returns the process exit code.
  virtual int start() = 0;
};

} // namespace clientid
