#pragma once

#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace clientid {

// Base for every failure of the get-or-create sequence. The message is what
// the exposed command hands back to its caller.
class ClientIdError : public std::runtime_error {
  int code_;

public:
  ClientIdError(int code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  int code() const noexcept { return code_; }
};

class DirectoryResolutionError : public ClientIdError {
public:
  explicit DirectoryResolutionError(const std::string &what)
      : ClientIdError(my_errors::IDENTITY::DIRECTORY_RESOLUTION, what) {}
};

class DirectoryCreationError : public ClientIdError {
public:
  explicit DirectoryCreationError(const std::string &what)
      : ClientIdError(my_errors::IDENTITY::DIRECTORY_CREATION, what) {}
};

class FileWriteError : public ClientIdError {
public:
  explicit FileWriteError(const std::string &what)
      : ClientIdError(my_errors::IDENTITY::FILE_WRITE, what) {}
};

} // namespace clientid
