#include "util/string_util.hpp"

#include <cstdlib>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>

namespace clientid {
namespace stringutil {

namespace {
constexpr std::string_view kWhitespace = "\r\n\t \f\v";
}

std::string trim_copy(std::string_view str) {
  auto first = str.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = str.find_last_not_of(kWhitespace);
  return std::string(str.substr(first, last - first + 1));
}

std::optional<std::string>
read_file_contents(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  try {
    std::string contents((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
    if (ifs.bad()) {
      return std::nullopt;
    }
    return contents;
  } catch (const std::ios_base::failure &) {
    return std::nullopt;
  }
}

std::filesystem::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return std::filesystem::path(value);
  }
  return {};
}

} // namespace stringutil
} // namespace clientid
