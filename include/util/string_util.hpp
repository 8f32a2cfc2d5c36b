#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace clientid {
namespace stringutil {

// Trim leading and trailing ASCII whitespace.
std::string trim_copy(std::string_view str);

// Whole file contents, or nullopt when the file cannot be opened or read.
std::optional<std::string>
read_file_contents(const std::filesystem::path &path);

// Value of an environment variable as a path; empty when unset or empty.
std::filesystem::path get_env_path(const char *name);

} // namespace stringutil
} // namespace clientid
