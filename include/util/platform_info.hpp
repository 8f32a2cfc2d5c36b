#pragma once

#include <string>

namespace clientid {
namespace platform {

// Lowercase OS label sent with analytics events: linux, macos, windows, ios,
// android, or unknown.
std::string os_platform();

// x64, arm64, arm, x86 or unknown.
std::string cpu_architecture();

// "client-id/<version> (<os>; <arch>)"
std::string user_agent();

} // namespace platform
} // namespace clientid
