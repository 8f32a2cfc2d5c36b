#include "util/platform_info.hpp"

#include <fmt/format.h>

#include "version.h"

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace clientid {
namespace platform {

std::string os_platform() {
#if defined(__ANDROID__)
  return "android";
#elif defined(__APPLE__) && TARGET_OS_IPHONE
  return "ios";
#elif defined(__APPLE__)
  return "macos";
#elif defined(_WIN32)
  return "windows";
#elif defined(__linux__)
  return "linux";
#else
  return "unknown";
#endif
}

std::string cpu_architecture() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#elif defined(__i386__) || defined(_M_IX86)
  return "x86";
#else
  return "unknown";
#endif
}

std::string user_agent() {
  return fmt::format("client-id/{} ({}; {})", CLIENTID_VERSION, os_platform(),
                     cpu_architecture());
}

} // namespace platform
} // namespace clientid
