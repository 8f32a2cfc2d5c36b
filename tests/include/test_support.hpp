#pragma once

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "analytics/analytics_client.hpp"
#include "analytics/analytics_dispatcher.hpp"
#include "analytics/analytics_errors.hpp"
#include "identity/client_id_errors.hpp"
#include "identity/data_dir_resolver.hpp"

namespace testinfra {

namespace fs = std::filesystem;

struct ScopedTempDir {
  fs::path path;
  explicit ScopedTempDir(const std::string &prefix = "clientid") {
    auto base = fs::temp_directory_path() / "clientid-tests";
    fs::create_directories(base);
    std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    path = base / (prefix + "-" + std::to_string(dist(gen)));
    fs::create_directories(path);
  }
  ~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

inline void write_text(const fs::path &path, const std::string &text) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

inline std::string read_text(const fs::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// Sets (or unsets, for nullopt) an environment variable for the lifetime of
// the object and restores the previous value afterwards.
class ScopedEnv {
  std::string name_;
  std::optional<std::string> previous_;

  static void apply(const std::string &name,
                    const std::optional<std::string> &value) {
    if (value) {
      ::setenv(name.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name.c_str());
    }
  }

public:
  ScopedEnv(std::string name, std::optional<std::string> value)
      : name_(std::move(name)) {
    if (const char *old = std::getenv(name_.c_str())) {
      previous_ = old;
    }
    apply(name_, value);
  }
  ~ScopedEnv() { apply(name_, previous_); }
};

class CountingResolver : public clientid::IDataDirResolver {
  fs::path dir_;

public:
  mutable int calls{0};
  explicit CountingResolver(fs::path dir) : dir_(std::move(dir)) {}
  fs::path resolve_data_dir() const override {
    ++calls;
    return dir_;
  }
};

class FailingResolver : public clientid::IDataDirResolver {
public:
  fs::path resolve_data_dir() const override {
    throw clientid::DirectoryResolutionError(
        "Failed to resolve app data directory: no host environment");
  }
};

class RecordingNotifier : public clientid::analytics::IAnalyticsNotifier {
public:
  std::vector<std::string> notified;
  void notify_created(const std::string &client_id) override {
    notified.push_back(client_id);
  }
};

// Records every event; optionally fails every post the way a real network
// would.
class FakeAnalyticsClient : public clientid::analytics::IAnalyticsClient {
  std::string endpoint_{"https://analytics.example.test/api/v1/event"};
  mutable std::mutex mutex_;
  std::vector<clientid::analytics::AnalyticsEvent> events_;

public:
  enum class Mode { Succeed, NetworkFailure, HttpFailure };
  Mode mode{Mode::Succeed};
  std::atomic<int> attempts{0};

  void post_event(const clientid::analytics::AnalyticsEvent &event) override {
    ++attempts;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(event);
    }
    switch (mode) {
    case Mode::NetworkFailure:
      throw clientid::analytics::NetworkError(
          my_errors::NETWORK::CONNECT_ERROR, "connect refused");
    case Mode::HttpFailure:
      throw clientid::analytics::HttpStatusError(503, "HTTP 503");
    case Mode::Succeed:
      break;
    }
  }

  const std::string &endpoint() const override { return endpoint_; }

  std::vector<clientid::analytics::AnalyticsEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }
};

} // namespace testinfra
