#pragma once

#include "maestro/core/constants.hpp"
#include "maestro/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace maestro {

// One remote execution host. An empty `host` means the runtime socket is
// local and is dialed directly instead of through an SSH forward.
struct ServerInfo {
  std::string name;
  std::string host;
  std::string username;
  std::string identity_file;
  std::string podman_socket;
  std::string remote_dir;

  [[nodiscard]] auto is_local() const noexcept -> bool {
    return host.empty();
  }
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct ApiConfig {
  bool enabled{true};
  std::uint16_t port{3003};
  std::string host{"127.0.0.1"};
};

struct RuntimeConfig {
  std::string api_version{"v1.41"};
  std::chrono::milliseconds connect_timeout{30000};
  // Read timeout for short API calls; zero disables it. Build output and
  // attach streams are never cut off by it.
  std::chrono::milliseconds read_timeout{0};
};

struct SystemConfig {
  std::string images_dir;
  std::chrono::milliseconds reconcile_interval{timing::kReconcileInterval};
  LogConfig log;
  ApiConfig api;
  RuntimeConfig runtime;
  std::map<std::string, ServerInfo, std::less<>> servers;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Structural checks that do not touch the filesystem.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

}  // namespace maestro
