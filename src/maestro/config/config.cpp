#include "maestro/config/config.hpp"

#include "maestro/config/yaml_utils.hpp"
#include "maestro/util/log.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

template <>
struct convert<maestro::ServerInfo> {
  static bool decode(const Node& node, maestro::ServerInfo& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.host = maestro::yaml_get_or<std::string>(node, "host", "");
    s.username = maestro::yaml_get_or<std::string>(node, "username", "");
    s.identity_file = maestro::yaml_get_or<std::string>(node, "identityFile", "");
    s.podman_socket = maestro::yaml_get_or<std::string>(node, "podmanSocket", "");
    s.remote_dir = maestro::yaml_get_or<std::string>(node, "remoteDir", "");
    return true;
  }
};

template <>
struct convert<maestro::LogConfig> {
  static bool decode(const Node& node, maestro::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = maestro::yaml_get_or<std::string>(node, "level", "info");
    l.file = maestro::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<maestro::ApiConfig> {
  static bool decode(const Node& node, maestro::ApiConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.enabled = maestro::yaml_get_or(node, "enabled", true);
    a.port = maestro::yaml_get_or<std::uint16_t>(node, "port", 3003);
    a.host = maestro::yaml_get_or<std::string>(node, "host", "127.0.0.1");
    return true;
  }
};

template <>
struct convert<maestro::RuntimeConfig> {
  static bool decode(const Node& node, maestro::RuntimeConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    maestro::RuntimeConfig defaults;
    r.api_version =
        maestro::yaml_get_or<std::string>(node, "api_version", defaults.api_version);
    r.connect_timeout = maestro::yaml_get_ms(node, "connect_timeout_ms",
                                             defaults.connect_timeout);
    r.read_timeout =
        maestro::yaml_get_ms(node, "read_timeout_ms", defaults.read_timeout);
    return true;
  }
};

template <>
struct convert<maestro::SystemConfig> {
  static bool decode(const Node& node, maestro::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.images_dir = maestro::yaml_get_or<std::string>(node, "images_dir", "");
    c.reconcile_interval = maestro::yaml_get_ms(node, "reconcile_interval_ms",
                                                c.reconcile_interval);
    if (auto log = node["log"]) {
      c.log = log.as<maestro::LogConfig>();
    }
    if (auto api = node["api"]) {
      c.api = api.as<maestro::ApiConfig>();
    }
    if (auto runtime = node["runtime"]) {
      c.runtime = runtime.as<maestro::RuntimeConfig>();
    }
    if (auto servers = node["servers"]) {
      if (!servers.IsMap()) {
        return false;
      }
      for (const auto& entry : servers) {
        auto info = entry.second.as<maestro::ServerInfo>();
        info.name = entry.first.as<std::string>();
        c.servers.insert_or_assign(info.name, std::move(info));
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace maestro {

namespace {

auto parse(const YAML::Node& node) -> Result<SystemConfig> {
  auto config = node.as<SystemConfig>();
  if (auto r = ConfigLoader::validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<SystemConfig> {
  try {
    return parse(YAML::LoadFile(std::string(path)));
  } catch (const YAML::BadFile& e) {
    log::error("Cannot read config file {}: {}", path, e.what());
    return fail(Error::FileNotFound);
  } catch (const YAML::Exception& e) {
    log::error("Failed to load config file {}: {}", path, e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    return parse(YAML::Load(std::string(yaml_str)));
  } catch (const YAML::Exception& e) {
    log::error("Failed to parse YAML config: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (config.images_dir.empty()) {
    log::error("Config: images_dir is required");
    return fail(Error::InvalidArgument);
  }
  if (config.reconcile_interval <= std::chrono::milliseconds::zero()) {
    log::error("Config: reconcile_interval_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  for (const auto& [name, server] : config.servers) {
    if (name.empty()) {
      log::error("Config: server with empty name");
      return fail(Error::InvalidArgument);
    }
    if (server.podman_socket.empty()) {
      log::error("Config: server {} has no podmanSocket", name);
      return fail(Error::InvalidArgument);
    }
    if (!server.is_local() && server.username.empty()) {
      log::error("Config: remote server {} has no username", name);
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

}  // namespace maestro
