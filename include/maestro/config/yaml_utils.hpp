#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>

namespace maestro {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_get_ms(const YAML::Node& node,
                                      std::string_view key,
                                      std::chrono::milliseconds default_val)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds(
      yaml_get_or<long long>(node, key, default_val.count()));
}

}  // namespace maestro
