#pragma once

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

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

// Scalar-valued map under `key`; an absent key yields an empty map.
[[nodiscard]] inline auto yaml_string_map(const YAML::Node& node,
                                          std::string_view key)
    -> std::map<std::string, std::string, std::less<>> {
  std::map<std::string, std::string, std::less<>> out;
  auto field = node[std::string(key)];
  if (!field || !field.IsMap()) {
    return out;
  }
  for (const auto& entry : field) {
    out.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());
  }
  return out;
}

[[nodiscard]] inline auto yaml_string_list(const YAML::Node& node,
                                           std::string_view key)
    -> std::vector<std::string> {
  auto field = node[std::string(key)];
  if (!field || !field.IsSequence()) {
    return {};
  }
  return field.as<std::vector<std::string>>();
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   std::string_view value) {
  if (!value.empty()) {
    out << YAML::Key << std::string(key) << YAML::Value << std::string(value);
  }
}

}  // namespace jobflow
