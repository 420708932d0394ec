#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace cronrunner {

/// Scalar as its source text, so "5", "true" and "90s" all survive
/// untouched until validation
[[nodiscard]] inline auto yaml_get_text(const YAML::Node& node,
                                        std::string_view key)
    -> std::optional<std::string> {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return std::nullopt;
  }
  return field.Scalar();
}

}  // namespace cronrunner
