#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace storyloop {

// Overwrites `out` only when `key` is present and non-null, so the member
// initialisers of the config structs act as the defaults.
template <typename T>
auto yaml_read(const YAML::Node& node, std::string_view key, T& out) -> void {
  const auto field = node[std::string(key)];
  if (field && !field.IsNull()) {
    out = field.template as<T>();
  }
}

// Same as yaml_read for a nested mapping decoded by a YAML::convert<T>.
// A section given as a scalar or sequence is a parse error.
template <typename T>
auto yaml_read_section(const YAML::Node& node, std::string_view key, T& out)
    -> void {
  const auto section = node[std::string(key)];
  if (!section || section.IsNull()) {
    return;
  }
  if (!section.IsMap()) {
    throw YAML::TypedBadConversion<T>(section.Mark());
  }
  out = section.template as<T>();
}

// Opens `key: {` on construction and closes the mapping on destruction.
class YamlMapScope {
public:
  YamlMapScope(YAML::Emitter& out, std::string_view key) : out_(out) {
    out_ << YAML::Key << std::string(key) << YAML::Value << YAML::BeginMap;
  }
  ~YamlMapScope() { out_ << YAML::EndMap; }

  YamlMapScope(const YamlMapScope&) = delete;
  YamlMapScope& operator=(const YamlMapScope&) = delete;

private:
  YAML::Emitter& out_;
};

template <typename T>
auto yaml_emit(YAML::Emitter& out, std::string_view key, const T& value)
    -> void {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

// Optional string settings are left out of the dump when unset.
inline auto yaml_emit_optional(YAML::Emitter& out, std::string_view key,
                               const std::string& value) -> void {
  if (!value.empty()) {
    yaml_emit(out, key, value);
  }
}

}  // namespace storyloop
