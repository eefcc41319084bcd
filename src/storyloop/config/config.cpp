#include "storyloop/config/config.hpp"

#include "storyloop/config/yaml_utils.hpp"
#include "storyloop/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<storyloop::LogConfig> {
  static bool decode(const Node& node, storyloop::LogConfig& l) {
    using storyloop::yaml_read;
    yaml_read(node, "level", l.level);
    yaml_read(node, "file", l.file);
    return true;
  }
};

template <>
struct convert<storyloop::RepositoryConfig> {
  static bool decode(const Node& node, storyloop::RepositoryConfig& r) {
    using storyloop::yaml_read;
    yaml_read(node, "path", r.path);
    yaml_read(node, "base_branch", r.base_branch);
    yaml_read(node, "branch_prefix", r.branch_prefix);
    yaml_read(node, "lock_timeout_sec", r.lock_timeout_sec);
    return true;
  }
};

template <>
struct convert<storyloop::ExecutorConfig> {
  static bool decode(const Node& node, storyloop::ExecutorConfig& e) {
    using storyloop::yaml_read;
    yaml_read(node, "command", e.command);
    yaml_read(node, "max_workers", e.max_workers);
    yaml_read(node, "timeout_sec", e.timeout_sec);
    yaml_read(node, "poll_interval_ms", e.poll_interval_ms);
    return true;
  }
};

template <>
struct convert<storyloop::HealthConfig> {
  static bool decode(const Node& node, storyloop::HealthConfig& h) {
    using storyloop::yaml_read;
    yaml_read(node, "heartbeat_interval_sec", h.heartbeat_interval_sec);
    yaml_read(node, "hung_threshold_sec", h.hung_threshold_sec);
    yaml_read(node, "dead_threshold_sec", h.dead_threshold_sec);
    yaml_read(node, "check_interval_sec", h.check_interval_sec);
    yaml_read(node, "hung_grace_sec", h.hung_grace_sec);
    yaml_read(node, "cleanup_max_age_hours", h.cleanup_max_age_hours);
    return true;
  }
};

template <>
struct convert<storyloop::RetryConfig> {
  static bool decode(const Node& node, storyloop::RetryConfig& r) {
    using storyloop::yaml_read;
    yaml_read(node, "max_retries", r.max_retries);
    yaml_read(node, "base_backoff_sec", r.base_backoff_sec);
    yaml_read(node, "backoff_multiplier", r.backoff_multiplier);
    return true;
  }
};

template <>
struct convert<storyloop::EventsConfig> {
  static bool decode(const Node& node, storyloop::EventsConfig& e) {
    using storyloop::yaml_read;
    yaml_read(node, "history_capacity", e.history_capacity);
    yaml_read(node, "dispatcher_threads", e.dispatcher_threads);
    return true;
  }
};

template <>
struct convert<storyloop::StorageConfig> {
  static bool decode(const Node& node, storyloop::StorageConfig& s) {
    storyloop::yaml_read(node, "db_file", s.db_file);
    return true;
  }
};

template <>
struct convert<storyloop::SystemConfig> {
  static bool decode(const Node& node, storyloop::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    using storyloop::yaml_read_section;
    storyloop::yaml_read(node, "state_dir", c.state_dir);
    yaml_read_section(node, "log", c.log);
    yaml_read_section(node, "repository", c.repository);
    yaml_read_section(node, "executor", c.executor);
    yaml_read_section(node, "health", c.health);
    yaml_read_section(node, "retry", c.retry);
    yaml_read_section(node, "events", c.events);
    yaml_read_section(node, "storage", c.storage);
    return true;
  }
};

}  // namespace YAML

namespace storyloop {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      // An empty file is a valid, all-defaults configuration.
      return ok(SystemConfig{});
    }
    if (!root.IsMap()) {
      log::error("Config root must be a mapping");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = validate_config(config); !r) {
      return std::unexpected(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& c) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  yaml_emit(out, "state_dir", c.state_dir);
  {
    YamlMapScope section(out, "log");
    yaml_emit(out, "level", c.log.level);
    yaml_emit_optional(out, "file", c.log.file);
  }
  {
    YamlMapScope section(out, "repository");
    yaml_emit(out, "path", c.repository.path);
    yaml_emit(out, "base_branch", c.repository.base_branch);
    yaml_emit(out, "branch_prefix", c.repository.branch_prefix);
    yaml_emit(out, "lock_timeout_sec", c.repository.lock_timeout_sec);
  }
  {
    YamlMapScope section(out, "executor");
    yaml_emit_optional(out, "command", c.executor.command);
    yaml_emit(out, "max_workers", c.executor.max_workers);
    yaml_emit(out, "timeout_sec", c.executor.timeout_sec);
    yaml_emit(out, "poll_interval_ms", c.executor.poll_interval_ms);
  }
  {
    YamlMapScope section(out, "health");
    yaml_emit(out, "heartbeat_interval_sec", c.health.heartbeat_interval_sec);
    yaml_emit(out, "hung_threshold_sec", c.health.hung_threshold_sec);
    yaml_emit(out, "dead_threshold_sec", c.health.dead_threshold_sec);
    yaml_emit(out, "check_interval_sec", c.health.check_interval_sec);
    yaml_emit(out, "hung_grace_sec", c.health.hung_grace_sec);
    yaml_emit(out, "cleanup_max_age_hours", c.health.cleanup_max_age_hours);
  }
  {
    YamlMapScope section(out, "retry");
    yaml_emit(out, "max_retries", c.retry.max_retries);
    yaml_emit(out, "base_backoff_sec", c.retry.base_backoff_sec);
    yaml_emit(out, "backoff_multiplier", c.retry.backoff_multiplier);
  }
  {
    YamlMapScope section(out, "events");
    yaml_emit(out, "history_capacity", c.events.history_capacity);
    yaml_emit(out, "dispatcher_threads", c.events.dispatcher_threads);
  }
  {
    YamlMapScope section(out, "storage");
    yaml_emit(out, "db_file", c.storage.db_file);
  }
  out << YAML::EndMap;
  return out.c_str();
}

auto validate_config(const SystemConfig& c) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::InvalidArgument);
  };
  if (c.state_dir.empty()) {
    return reject("state_dir must not be empty");
  }
  if (c.repository.base_branch.empty()) {
    return reject("repository.base_branch must not be empty");
  }
  if (c.repository.lock_timeout_sec <= 0) {
    return reject("repository.lock_timeout_sec must be positive");
  }
  if (c.executor.max_workers < 1) {
    return reject("executor.max_workers must be at least 1");
  }
  if (c.executor.timeout_sec <= 0) {
    return reject("executor.timeout_sec must be positive");
  }
  if (c.health.hung_threshold_sec <= 0 ||
      c.health.dead_threshold_sec <= c.health.hung_threshold_sec) {
    return reject(
        "health thresholds must satisfy 0 < hung_threshold_sec < "
        "dead_threshold_sec");
  }
  if (c.retry.max_retries < 0) {
    return reject("retry.max_retries must not be negative");
  }
  if (c.retry.base_backoff_sec < 0 || c.retry.backoff_multiplier < 1.0) {
    return reject(
        "retry.base_backoff_sec must be >= 0 and backoff_multiplier >= 1");
  }
  if (c.events.history_capacity == 0) {
    return reject("events.history_capacity must be positive");
  }
  return ok();
}

auto database_path(const SystemConfig& config) -> std::filesystem::path {
  std::filesystem::path db{config.storage.db_file};
  if (db.is_absolute()) {
    return db;
  }
  return std::filesystem::path{config.state_dir} / db;
}

}  // namespace storyloop
