#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace storyloop {

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct RepositoryConfig {
  std::string path{"."};
  std::string base_branch{"main"};
  std::string branch_prefix{"worker/"};
  int lock_timeout_sec{30};
};

struct ExecutorConfig {
  // Shell template; see expand_command() for placeholders.
  std::string command;
  int max_workers{3};
  int timeout_sec{600};
  int poll_interval_ms{200};
};

struct HealthConfig {
  int heartbeat_interval_sec{30};
  int hung_threshold_sec{120};
  int dead_threshold_sec{300};
  int check_interval_sec{10};
  int hung_grace_sec{60};
  int cleanup_max_age_hours{24};
};

struct RetryConfig {
  int max_retries{3};
  double base_backoff_sec{60.0};
  double backoff_multiplier{2.0};
};

struct EventsConfig {
  std::size_t history_capacity{1000};
  int dispatcher_threads{2};
};

struct StorageConfig {
  // Relative paths resolve against state_dir.
  std::string db_file{"runs.db"};
};

struct SystemConfig {
  std::string state_dir{".storyloop"};
  LogConfig log;
  RepositoryConfig repository;
  ExecutorConfig executor;
  HealthConfig health;
  RetryConfig retry;
  EventsConfig events;
  StorageConfig storage;
};

}  // namespace storyloop
