#pragma once

#include "storyloop/config/system_config.hpp"
#include "storyloop/core/error.hpp"
#include "storyloop/graph/dependency_graph.hpp"
#include "storyloop/merge/merge_controller.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace storyloop::cli {

inline constexpr std::string_view kDefaultConfigFile = "storyloop.yaml";

// An empty path falls back to ./storyloop.yaml when present, then defaults.
[[nodiscard]] auto load_config(std::string_view path) -> Result<SystemConfig>;

auto setup_logging(const SystemConfig& config) -> void;

[[nodiscard]] auto load_tasks(std::string_view prd_file)
    -> Result<std::vector<Task>>;

[[nodiscard]] auto load_graph(std::string_view prd_file)
    -> Result<DependencyGraph>;

[[nodiscard]] auto open_merge_controller(const SystemConfig& config)
    -> Result<std::unique_ptr<MergeController>>;

[[nodiscard]] constexpr auto filter_for(bool include_completed) noexcept
    -> TaskFilter {
  return include_completed ? TaskFilter::All : TaskFilter::IncompleteOnly;
}

}  // namespace storyloop::cli
