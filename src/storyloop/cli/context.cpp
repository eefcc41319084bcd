#include "storyloop/cli/context.hpp"

#include "storyloop/config/config.hpp"
#include "storyloop/prd/prd_loader.hpp"
#include "storyloop/util/log.hpp"

#include <filesystem>
#include <print>

namespace storyloop::cli {

auto load_config(std::string_view path) -> Result<SystemConfig> {
  Result<SystemConfig> config = SystemConfig{};
  if (!path.empty()) {
    config = ConfigLoader::load_from_file(path);
  } else if (std::filesystem::exists(kDefaultConfigFile)) {
    config = ConfigLoader::load_from_file(kDefaultConfigFile);
  }
  if (!config) {
    std::println(stderr, "Error: Failed to load config {}: {}",
                 path.empty() ? kDefaultConfigFile : path,
                 config.error().message());
    return config;
  }
  if (auto r = validate_config(*config); !r) {
    std::println(stderr, "Error: Invalid config: {}", r.error().message());
    return std::unexpected(r.error());
  }
  return config;
}

auto setup_logging(const SystemConfig& config) -> void {
  log::set_level(config.log.level);
  if (!config.log.file.empty() && !log::set_file(config.log.file)) {
    std::println(stderr, "Warning: cannot open log file {}", config.log.file);
  }
  log::start();
}

auto load_tasks(std::string_view prd_file) -> Result<std::vector<Task>> {
  auto doc = PrdLoader::load_from_file(prd_file);
  if (!doc) {
    std::println(stderr, "Error: Failed to load {}: {}", prd_file,
                 doc.error().message());
    return std::unexpected(doc.error());
  }
  return std::move(doc->tasks);
}

auto load_graph(std::string_view prd_file) -> Result<DependencyGraph> {
  auto tasks = load_tasks(prd_file);
  if (!tasks) {
    return std::unexpected(tasks.error());
  }
  auto graph = DependencyGraph::build(std::move(*tasks));
  if (!graph) {
    std::println(stderr, "Error: Invalid dependency graph: {}",
                 graph.error().message());
  }
  return graph;
}

auto open_merge_controller(const SystemConfig& config)
    -> Result<std::unique_ptr<MergeController>> {
  auto repo = GitRepository::discover(config.repository.path);
  if (!repo) {
    std::println(stderr, "Error: {} is not inside a git repository",
                 config.repository.path);
    return std::unexpected(repo.error());
  }
  MergeOptions options{
      .state_dir = config.state_dir,
      .branch_prefix = config.repository.branch_prefix,
      .lock_timeout = std::chrono::seconds(config.repository.lock_timeout_sec),
  };
  return std::make_unique<MergeController>(std::move(*repo), std::move(options));
}

}  // namespace storyloop::cli
