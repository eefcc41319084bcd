#include "storyloop/cli/commands.hpp"
#include "storyloop/cli/context.hpp"
#include "storyloop/merge/merge_controller.hpp"

#include <nlohmann/json.hpp>

#include <print>
#include <string>

namespace storyloop::cli {

namespace {

auto join(const std::vector<TaskId>& ids, std::string_view sep) -> std::string {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) {
      out += sep;
    }
    out += id.str();
  }
  return out;
}

}  // namespace

auto cmd_plan(const GraphOptions& opts) -> int {
  auto graph = load_graph(opts.prd_file);
  if (!graph) {
    return 1;
  }
  auto filter = filter_for(opts.include_completed);

  if (opts.json) {
    auto plan = graph->execution_plan(filter);
    if (!plan) {
      std::println(stderr, "Error: {}", plan.error().message());
      return 1;
    }
    std::println("{}", plan->to_json().dump(2));
    return 0;
  }

  auto text = graph->visualize(filter);
  if (!text) {
    std::println(stderr, "Error: {}", text.error().message());
    return 1;
  }
  std::print("{}", *text);
  return 0;
}

auto cmd_check_cycles(const GraphOptions& opts) -> int {
  auto graph = load_graph(opts.prd_file);
  if (!graph) {
    return 1;
  }
  auto cycles = graph->detect_cycles(filter_for(opts.include_completed));

  if (opts.json) {
    auto out = nlohmann::json::array();
    for (const auto& cycle : cycles) {
      auto ids = nlohmann::json::array();
      for (const auto& id : cycle) {
        ids.push_back(id.str());
      }
      out.push_back(std::move(ids));
    }
    std::println("{}", nlohmann::json{{"cycles", std::move(out)}}.dump(2));
    return cycles.empty() ? 0 : 1;
  }

  if (cycles.empty()) {
    std::println("✓ No dependency cycles ({} stories)", graph->size());
    return 0;
  }
  std::println("✗ {} cycle(s) found:", cycles.size());
  for (const auto& cycle : cycles) {
    std::println("  {}", join(cycle, " -> "));
  }
  return 1;
}

auto cmd_batches(const GraphOptions& opts) -> int {
  auto graph = load_graph(opts.prd_file);
  if (!graph) {
    return 1;
  }
  auto batches = graph->parallel_batches(filter_for(opts.include_completed));
  if (!batches) {
    std::println(stderr, "Error: {}", batches.error().message());
    return 1;
  }

  if (opts.json) {
    auto out = nlohmann::json::array();
    for (const auto& batch : *batches) {
      auto ids = nlohmann::json::array();
      for (const auto& id : batch) {
        ids.push_back(id.str());
      }
      out.push_back(std::move(ids));
    }
    std::println("{}", out.dump(2));
    return 0;
  }

  if (batches->empty()) {
    std::println("Nothing to schedule.");
    return 0;
  }
  for (std::size_t i = 0; i < batches->size(); ++i) {
    std::println("Batch {}: {}", i + 1, join((*batches)[i], ", "));
  }
  return 0;
}

auto cmd_check_conflicts(const GraphOptions& opts) -> int {
  auto graph = load_graph(opts.prd_file);
  if (!graph) {
    return 1;
  }
  auto batches = graph->parallel_batches(filter_for(opts.include_completed));
  if (!batches) {
    std::println(stderr, "Error: {}", batches.error().message());
    return 1;
  }

  auto report = nlohmann::json::array();
  std::size_t total = 0;
  for (std::size_t i = 0; i < batches->size(); ++i) {
    const auto& batch = (*batches)[i];
    auto conflicts = MergeController::check_conflicts(*graph, batch);
    auto sub_batches = MergeController::resolve_conflicts(*graph, batch);
    total += conflicts.size();

    if (opts.json) {
      auto entry = nlohmann::json{{"batch", i + 1}};
      entry["conflicts"] = nlohmann::json::array();
      for (const auto& c : conflicts) {
        entry["conflicts"].push_back(c.to_json());
      }
      entry["sub_batches"] = nlohmann::json::array();
      for (const auto& sb : sub_batches) {
        auto ids = nlohmann::json::array();
        for (const auto& id : sb) {
          ids.push_back(id.str());
        }
        entry["sub_batches"].push_back(std::move(ids));
      }
      report.push_back(std::move(entry));
      continue;
    }

    if (conflicts.empty()) {
      std::println("Batch {}: no conflicts", i + 1);
      continue;
    }
    std::println("Batch {}: {} conflict(s)", i + 1, conflicts.size());
    for (const auto& c : conflicts) {
      std::string what;
      for (const auto& p : c.paths) {
        what += what.empty() ? p : ", " + p;
      }
      if (c.dependency) {
        what += what.empty() ? "dependency" : " (dependency)";
      }
      std::println("  {} <-> {}: {}", c.first, c.second, what);
    }
    for (std::size_t s = 0; s < sub_batches.size(); ++s) {
      std::println("  sub-batch {}: {}", s + 1, join(sub_batches[s], ", "));
    }
  }

  if (opts.json) {
    std::println("{}", report.dump(2));
  }
  return total == 0 ? 0 : 1;
}

}  // namespace storyloop::cli
