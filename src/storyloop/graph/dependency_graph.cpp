#include "storyloop/graph/dependency_graph.hpp"

#include "storyloop/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <queue>
#include <ranges>

namespace storyloop {

namespace {

enum class Color : std::uint8_t { White, Gray, Black };

auto ids_to_json(const std::vector<TaskId>& ids) -> nlohmann::json {
  auto arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id.str());
  }
  return arr;
}

auto join_ids(std::span<const TaskId> ids, std::string_view sep)
    -> std::string {
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

auto ExecutionPlan::to_json() const -> nlohmann::json {
  nlohmann::json j;
  auto batches_json = nlohmann::json::array();
  for (const auto& batch : batches) {
    batches_json.push_back(ids_to_json(batch));
  }
  j["batches"] = std::move(batches_json);
  j["total_stories"] = total_tasks;
  j["sequential_steps"] = num_batches;
  j["max_parallelism"] = max_parallelism;

  auto details = nlohmann::json::object();
  for (const auto& entry : tasks) {
    details[entry.id.str()] = {
        {"id", entry.id.str()},
        {"title", entry.title},
        {"batch", entry.batch},
        {"dependencies", ids_to_json(entry.dependencies)},
        {"fileScope", entry.file_scope},
        {"priority", entry.priority},
        {"estimatedComplexity", entry.estimated_complexity},
        {"suggestedModel", entry.suggested_model},
    };
  }
  j["story_details"] = std::move(details);
  return j;
}

auto DependencyGraph::build(std::vector<Task> tasks)
    -> Result<DependencyGraph> {
  DependencyGraph graph;
  graph.tasks_ = std::move(tasks);
  graph.nodes_.resize(graph.tasks_.size());
  graph.key_to_idx_.reserve(graph.tasks_.size());

  for (NodeIndex i = 0; i < graph.tasks_.size(); ++i) {
    auto [_, inserted] = graph.key_to_idx_.emplace(graph.tasks_[i].id, i);
    if (!inserted) {
      log::error("Duplicate task id: {}", graph.tasks_[i].id);
      return fail(Error::DuplicateTask);
    }
  }

  for (NodeIndex i = 0; i < graph.tasks_.size(); ++i) {
    const auto& task = graph.tasks_[i];
    for (const auto& dep : task.dependencies) {
      auto it = graph.key_to_idx_.find(dep);
      if (it == graph.key_to_idx_.end()) {
        log::error("Task {} depends on unknown task {}", task.id, dep);
        return fail(Error::UnknownDependency);
      }
      auto& deps = graph.nodes_[i].deps;
      if (std::ranges::find(deps, it->second) != deps.end()) {
        continue;
      }
      deps.push_back(it->second);
      graph.nodes_[it->second].dependents.push_back(i);
    }
  }
  return graph;
}

auto DependencyGraph::subset(TaskFilter filter) const -> std::vector<bool> {
  std::vector<bool> in(tasks_.size(), true);
  if (filter == TaskFilter::IncompleteOnly) {
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
      in[i] = !tasks_[i].passes;
    }
  }
  return in;
}

auto DependencyGraph::precedes(NodeIndex a, NodeIndex b) const noexcept
    -> bool {
  if (tasks_[a].priority != tasks_[b].priority) {
    return tasks_[a].priority < tasks_[b].priority;
  }
  return a < b;
}

auto DependencyGraph::detect_cycles(TaskFilter filter) const
    -> std::vector<Cycle> {
  auto in = subset(filter);
  std::vector<Color> color(tasks_.size(), Color::White);
  std::vector<Cycle> cycles;
  // (node, next dependency to visit); the stack doubles as the DFS path.
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (NodeIndex start = 0; start < tasks_.size(); ++start) {
    if (!in[start] || color[start] != Color::White) {
      continue;
    }

    stack.push_back({start, 0});
    color[start] = Color::Gray;

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();
      const auto& deps = nodes_[node].deps;

      if (child_idx < deps.size()) {
        NodeIndex next = deps[child_idx++];
        if (!in[next]) {
          continue;
        }
        if (color[next] == Color::Gray) {
          auto pos = std::ranges::find_if(
              stack, [next](const auto& frame) { return frame.first == next; });
          Cycle cycle;
          for (auto it = pos; it != stack.end(); ++it) {
            cycle.push_back(tasks_[it->first].id);
          }
          cycle.push_back(tasks_[next].id);
          cycles.push_back(std::move(cycle));
        } else if (color[next] == Color::White) {
          color[next] = Color::Gray;
          stack.push_back({next, 0});
        }
      } else {
        color[node] = Color::Black;
        stack.pop_back();
      }
    }
  }
  return cycles;
}

auto DependencyGraph::topological_order(TaskFilter filter) const
    -> Result<std::vector<TaskId>> {
  auto in = subset(filter);
  std::vector<int> in_degree(tasks_.size(), 0);
  std::size_t remaining = 0;
  for (NodeIndex i = 0; i < tasks_.size(); ++i) {
    if (!in[i]) {
      continue;
    }
    ++remaining;
    for (NodeIndex dep : nodes_[i].deps) {
      if (in[dep]) {
        ++in_degree[i];
      }
    }
  }

  auto later = [this](NodeIndex a, NodeIndex b) { return precedes(b, a); };
  std::priority_queue<NodeIndex, std::vector<NodeIndex>, decltype(later)> ready(
      later);
  for (NodeIndex i = 0; i < tasks_.size(); ++i) {
    if (in[i] && in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<TaskId> order;
  order.reserve(remaining);
  while (!ready.empty()) {
    NodeIndex current = ready.top();
    ready.pop();
    order.push_back(tasks_[current].id);

    for (NodeIndex dependent : nodes_[current].dependents) {
      if (in[dependent] && --in_degree[dependent] == 0) {
        ready.push(dependent);
      }
    }
  }

  if (order.size() != remaining) {
    std::vector<TaskId> stuck;
    for (NodeIndex i = 0; i < tasks_.size(); ++i) {
      if (in[i] && in_degree[i] > 0) {
        stuck.push_back(tasks_[i].id);
      }
    }
    log::error("Circular dependency detected involving: {}",
               join_ids(stuck, ", "));
    return fail(Error::CycleDetected);
  }
  return order;
}

auto DependencyGraph::parallel_batches(TaskFilter filter) const
    -> Result<std::vector<Batch>> {
  auto pending = subset(filter);
  std::vector<int> in_degree(tasks_.size(), 0);
  std::size_t remaining = 0;
  for (NodeIndex i = 0; i < tasks_.size(); ++i) {
    if (!pending[i]) {
      continue;
    }
    ++remaining;
    for (NodeIndex dep : nodes_[i].deps) {
      if (pending[dep]) {
        ++in_degree[i];
      }
    }
  }

  std::vector<Batch> batches;
  std::vector<NodeIndex> ready;
  while (remaining > 0) {
    ready.clear();
    for (NodeIndex i = 0; i < tasks_.size(); ++i) {
      if (pending[i] && in_degree[i] == 0) {
        ready.push_back(i);
      }
    }

    if (ready.empty()) {
      std::vector<TaskId> stuck;
      for (NodeIndex i = 0; i < tasks_.size(); ++i) {
        if (pending[i]) {
          stuck.push_back(tasks_[i].id);
        }
      }
      log::error("Circular dependency detected. Remaining stories: {}",
                 join_ids(stuck, ", "));
      return fail(Error::CycleDetected);
    }

    std::ranges::sort(ready, [this](NodeIndex a, NodeIndex b) {
      return precedes(a, b);
    });

    Batch batch;
    batch.reserve(ready.size());
    for (NodeIndex idx : ready) {
      batch.push_back(tasks_[idx].id);
      pending[idx] = false;
      --remaining;
    }
    for (NodeIndex idx : ready) {
      for (NodeIndex dependent : nodes_[idx].dependents) {
        if (pending[dependent]) {
          --in_degree[dependent];
        }
      }
    }
    batches.push_back(std::move(batch));
  }
  return batches;
}

auto DependencyGraph::execution_plan(TaskFilter filter) const
    -> Result<ExecutionPlan> {
  auto batches = parallel_batches(filter);
  if (!batches) {
    return std::unexpected(batches.error());
  }

  ExecutionPlan plan;
  plan.num_batches = batches->size();
  for (std::size_t b = 0; b < batches->size(); ++b) {
    const auto& batch = (*batches)[b];
    plan.total_tasks += batch.size();
    plan.max_parallelism = std::max(plan.max_parallelism, batch.size());
    for (const auto& id : batch) {
      const auto& task = tasks_[key_to_idx_.at(id)];
      plan.tasks.push_back(PlanEntry{
          .id = task.id,
          .title = task.title,
          .batch = b + 1,
          .dependencies = task.dependencies,
          .file_scope = task.file_scope,
          .priority = task.priority,
          .estimated_complexity = task.estimated_complexity,
          .suggested_model = task.suggested_model,
      });
    }
  }
  plan.batches = std::move(*batches);
  return plan;
}

auto DependencyGraph::visualize(TaskFilter filter) const
    -> Result<std::string> {
  auto batches = parallel_batches(filter);
  if (!batches) {
    return std::unexpected(batches.error());
  }
  if (batches->empty()) {
    return std::string{"No stories to display.\n"};
  }

  std::string out;
  auto line = [&out](std::string_view s) {
    out += s;
    out += '\n';
  };

  line("Execution Plan Visualization");
  line(std::string(60, '='));
  line("");

  std::size_t total = 0;
  std::size_t max_par = 0;
  for (std::size_t b = 0; b < batches->size(); ++b) {
    const auto& batch = (*batches)[b];
    total += batch.size();
    max_par = std::max(max_par, batch.size());

    line(std::format("Batch {} (can run in parallel):", b + 1));
    line(std::string(40, '-'));
    for (const auto& id : batch) {
      const auto& task = tasks_[key_to_idx_.at(id)];
      std::string_view title = task.title.empty() ? "Untitled" : task.title;
      line(std::format("  {} {}: {}", task.passes ? "[x]" : "[ ]", id,
                       title.substr(0, 35)));
      line(std::format("      Model: {} | Complexity: {}", task.suggested_model,
                       task.estimated_complexity));
      if (!task.dependencies.empty()) {
        line(std::format("      Depends on: {}",
                         join_ids(task.dependencies, ", ")));
      }
      if (!task.file_scope.empty()) {
        std::string scope;
        for (const auto& p : task.file_scope) {
          scope += scope.empty() ? p : ", " + p;
        }
        line(std::format("      Files: {}", scope));
      }
    }
    line("");
  }

  line(std::string(60, '='));
  line(std::format("Total: {} stories in {} sequential batches", total,
                   batches->size()));
  line(std::format("Max parallelism: {} concurrent stories", max_par));
  line(std::format("Speedup potential: {:.1f}x vs sequential",
                   static_cast<double>(total) /
                       static_cast<double>(batches->size())));
  return out;
}

auto DependencyGraph::dependents_closure(const TaskId& id) const
    -> std::vector<TaskId> {
  auto start = index_of(id);
  if (start == kInvalidNode) {
    return {};
  }
  std::vector<bool> seen(tasks_.size(), false);
  std::vector<NodeIndex> stack{start};
  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();
    for (NodeIndex dependent : nodes_[current].dependents) {
      if (!seen[dependent]) {
        seen[dependent] = true;
        stack.push_back(dependent);
      }
    }
  }
  std::vector<TaskId> result;
  for (NodeIndex i = 0; i < tasks_.size(); ++i) {
    if (seen[i] && i != start) {
      result.push_back(tasks_[i].id);
    }
  }
  return result;
}

auto DependencyGraph::has_edge(const TaskId& a, const TaskId& b) const
    -> bool {
  auto ia = index_of(a);
  auto ib = index_of(b);
  if (ia == kInvalidNode || ib == kInvalidNode) {
    return false;
  }
  return std::ranges::find(nodes_[ia].deps, ib) != nodes_[ia].deps.end() ||
         std::ranges::find(nodes_[ib].deps, ia) != nodes_[ib].deps.end();
}

auto DependencyGraph::find(const TaskId& id) const -> const Task* {
  auto idx = index_of(id);
  return idx == kInvalidNode ? nullptr : &tasks_[idx];
}

auto DependencyGraph::index_of(const TaskId& id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DependencyGraph::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

}  // namespace storyloop
