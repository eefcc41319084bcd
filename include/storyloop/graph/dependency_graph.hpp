#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/graph/task.hpp"
#include "storyloop/util/id.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace storyloop {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

using Batch = std::vector<TaskId>;
// Ordered id sequence that closes back on its first element.
using Cycle = std::vector<TaskId>;

struct PlanEntry {
  TaskId id;
  std::string title;
  std::size_t batch{0};  // 1-based
  std::vector<TaskId> dependencies;
  std::vector<std::string> file_scope;
  int priority{kDefaultPriority};
  std::string estimated_complexity;
  std::string suggested_model;
};

struct ExecutionPlan {
  std::vector<Batch> batches;
  std::size_t total_tasks{0};
  std::size_t num_batches{0};
  std::size_t max_parallelism{0};
  std::vector<PlanEntry> tasks;  // in batch order

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Immutable DAG over the tasks of one planning pass. Every query takes a
// filter; dependencies on tasks outside the filtered subset count as
// satisfied.
class DependencyGraph {
public:
  [[nodiscard]] static auto build(std::vector<Task> tasks)
      -> Result<DependencyGraph>;

  [[nodiscard]] auto detect_cycles(TaskFilter filter = TaskFilter::All) const
      -> std::vector<Cycle>;

  // Kahn's algorithm; ready ties broken by (priority, declaration order).
  [[nodiscard]] auto topological_order(TaskFilter filter = TaskFilter::All) const
      -> Result<std::vector<TaskId>>;

  [[nodiscard]] auto parallel_batches(TaskFilter filter = TaskFilter::All) const
      -> Result<std::vector<Batch>>;

  [[nodiscard]] auto execution_plan(TaskFilter filter = TaskFilter::All) const
      -> Result<ExecutionPlan>;

  [[nodiscard]] auto visualize(TaskFilter filter = TaskFilter::All) const
      -> Result<std::string>;

  // Every task that transitively depends on `id`, in declaration order.
  [[nodiscard]] auto dependents_closure(const TaskId& id) const
      -> std::vector<TaskId>;

  // True when either task lists the other as a direct dependency.
  [[nodiscard]] auto has_edge(const TaskId& a, const TaskId& b) const -> bool;

  [[nodiscard]] auto find(const TaskId& id) const -> const Task*;
  [[nodiscard]] auto index_of(const TaskId& id) const -> NodeIndex;

  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto tasks() const noexcept -> std::span<const Task> {
    return tasks_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return tasks_.empty();
  }

private:
  DependencyGraph() = default;

  [[nodiscard]] auto subset(TaskFilter filter) const -> std::vector<bool>;
  [[nodiscard]] auto precedes(NodeIndex a, NodeIndex b) const noexcept -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Task> tasks_;
  std::vector<Node> nodes_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
};

}  // namespace storyloop
