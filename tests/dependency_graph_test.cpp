#include "storyloop/graph/dependency_graph.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include <algorithm>

using namespace storyloop;
using storyloop::test::ids;
using storyloop::test::make_task;
using storyloop::test::task_id;

namespace {

auto build(std::vector<Task> tasks) -> DependencyGraph {
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_TRUE(graph.has_value());
  return std::move(*graph);
}

}  // namespace

TEST(DependencyGraphTest, Build_UnknownDependency_Fails) {
  auto graph = DependencyGraph::build({make_task("A", {"GHOST"})});

  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::UnknownDependency));
}

TEST(DependencyGraphTest, Build_DuplicateId_Fails) {
  auto graph = DependencyGraph::build({make_task("A"), make_task("A")});

  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::DuplicateTask));
}

TEST(DependencyGraphTest, ParallelBatches_Diamond) {
  auto graph = build({make_task("A"), make_task("B", {"A"}),
                      make_task("C", {"A"}), make_task("D", {"B", "C"})});

  auto batches = graph.parallel_batches();

  ASSERT_TRUE(batches.has_value());
  ASSERT_EQ(batches->size(), 3u);
  EXPECT_EQ((*batches)[0], ids({"A"}));
  EXPECT_EQ((*batches)[1], ids({"B", "C"}));
  EXPECT_EQ((*batches)[2], ids({"D"}));
}

TEST(DependencyGraphTest, ParallelBatches_OrderedByPriorityThenDeclaration) {
  auto graph = build({make_task("X", {}, {}, 5), make_task("Y", {}, {}, 1),
                      make_task("Z", {}, {}, 5)});

  auto batches = graph.parallel_batches();

  ASSERT_TRUE(batches.has_value());
  ASSERT_EQ(batches->size(), 1u);
  EXPECT_EQ((*batches)[0], ids({"Y", "X", "Z"}));
}

TEST(DependencyGraphTest, ParallelBatches_NoEdgesInsideABatch) {
  auto graph =
      build({make_task("A"), make_task("B", {"A"}), make_task("C"),
             make_task("D", {"C", "B"}), make_task("E", {"A"}),
             make_task("F", {"E", "D"})});

  auto batches = graph.parallel_batches();

  ASSERT_TRUE(batches.has_value());
  for (const auto& batch : *batches) {
    for (const auto& a : batch) {
      for (const auto& b : batch) {
        EXPECT_FALSE(graph.has_edge(a, b)) << a << " and " << b;
      }
    }
  }
}

TEST(DependencyGraphTest, IncompleteOnly_CompletedDependencyIsSatisfied) {
  auto graph = build({make_task("A", {}, {}, kDefaultPriority, true),
                      make_task("B", {"A"})});

  auto batches = graph.parallel_batches(TaskFilter::IncompleteOnly);

  ASSERT_TRUE(batches.has_value());
  ASSERT_EQ(batches->size(), 1u);
  EXPECT_EQ((*batches)[0], ids({"B"}));
}

TEST(DependencyGraphTest, IncompleteOnly_AllDone_EmptyPlan) {
  auto graph = build({make_task("A", {}, {}, kDefaultPriority, true)});

  auto plan = graph.execution_plan(TaskFilter::IncompleteOnly);

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->total_tasks, 0u);
  EXPECT_EQ(plan->num_batches, 0u);
  EXPECT_TRUE(plan->batches.empty());
}

TEST(DependencyGraphTest, DetectCycles_ThreeCycle) {
  auto graph = build({make_task("A", {"C"}), make_task("B", {"A"}),
                      make_task("C", {"B"})});

  auto cycles = graph.detect_cycles();

  ASSERT_EQ(cycles.size(), 1u);
  const auto& cycle = cycles.front();
  ASSERT_EQ(cycle.size(), 4u);
  EXPECT_EQ(cycle.front(), cycle.back());
}

TEST(DependencyGraphTest, DetectCycles_SelfLoop) {
  auto graph = build({make_task("A", {"A"})});

  auto cycles = graph.detect_cycles();

  ASSERT_EQ(cycles.size(), 1u);
  EXPECT_EQ(cycles.front(), ids({"A", "A"}));
}

TEST(DependencyGraphTest, DetectCycles_Acyclic_Empty) {
  auto graph = build({make_task("A"), make_task("B", {"A"})});

  EXPECT_TRUE(graph.detect_cycles().empty());
}

TEST(DependencyGraphTest, Cycle_BatchesAndTopologicalOrderFail) {
  auto graph = build({make_task("A", {"B"}), make_task("B", {"A"}),
                      make_task("C")});

  auto batches = graph.parallel_batches();
  auto order = graph.topological_order();

  ASSERT_FALSE(batches.has_value());
  EXPECT_EQ(batches.error(), make_error_code(Error::CycleDetected));
  ASSERT_FALSE(order.has_value());
  EXPECT_EQ(order.error(), make_error_code(Error::CycleDetected));
}

TEST(DependencyGraphTest, Cycle_AmongCompletedTasks_Ignored) {
  auto graph = build({make_task("A", {"B"}, {}, kDefaultPriority, true),
                      make_task("B", {"A"}, {}, kDefaultPriority, true),
                      make_task("C", {"A"})});

  EXPECT_TRUE(graph.detect_cycles(TaskFilter::IncompleteOnly).empty());
  auto batches = graph.parallel_batches(TaskFilter::IncompleteOnly);
  ASSERT_TRUE(batches.has_value());
  EXPECT_EQ(batches->size(), 1u);
}

TEST(DependencyGraphTest, TopologicalOrder_RespectsDependencies) {
  auto graph = build({make_task("D", {"B", "C"}), make_task("C", {"A"}),
                      make_task("B", {"A"}), make_task("A")});

  auto order = graph.topological_order();

  ASSERT_TRUE(order.has_value());
  auto pos = [&](std::string_view id) {
    return std::ranges::find(*order, task_id(id)) - order->begin();
  };
  EXPECT_LT(pos("A"), pos("B"));
  EXPECT_LT(pos("A"), pos("C"));
  EXPECT_LT(pos("B"), pos("D"));
  EXPECT_LT(pos("C"), pos("D"));
}

TEST(DependencyGraphTest, TopologicalOrder_CoversEveryTaskOnce) {
  auto graph = build({make_task("E", {"D"}), make_task("D", {"B", "C"}),
                      make_task("C", {"A"}), make_task("B", {"A"}),
                      make_task("A"), make_task("F"), make_task("G", {"F", "C"})});

  auto order = graph.topological_order();
  auto batches = graph.parallel_batches();

  ASSERT_TRUE(order.has_value());
  ASSERT_TRUE(batches.has_value());
  EXPECT_EQ(batches->size(), 4u);
  std::vector<TaskId> flattened;
  for (const auto& batch : *batches) {
    flattened.insert(flattened.end(), batch.begin(), batch.end());
  }
  auto sorted_order = *order;
  std::ranges::sort(sorted_order);
  std::ranges::sort(flattened);
  EXPECT_EQ(order->size(), 7u);
  EXPECT_EQ(std::ranges::adjacent_find(sorted_order), sorted_order.end());
  EXPECT_EQ(sorted_order, ids({"A", "B", "C", "D", "E", "F", "G"}));
  EXPECT_EQ(flattened, sorted_order);
}

TEST(DependencyGraphTest, ExecutionPlan_Aggregates) {
  auto graph = build({make_task("A"), make_task("B"), make_task("C", {"A"})});

  auto plan = graph.execution_plan();

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->total_tasks, 3u);
  EXPECT_EQ(plan->num_batches, 2u);
  EXPECT_EQ(plan->max_parallelism, 2u);
  ASSERT_EQ(plan->tasks.size(), 3u);
  EXPECT_EQ(plan->tasks[2].id, task_id("C"));
  EXPECT_EQ(plan->tasks[2].batch, 2u);

  auto j = plan->to_json();
  EXPECT_EQ(j["total_stories"], 3);
  EXPECT_EQ(j["sequential_steps"], 2);
}

TEST(DependencyGraphTest, Visualize_MarksCompletion) {
  auto graph = build({make_task("A", {}, {}, kDefaultPriority, true),
                      make_task("B", {"A"}, {"src/b.cpp"})});

  auto text = graph.visualize(TaskFilter::All);

  ASSERT_TRUE(text.has_value());
  EXPECT_NE(text->find("[x] A"), std::string::npos);
  EXPECT_NE(text->find("[ ] B"), std::string::npos);
  EXPECT_NE(text->find("Depends on: A"), std::string::npos);
  EXPECT_NE(text->find("Files: src/b.cpp"), std::string::npos);
  EXPECT_NE(text->find("Max parallelism: 1"), std::string::npos);
}

TEST(DependencyGraphTest, DependentsClosure_IsTransitive) {
  auto graph = build({make_task("A"), make_task("B", {"A"}),
                      make_task("C", {"B"}), make_task("D")});

  EXPECT_EQ(graph.dependents_closure(task_id("A")), ids({"B", "C"}));
  EXPECT_TRUE(graph.dependents_closure(task_id("D")).empty());
  EXPECT_TRUE(graph.dependents_closure(task_id("missing")).empty());
}
