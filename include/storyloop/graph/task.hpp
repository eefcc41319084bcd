#pragma once

#include "storyloop/util/id.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace storyloop {

inline constexpr int kDefaultPriority = 999;

// One story from the requirements document.
struct Task {
  TaskId id;
  std::string title;
  std::string description;
  std::vector<TaskId> dependencies;
  std::vector<std::string> file_scope;  // sorted, unique
  int priority{kDefaultPriority};
  bool passes{false};
  std::string estimated_complexity{"medium"};
  std::string suggested_model{"sonnet"};

  auto normalize_scope() -> void {
    std::ranges::sort(file_scope);
    auto dup = std::ranges::unique(file_scope);
    file_scope.erase(dup.begin(), dup.end());
  }
};

enum class TaskFilter : std::uint8_t {
  All,
  IncompleteOnly,
};

}  // namespace storyloop
