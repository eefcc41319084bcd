#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/graph/task.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace storyloop {

struct PrdDocument {
  std::string project;
  std::string branch_name;
  std::vector<Task> tasks;
};

// Reads the requirements document:
//   {"project": "...", "branchName": "...",
//    "userStories": [{"id", "title", "description", "dependencies",
//                     "fileScope", "priority", "passes",
//                     "estimatedComplexity", "suggestedModel"}]}
// Only the fields the planner needs are interpreted.
class PrdLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<PrdDocument>;
  [[nodiscard]] static auto load_from_string(std::string_view json_str)
      -> Result<PrdDocument>;
};

}  // namespace storyloop
