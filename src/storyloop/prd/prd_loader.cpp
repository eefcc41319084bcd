#include "storyloop/prd/prd_loader.hpp"

#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <nlohmann/json.hpp>

namespace storyloop {

namespace {

auto parse_task(const nlohmann::json& j, std::size_t index) -> Result<Task> {
  if (!j.is_object()) {
    log::error("userStories[{}] is not an object", index);
    return fail(Error::ParseError);
  }
  auto id = j.value("id", std::string{});
  if (id.empty()) {
    log::error("userStories[{}] has no id", index);
    return fail(Error::ParseError);
  }

  Task task;
  task.id = TaskId{std::move(id)};
  task.title = j.value("title", std::string{});
  task.description = j.value("description", std::string{});
  task.priority = j.value("priority", kDefaultPriority);
  task.passes = j.value("passes", false);
  task.estimated_complexity =
      j.value("estimatedComplexity", std::string{"medium"});
  task.suggested_model = j.value("suggestedModel", std::string{"sonnet"});

  if (auto it = j.find("dependencies"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      log::error("Story {}: dependencies must be an array", task.id);
      return fail(Error::ParseError);
    }
    for (const auto& dep : *it) {
      task.dependencies.emplace_back(dep.get<std::string>());
    }
  }
  if (auto it = j.find("fileScope"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      log::error("Story {}: fileScope must be an array", task.id);
      return fail(Error::ParseError);
    }
    for (const auto& path : *it) {
      task.file_scope.push_back(path.get<std::string>());
    }
  }
  task.normalize_scope();
  return ok(std::move(task));
}

}  // namespace

auto PrdLoader::load_from_file(std::string_view path) -> Result<PrdDocument> {
  auto content = read_file(std::string{path});
  if (!content) {
    log::error("Failed to read PRD file {}: {}", path,
               content.error().message());
    return std::unexpected(content.error());
  }
  return load_from_string(*content);
}

auto PrdLoader::load_from_string(std::string_view json_str)
    -> Result<PrdDocument> {
  try {
    auto root = nlohmann::json::parse(json_str);
    if (!root.is_object()) {
      log::error("PRD root must be an object");
      return fail(Error::ParseError);
    }

    PrdDocument doc;
    doc.project = root.value("project", std::string{});
    doc.branch_name = root.value("branchName", std::string{});

    auto stories = root.find("userStories");
    if (stories == root.end() || !stories->is_array()) {
      log::error("PRD has no userStories array");
      return fail(Error::ParseError);
    }
    doc.tasks.reserve(stories->size());
    for (std::size_t i = 0; i < stories->size(); ++i) {
      auto task = parse_task((*stories)[i], i);
      if (!task) {
        return std::unexpected(task.error());
      }
      doc.tasks.push_back(std::move(*task));
    }
    return ok(std::move(doc));
  } catch (const nlohmann::json::exception& e) {
    log::error("PRD parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace storyloop
