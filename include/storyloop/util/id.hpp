#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace storyloop {

// Story ids come from the PRD, worker ids name one attempt of one story and
// run ids name one orchestrator invocation. The tag keeps them apart.
template <typename Tag>
class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  [[nodiscard]] auto str() const noexcept -> const std::string& {
    return value_;
  }
  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  friend auto operator<=>(const TypedId&, const TypedId&) = default;
  friend auto operator==(const TypedId&, const TypedId&) -> bool = default;

  friend auto operator<<(std::ostream& os, const TypedId& id) -> std::ostream& {
    return os << id.value_;
  }

private:
  std::string value_;
};

using TaskId = TypedId<struct TaskTag>;
using WorkerId = TypedId<struct WorkerTag>;
using RunId = TypedId<struct RunTag>;

// `<task>-a<attempt>`, attempts counted from 1.
[[nodiscard]] inline auto make_worker_id(const TaskId& task, int attempt)
    -> WorkerId {
  return WorkerId{std::format("{}-a{}", task.value(), attempt)};
}

// `run_` followed by 8 random hex digits.
[[nodiscard]] inline auto generate_run_id() -> RunId {
  thread_local std::mt19937 rng{std::random_device{}()};
  return RunId{std::format("run_{:08x}", static_cast<std::uint32_t>(rng()))};
}

}  // namespace storyloop

template <typename Tag>
struct std::hash<storyloop::TypedId<Tag>> {
  auto operator()(const storyloop::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<storyloop::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const storyloop::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
