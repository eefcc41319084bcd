#pragma once

#include "storyloop/util/id.hpp"
#include "storyloop/util/util.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace storyloop {

enum class EventPriority : int {
  Background = 0,
  Low = 25,
  Normal = 50,
  High = 75,
  Critical = 100,
};

struct CorrelationIds {
  std::optional<RunId> run_id;
  std::optional<TaskId> task_id;
};

struct Event {
  std::string type;
  nlohmann::json data = nlohmann::json::object();
  TimePoint timestamp{};
  std::string source{"storyloop"};
  CorrelationIds ids;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

using EventHandler = std::function<void(const Event&)>;
using EventFilter = std::function<bool(const Event&)>;
using SubscriptionId = std::uint64_t;

enum class DispatchMode : std::uint8_t {
  Wait,           // emit() returns after every handler finished
  FireAndForget,  // handlers run on the dispatcher pool
};

struct EventStats {
  std::uint64_t total_events{0};
  std::map<std::string, std::uint64_t, std::less<>> by_type;
  std::size_t handlers{0};
  std::size_t history_size{0};
  std::uint64_t handler_errors{0};

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct SubscriptionInfo {
  SubscriptionId id{0};
  std::string name;
  std::string pattern;
  int priority{0};
};

struct EventBusOptions {
  std::size_t history_capacity{1000};
  int dispatcher_threads{2};
};

// In-process publish/subscribe hub. Handlers match glob patterns
// ("story.*", "*") and run in descending priority order; equal priorities
// keep registration order.
class EventBus {
public:
  explicit EventBus(EventBusOptions options = {});
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  auto subscribe(std::string pattern, EventHandler handler,
                 int priority = std::to_underlying(EventPriority::Normal),
                 EventFilter filter = {}, std::string name = {})
      -> SubscriptionId;
  auto subscribe(std::string pattern, EventHandler handler,
                 EventPriority priority, EventFilter filter = {},
                 std::string name = {}) -> SubscriptionId {
    return subscribe(std::move(pattern), std::move(handler),
                     std::to_underlying(priority), std::move(filter),
                     std::move(name));
  }

  auto unsubscribe(SubscriptionId id) -> bool;

  auto emit(std::string type, nlohmann::json data = nlohmann::json::object(),
            CorrelationIds ids = {}, DispatchMode mode = DispatchMode::Wait)
      -> Event;

  // Most recent first, optionally restricted to one exact type.
  [[nodiscard]] auto history(std::optional<std::string_view> type = std::nullopt,
                             std::size_t limit = 100) const
      -> std::vector<Event>;
  [[nodiscard]] auto stats() const -> EventStats;
  [[nodiscard]] auto subscriptions(
      std::optional<std::string_view> type = std::nullopt) const
      -> std::vector<SubscriptionInfo>;

  auto clear_history() -> void;
  auto reset_stats() -> void;

  // Blocks until every fire-and-forget delivery queued so far has run.
  auto wait_idle() -> void;

  [[nodiscard]] static auto matches(std::string_view pattern,
                                    std::string_view type) -> bool;

private:
  struct Registration {
    SubscriptionId id;
    std::string name;
    std::string pattern;
    int priority;
    EventHandler handler;
    EventFilter filter;
  };

  using Delivery = std::packaged_task<void()>;

  [[nodiscard]] auto matching(const Event& event) const
      -> std::vector<std::shared_ptr<const Registration>>;
  [[nodiscard]] auto make_delivery(std::shared_ptr<const Registration> reg,
                                   std::shared_ptr<const Event> event)
      -> Delivery;
  auto enqueue(Delivery delivery) -> void;
  auto dispatcher_loop() -> void;

  EventBusOptions options_;

  mutable std::shared_mutex registry_mu_;
  std::vector<std::shared_ptr<const Registration>> registry_;
  SubscriptionId next_id_{1};

  mutable std::mutex history_mu_;
  std::deque<Event> history_;
  std::uint64_t total_events_{0};
  std::map<std::string, std::uint64_t, std::less<>> by_type_;
  std::atomic<std::uint64_t> handler_errors_{0};

  std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<Delivery> queue_;
  std::size_t in_flight_{0};
  bool stopping_{false};
  std::vector<std::thread> dispatchers_;
};

}  // namespace storyloop
