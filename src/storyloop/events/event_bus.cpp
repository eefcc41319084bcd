#include "storyloop/events/event_bus.hpp"

#include "storyloop/util/log.hpp"

#include <algorithm>
#include <format>

#include <fnmatch.h>

namespace storyloop {

auto Event::to_json() const -> nlohmann::json {
  nlohmann::json j{
      {"type", type},
      {"data", data},
      {"timestamp", format_timestamp(timestamp)},
      {"source", source},
  };
  if (ids.run_id) {
    j["run_id"] = ids.run_id->str();
  }
  if (ids.task_id) {
    j["story_id"] = ids.task_id->str();
  }
  return j;
}

auto EventStats::to_json() const -> nlohmann::json {
  auto types = nlohmann::json::object();
  for (const auto& [type, count] : by_type) {
    types[type] = count;
  }
  return {
      {"total_events", total_events},
      {"by_type", std::move(types)},
      {"handlers", handlers},
      {"history_size", history_size},
      {"handler_errors", handler_errors},
  };
}

EventBus::EventBus(EventBusOptions options) : options_(options) {
  if (options_.history_capacity == 0) {
    options_.history_capacity = 1;
  }
  for (int i = 0; i < options_.dispatcher_threads; ++i) {
    dispatchers_.emplace_back([this] { dispatcher_loop(); });
  }
}

EventBus::~EventBus() {
  {
    std::lock_guard lock(queue_mu_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  for (auto& t : dispatchers_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

auto EventBus::matches(std::string_view pattern, std::string_view type)
    -> bool {
  if (pattern == "*") {
    return true;
  }
  std::string p{pattern};
  std::string t{type};
  return ::fnmatch(p.c_str(), t.c_str(), 0) == 0;
}

auto EventBus::subscribe(std::string pattern, EventHandler handler,
                         int priority, EventFilter filter, std::string name)
    -> SubscriptionId {
  std::unique_lock lock(registry_mu_);
  auto id = next_id_++;
  if (name.empty()) {
    name = std::format("handler_{}", id);
  }
  auto reg = std::make_shared<const Registration>(
      Registration{id, std::move(name), std::move(pattern), priority,
                   std::move(handler), std::move(filter)});

  // First entry with strictly lower priority: equal priorities keep
  // registration order.
  auto pos = std::ranges::find_if(registry_, [priority](const auto& r) {
    return r->priority < priority;
  });
  log::debug("Subscribed {} to '{}' (priority {})", reg->name, reg->pattern,
             priority);
  registry_.insert(pos, std::move(reg));
  return id;
}

auto EventBus::unsubscribe(SubscriptionId id) -> bool {
  std::unique_lock lock(registry_mu_);
  auto it = std::ranges::find_if(registry_,
                                 [id](const auto& r) { return r->id == id; });
  if (it == registry_.end()) {
    return false;
  }
  registry_.erase(it);
  return true;
}

auto EventBus::matching(const Event& event) const
    -> std::vector<std::shared_ptr<const Registration>> {
  std::shared_lock lock(registry_mu_);
  std::vector<std::shared_ptr<const Registration>> result;
  for (const auto& reg : registry_) {
    if (matches(reg->pattern, event.type)) {
      result.push_back(reg);
    }
  }
  return result;
}

auto EventBus::make_delivery(std::shared_ptr<const Registration> reg,
                             std::shared_ptr<const Event> event) -> Delivery {
  return Delivery([this, reg = std::move(reg), event = std::move(event)] {
    try {
      if (reg->filter && !reg->filter(*event)) {
        return;
      }
      reg->handler(*event);
    } catch (const std::exception& e) {
      handler_errors_.fetch_add(1, std::memory_order_relaxed);
      log::error("Event handler {} failed on {}: {}", reg->name, event->type,
                 e.what());
    } catch (...) {
      handler_errors_.fetch_add(1, std::memory_order_relaxed);
      log::error("Event handler {} failed on {}: non-standard exception",
                 reg->name, event->type);
    }
  });
}

auto EventBus::emit(std::string type, nlohmann::json data, CorrelationIds ids,
                    DispatchMode mode) -> Event {
  auto event = std::make_shared<Event>();
  event->type = std::move(type);
  event->data = std::move(data);
  event->timestamp = Clock::now();
  event->ids = std::move(ids);

  {
    std::lock_guard lock(history_mu_);
    history_.push_back(*event);
    while (history_.size() > options_.history_capacity) {
      history_.pop_front();
    }
    ++total_events_;
    auto it = by_type_.find(event->type);
    if (it == by_type_.end()) {
      by_type_.emplace(event->type, 1);
    } else {
      ++it->second;
    }
  }

  std::shared_ptr<const Event> shared = event;
  auto targets = matching(*shared);

  if (mode == DispatchMode::FireAndForget && !dispatchers_.empty()) {
    for (auto& reg : targets) {
      enqueue(make_delivery(std::move(reg), shared));
    }
  } else {
    // Synchronous handlers are deliveries that complete immediately.
    for (auto& reg : targets) {
      auto delivery = make_delivery(std::move(reg), shared);
      auto done = delivery.get_future();
      delivery();
      done.wait();
    }
  }
  return *shared;
}

auto EventBus::enqueue(Delivery delivery) -> void {
  {
    std::lock_guard lock(queue_mu_);
    queue_.push_back(std::move(delivery));
  }
  queue_cv_.notify_one();
}

auto EventBus::dispatcher_loop() -> void {
  std::unique_lock lock(queue_mu_);
  while (true) {
    queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      return;  // stopping and drained
    }
    auto delivery = std::move(queue_.front());
    queue_.pop_front();
    ++in_flight_;
    lock.unlock();

    delivery();

    lock.lock();
    --in_flight_;
    if (queue_.empty() && in_flight_ == 0) {
      idle_cv_.notify_all();
    }
  }
}

auto EventBus::wait_idle() -> void {
  std::unique_lock lock(queue_mu_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

auto EventBus::history(std::optional<std::string_view> type,
                       std::size_t limit) const -> std::vector<Event> {
  std::lock_guard lock(history_mu_);
  std::vector<Event> result;
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (result.size() >= limit) {
      break;
    }
    if (type && it->type != *type) {
      continue;
    }
    result.push_back(*it);
  }
  return result;
}

auto EventBus::stats() const -> EventStats {
  EventStats s;
  {
    std::lock_guard lock(history_mu_);
    s.total_events = total_events_;
    s.by_type = by_type_;
    s.history_size = history_.size();
  }
  {
    std::shared_lock lock(registry_mu_);
    s.handlers = registry_.size();
  }
  s.handler_errors = handler_errors_.load(std::memory_order_relaxed);
  return s;
}

auto EventBus::subscriptions(std::optional<std::string_view> type) const
    -> std::vector<SubscriptionInfo> {
  std::shared_lock lock(registry_mu_);
  std::vector<SubscriptionInfo> result;
  for (const auto& reg : registry_) {
    if (type && !matches(reg->pattern, *type)) {
      continue;
    }
    result.push_back({reg->id, reg->name, reg->pattern, reg->priority});
  }
  return result;
}

auto EventBus::clear_history() -> void {
  std::lock_guard lock(history_mu_);
  history_.clear();
}

auto EventBus::reset_stats() -> void {
  std::lock_guard lock(history_mu_);
  total_events_ = 0;
  by_type_.clear();
  handler_errors_.store(0, std::memory_order_relaxed);
}

}  // namespace storyloop
