#include "storyloop/events/event_bus.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace storyloop;
using namespace std::chrono_literals;

class EventBusTest : public ::testing::Test {
protected:
  EventBus bus_{EventBusOptions{.history_capacity = 1000, .dispatcher_threads = 2}};
};

TEST_F(EventBusTest, Emit_WaitMode_RunsHandlersByDescendingPriority) {
  std::vector<std::string> order;
  bus_.subscribe("story.completed", [&](const Event&) { order.push_back("low"); },
                 EventPriority::Low);
  bus_.subscribe("story.completed",
                 [&](const Event&) { order.push_back("critical"); },
                 EventPriority::Critical);
  bus_.subscribe("story.completed",
                 [&](const Event&) { order.push_back("normal"); });

  bus_.emit("story.completed");

  EXPECT_EQ(order, (std::vector<std::string>{"critical", "normal", "low"}));
}

TEST_F(EventBusTest, EqualPriority_KeepsRegistrationOrder) {
  std::vector<int> order;
  for (int i = 0; i < 4; ++i) {
    bus_.subscribe("x", [&order, i](const Event&) { order.push_back(i); });
  }

  bus_.emit("x");

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(EventBusTest, GlobPatterns) {
  int story = 0;
  int all = 0;
  int exact = 0;
  bus_.subscribe("story.*", [&](const Event&) { ++story; });
  bus_.subscribe("*", [&](const Event&) { ++all; });
  bus_.subscribe("story.failed", [&](const Event&) { ++exact; });

  bus_.emit("story.failed");
  bus_.emit("story.merged");
  bus_.emit("batch.started");

  EXPECT_EQ(story, 2);
  EXPECT_EQ(all, 3);
  EXPECT_EQ(exact, 1);
}

TEST_F(EventBusTest, HandlerException_IsIsolated) {
  bool later_ran = false;
  bus_.subscribe("boom", [](const Event&) { throw std::runtime_error("bad"); },
                 EventPriority::High);
  bus_.subscribe("boom", [&](const Event&) { later_ran = true; });

  EXPECT_NO_THROW(bus_.emit("boom"));

  EXPECT_TRUE(later_ran);
  EXPECT_EQ(bus_.stats().handler_errors, 1u);
}

TEST_F(EventBusTest, Filter_SkipsNonMatchingEvents) {
  int seen = 0;
  bus_.subscribe(
      "story.*", [&](const Event&) { ++seen; }, EventPriority::Normal,
      [](const Event& e) { return e.data.value("attempt", 0) > 1; });

  bus_.emit("story.failed", {{"attempt", 1}});
  bus_.emit("story.failed", {{"attempt", 2}});

  EXPECT_EQ(seen, 1);
}

TEST_F(EventBusTest, Unsubscribe_StopsDelivery) {
  int seen = 0;
  auto id = bus_.subscribe("x", [&](const Event&) { ++seen; });

  bus_.emit("x");
  EXPECT_TRUE(bus_.unsubscribe(id));
  bus_.emit("x");

  EXPECT_EQ(seen, 1);
  EXPECT_FALSE(bus_.unsubscribe(id));
}

TEST_F(EventBusTest, FireAndForget_DeliveredOnDispatcher) {
  std::atomic<int> seen{0};
  bus_.subscribe("async", [&](const Event&) { seen.fetch_add(1); });

  for (int i = 0; i < 20; ++i) {
    bus_.emit("async", {{"i", i}}, {}, DispatchMode::FireAndForget);
  }
  bus_.wait_idle();

  EXPECT_EQ(seen.load(), 20);
}

TEST_F(EventBusTest, History_MostRecentFirstAndFilteredByType) {
  bus_.emit("a", {{"n", 1}});
  bus_.emit("b", {{"n", 2}});
  bus_.emit("a", {{"n", 3}});

  auto all = bus_.history();
  auto only_a = bus_.history("a");
  auto limited = bus_.history(std::nullopt, 1);

  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all.front().data["n"], 3);
  ASSERT_EQ(only_a.size(), 2u);
  EXPECT_EQ(only_a.back().data["n"], 1);
  ASSERT_EQ(limited.size(), 1u);
}

TEST(EventBusHistoryTest, RingBuffer_DropsOldest) {
  EventBus bus(EventBusOptions{.history_capacity = 3, .dispatcher_threads = 0});
  for (int i = 0; i < 5; ++i) {
    bus.emit("tick", {{"i", i}});
  }

  auto history = bus.history();

  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.front().data["i"], 4);
  EXPECT_EQ(history.back().data["i"], 2);
  EXPECT_EQ(bus.stats().total_events, 5u);
}

TEST_F(EventBusTest, Stats_CountsByType) {
  bus_.subscribe("*", [](const Event&) {});
  bus_.emit("a");
  bus_.emit("a");
  bus_.emit("b");

  auto stats = bus_.stats();

  EXPECT_EQ(stats.total_events, 3u);
  EXPECT_EQ(stats.by_type.at("a"), 2u);
  EXPECT_EQ(stats.handlers, 1u);

  bus_.reset_stats();
  bus_.clear_history();
  EXPECT_EQ(bus_.stats().total_events, 0u);
  EXPECT_TRUE(bus_.history().empty());
}

TEST_F(EventBusTest, Event_CarriesCorrelationIds) {
  auto event = bus_.emit("story.started", {},
                         CorrelationIds{RunId{"run_1"}, TaskId{"US-001"}});

  auto j = event.to_json();

  EXPECT_EQ(j["type"], "story.started");
  EXPECT_EQ(j["source"], "storyloop");
  EXPECT_EQ(j["run_id"], "run_1");
  EXPECT_EQ(j["story_id"], "US-001");
}

TEST_F(EventBusTest, Subscriptions_ListsMatchingHandlers) {
  bus_.subscribe("story.*", [](const Event&) {}, EventPriority::High, {},
                 "merge-queue");
  bus_.subscribe("batch.*", [](const Event&) {});

  auto subs = bus_.subscriptions("story.completed");

  ASSERT_EQ(subs.size(), 1u);
  EXPECT_EQ(subs.front().name, "merge-queue");
  EXPECT_EQ(subs.front().priority, 75);
}
