// Hotspot headers
#include "core/AsyncBridge.hpp"
#include "core/Errors.hpp"

// Hotspot fakes
#include "FakeClock.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using hotspot::core::AsyncBridge;
using hotspot::core::RetryBudget;
using hotspot::test::FakeClock;

TEST(async_bridge, await_returns_value_of_completed_operation) {
  std::promise<int> p;
  p.set_value(42);
  EXPECT_EQ(AsyncBridge::await(p.get_future(), "answer"), 42);
}

TEST(async_bridge, await_blocks_until_worker_finishes) {
  auto op = std::async(std::launch::async, [] {
    std::this_thread::sleep_for(20ms);
    return std::string("done");
  });
  EXPECT_EQ(AsyncBridge::await(std::move(op), "slow op"), "done");
}

TEST(async_bridge, await_without_operation_throws_bridge_unavailable) {
  std::future<int> none;
  try {
    AsyncBridge::await(std::move(none), "radio enumeration");
    FAIL() << "expected AsyncBridgeUnavailable";
  } catch (const hotspot::core::AsyncBridgeUnavailable& e) {
    EXPECT_EQ(e.kind(), hotspot::core::ErrorKind::AsyncBridgeUnavailable);
    EXPECT_NE(std::string(e.what()).find("radio enumeration"), std::string::npos);
  }
}

TEST(async_bridge, await_rethrows_operation_failure) {
  std::promise<int> p;
  p.set_exception(std::make_exception_ptr(std::runtime_error("device gone")));
  EXPECT_THROW(AsyncBridge::await(p.get_future(), "op"), std::runtime_error);
}

TEST(async_bridge, poll_until_stops_at_first_hit) {
  FakeClock clock;
  int probes = 0;
  std::vector<int> misses;

  const std::function<std::optional<int>()> probe = [&]() -> std::optional<int> {
    return ++probes == 3 ? std::optional<int>(7) : std::nullopt;
  };
  auto value = AsyncBridge::pollUntil(probe, RetryBudget{ 5, 1s }, clock,
                                      [&](int attempt) { misses.push_back(attempt); });

  ASSERT_TRUE(value);
  EXPECT_EQ(*value, 7);
  EXPECT_EQ(probes, 3);
  EXPECT_EQ(misses, (std::vector<int>{ 1, 2 }));
  EXPECT_EQ(clock.sleeps.size(), 2u);
  EXPECT_EQ(clock.elapsed(), 2s);
}

TEST(async_bridge, poll_until_respects_budget_and_never_sleeps_after_last_attempt) {
  FakeClock clock;
  int probes = 0;
  const std::function<std::optional<int>()> probe = [&]() -> std::optional<int> {
    ++probes;
    return std::nullopt;
  };

  auto value = AsyncBridge::pollUntil(probe, RetryBudget{ 12, 5s }, clock);

  EXPECT_FALSE(value);
  EXPECT_EQ(probes, 12);
  EXPECT_EQ(clock.sleeps.size(), 11u);
  EXPECT_EQ(clock.elapsed(), 55s);
}

TEST(retry_budget, ceiling_is_sleep_time_between_attempts) {
  EXPECT_EQ((RetryBudget{ 12, 5s }.ceiling()), 55s);
  EXPECT_EQ((RetryBudget{ 1, 5s }.ceiling()), 0ms);
}
