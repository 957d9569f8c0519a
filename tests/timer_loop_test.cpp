#include "nudge/scheduler/timer_loop.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace nudge;
using namespace std::chrono_literals;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kWaitLimit = std::chrono::seconds(2);

template <typename Pred>
auto wait_until(Pred pred) -> bool {
  auto deadline = std::chrono::steady_clock::now() + kWaitLimit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(kPollInterval);
  }
  return pred();
}

}  // namespace

class TimerLoopTest : public ::testing::Test {
protected:
  void SetUp() override { loop_.start(); }
  void TearDown() override { loop_.stop(); }

  TimerLoop loop_;
};

TEST_F(TimerLoopTest, StartStop) {
  EXPECT_TRUE(loop_.is_running());
  loop_.stop();
  EXPECT_FALSE(loop_.is_running());
}

TEST_F(TimerLoopTest, OneShotFires) {
  std::promise<void> fired;
  auto handle = loop_.at(loop_.now() + 30ms, [&] { fired.set_value(); });

  EXPECT_TRUE(static_cast<bool>(handle));
  EXPECT_EQ(fired.get_future().wait_for(kWaitLimit), std::future_status::ready);
  EXPECT_FALSE(loop_.cancel(handle));
}

TEST_F(TimerLoopTest, PastTimeFiresOnNextTurn) {
  std::promise<void> fired;
  [[maybe_unused]] auto handle =
      loop_.at(loop_.now() - 1h, [&] { fired.set_value(); });

  EXPECT_EQ(fired.get_future().wait_for(kWaitLimit), std::future_status::ready);
}

TEST_F(TimerLoopTest, CancelledTimerNeverFires) {
  std::atomic<int> calls{0};
  auto handle = loop_.at(loop_.now() + 100ms, [&] { ++calls; });

  EXPECT_TRUE(loop_.cancel(handle));
  EXPECT_FALSE(loop_.cancel(handle));

  std::this_thread::sleep_for(250ms);
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(TimerLoopTest, ReservedHandleCancelledBeforeArmNeverFires) {
  std::atomic<int> calls{0};
  auto handle = loop_.reserve();
  EXPECT_TRUE(static_cast<bool>(handle));

  EXPECT_TRUE(loop_.cancel(handle));
  loop_.arm(handle, loop_.now() - 1h, [&] { ++calls; });

  std::this_thread::sleep_for(250ms);
  EXPECT_EQ(calls.load(), 0);
  EXPECT_FALSE(loop_.cancel(handle));
}

TEST_F(TimerLoopTest, ReservedHandleFiresOnceArmed) {
  std::promise<void> fired;
  auto handle = loop_.reserve();
  loop_.arm(handle, loop_.now() + 20ms, [&] { fired.set_value(); });

  EXPECT_EQ(fired.get_future().wait_for(kWaitLimit), std::future_status::ready);
}

TEST_F(TimerLoopTest, CancelUnknownHandle) {
  EXPECT_FALSE(loop_.cancel(TimerHandle{424242}));
}

TEST_F(TimerLoopTest, FiresInTimeOrder) {
  std::mutex mu;
  std::vector<int> order;
  auto now = loop_.now();
  [[maybe_unused]] auto c = loop_.at(now + 60ms, [&] {
    std::lock_guard lock(mu);
    order.push_back(3);
  });
  [[maybe_unused]] auto a = loop_.at(now + 20ms, [&] {
    std::lock_guard lock(mu);
    order.push_back(1);
  });
  [[maybe_unused]] auto b = loop_.at(now + 40ms, [&] {
    std::lock_guard lock(mu);
    order.push_back(2);
  });

  ASSERT_TRUE(wait_until([&] {
    std::lock_guard lock(mu);
    return order.size() == 3;
  }));
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(TimerLoopTest, ThrowingCallbackDoesNotStopLoop) {
  [[maybe_unused]] auto bad = loop_.at(loop_.now() + 10ms, [] {
    throw std::runtime_error("boom");
  });
  std::promise<void> fired;
  [[maybe_unused]] auto good =
      loop_.at(loop_.now() + 50ms, [&] { fired.set_value(); });

  EXPECT_EQ(fired.get_future().wait_for(kWaitLimit), std::future_status::ready);
  EXPECT_TRUE(loop_.is_running());
}

TEST_F(TimerLoopTest, RecurringTimerIsArmedUntilCancelled) {
  auto cron = CronExpr::parse("0 0 1 1 *");
  ASSERT_TRUE(cron.has_value());

  auto handle = loop_.every(*cron, [] {});
  ASSERT_TRUE(wait_until([&] { return loop_.armed() == 1; }));

  EXPECT_TRUE(loop_.cancel(handle));
  EXPECT_TRUE(wait_until([&] { return loop_.armed() == 0; }));
}

TEST_F(TimerLoopTest, CallbackMayArmAnotherTimer) {
  std::promise<void> second;
  [[maybe_unused]] auto first = loop_.at(loop_.now() + 10ms, [&] {
    [[maybe_unused]] auto next =
        loop_.at(loop_.now() + 10ms, [&] { second.set_value(); });
  });

  EXPECT_EQ(second.get_future().wait_for(kWaitLimit),
            std::future_status::ready);
}
