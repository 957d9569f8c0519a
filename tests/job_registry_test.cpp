#include "nudge/scheduler/job_registry.hpp"

#include "test_utils.hpp"

#include <algorithm>

#include "gtest/gtest.h"

using namespace nudge;
using namespace nudge::test;

class JobRegistryTest : public ::testing::Test {
protected:
  auto arm(TimePoint when) -> JobEntry {
    return JobEntry{timer_.at(when, [] {}), when};
  }

  ManualTimer timer_;
  JobRegistry registry_{timer_};
};

TEST_F(JobRegistryTest, CommitInstallsEntry) {
  auto ticket = registry_.begin("t1");
  auto entry = arm(kEpoch + 1h);

  EXPECT_TRUE(registry_.commit("t1", ticket, entry));

  auto found = registry_.find("t1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->handle, entry.handle);
  EXPECT_EQ(found->fire_at, kEpoch + 1h);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(JobRegistryTest, CommitReplacesAndCancelsPrevious) {
  auto first = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), first));

  auto second = arm(kEpoch + 2h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), second));

  EXPECT_FALSE(timer_.is_armed(first.handle));
  EXPECT_TRUE(timer_.is_armed(second.handle));
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(registry_.find("t1")->handle, second.handle);
}

TEST_F(JobRegistryTest, StaleTicketIsRejectedAndItsTimerCancelled) {
  auto older = registry_.begin("t1");
  auto newer = registry_.begin("t1");

  auto winner = arm(kEpoch + 2h);
  ASSERT_TRUE(registry_.commit("t1", newer, winner));

  auto loser = arm(kEpoch + 1h);
  EXPECT_FALSE(registry_.commit("t1", older, loser));

  EXPECT_FALSE(timer_.is_armed(loser.handle));
  EXPECT_TRUE(timer_.is_armed(winner.handle));
  EXPECT_EQ(registry_.find("t1")->handle, winner.handle);
}

TEST_F(JobRegistryTest, CancelIsIdempotent) {
  auto entry = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), entry));

  EXPECT_TRUE(registry_.cancel("t1"));
  EXPECT_FALSE(registry_.cancel("t1"));
  EXPECT_FALSE(registry_.cancel("never-scheduled"));

  EXPECT_FALSE(registry_.find("t1").has_value());
  EXPECT_EQ(registry_.size(), 0u);
  EXPECT_FALSE(timer_.is_armed(entry.handle));
}

TEST_F(JobRegistryTest, CancelInvalidatesInFlightTicket) {
  auto ticket = registry_.begin("t1");
  registry_.cancel("t1");

  auto entry = arm(kEpoch + 1h);
  EXPECT_FALSE(registry_.commit("t1", ticket, entry));
  EXPECT_FALSE(timer_.is_armed(entry.handle));
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(JobRegistryTest, ClearRemovesEntry) {
  auto entry = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), entry));

  EXPECT_TRUE(registry_.clear("t1", registry_.begin("t1")));
  EXPECT_FALSE(registry_.find("t1").has_value());
  EXPECT_FALSE(timer_.is_armed(entry.handle));
}

TEST_F(JobRegistryTest, ClearWithStaleTicketIsNoOp) {
  auto older = registry_.begin("t1");
  auto newer = registry_.begin("t1");
  auto entry = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", newer, entry));

  EXPECT_FALSE(registry_.clear("t1", older));
  EXPECT_TRUE(registry_.find("t1").has_value());
}

TEST_F(JobRegistryTest, ReleaseOnlyByCurrentHolder) {
  auto old_entry = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), old_entry));
  auto new_entry = arm(kEpoch + 2h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), new_entry));

  EXPECT_FALSE(registry_.release("t1", old_entry.handle));
  EXPECT_TRUE(registry_.holds("t1", new_entry.handle));

  EXPECT_TRUE(registry_.release("t1", new_entry.handle));
  EXPECT_FALSE(registry_.find("t1").has_value());
  // Released, not cancelled: the timer still owns the firing.
  EXPECT_TRUE(timer_.is_armed(new_entry.handle));
}

TEST_F(JobRegistryTest, ReleaseDuringPassKeepsTicketValid) {
  auto entry = arm(kEpoch + 1h);
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), entry));

  auto ticket = registry_.begin("t1");
  ASSERT_TRUE(registry_.release("t1", entry.handle));

  auto next = arm(kEpoch + 3h);
  EXPECT_TRUE(registry_.commit("t1", ticket, next));
  EXPECT_EQ(registry_.find("t1")->handle, next.handle);
}

TEST_F(JobRegistryTest, ReplaceIsUnconditional) {
  auto first = arm(kEpoch + 1h);
  registry_.replace("digest", first);
  auto second = arm(kEpoch + 2h);
  registry_.replace("digest", second);

  EXPECT_FALSE(timer_.is_armed(first.handle));
  EXPECT_EQ(registry_.find("digest")->handle, second.handle);
}

TEST_F(JobRegistryTest, KeysAndCancelAll) {
  ASSERT_TRUE(registry_.commit("t1", registry_.begin("t1"), arm(kEpoch + 1h)));
  ASSERT_TRUE(registry_.commit("t2", registry_.begin("t2"), arm(kEpoch + 2h)));
  registry_.replace("overdueCheck", arm(kEpoch + 3h));
  // A pass that never committed holds no job.
  [[maybe_unused]] auto open = registry_.begin("t3");

  auto keys = registry_.keys();
  std::ranges::sort(keys);
  EXPECT_EQ(keys, (std::vector<std::string>{"overdueCheck", "t1", "t2"}));
  EXPECT_EQ(registry_.size(), 3u);

  registry_.cancel_all();
  EXPECT_EQ(registry_.size(), 0u);
  EXPECT_EQ(timer_.pending(), 0u);
}
