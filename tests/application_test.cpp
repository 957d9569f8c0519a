#include "nudge/app/application.hpp"

#include "test_utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>

#include "gtest/gtest.h"

#include <unistd.h>

using namespace nudge;
using namespace nudge::test;
using namespace std::chrono_literals;

class ApplicationTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string tmp_pattern = "/tmp/nudge_app_XXXXXX";
    int fd = ::mkstemp(tmp_pattern.data());
    ASSERT_GE(fd, 0) << "Failed to create temp file: " << std::strerror(errno);
    ::close(fd);
    db_path_ = tmp_pattern + ".db";
    std::filesystem::rename(tmp_pattern, db_path_);

    Config config;
    config.storage.db_file = db_path_;
    app_ = std::make_unique<Application>(config);
    ASSERT_TRUE(app_->start().has_value());

    auto user = app_->save_user(make_user("alice"));
    ASSERT_TRUE(user.has_value());
    alice_ = user->id;
  }

  void TearDown() override {
    app_.reset();
    std::filesystem::remove(db_path_);
    std::filesystem::remove(db_path_ + "-wal");
    std::filesystem::remove(db_path_ + "-shm");
  }

  auto new_task(std::chrono::hours due_in, Priority p = Priority::High)
      -> Task {
    auto due = std::chrono::floor<std::chrono::seconds>(Clock::now()) + due_in;
    auto t = make_task("", alice_.str(), due, p);
    t.title = "write report";
    auto created = app_->create_task(t);
    EXPECT_TRUE(created.has_value());
    return *created;
  }

  auto scheduled(const Task& t) -> bool {
    return app_->scheduler().job(t.id).has_value();
  }

  std::string db_path_;
  std::unique_ptr<Application> app_;
  UserId alice_;
};

TEST_F(ApplicationTest, StartArmsRecurringSweeps) {
  EXPECT_TRUE(app_->is_running());
  const auto& registry = app_->scheduler().registry();
  EXPECT_TRUE(registry.find(jobs::kOverdueCheck).has_value());
  EXPECT_TRUE(registry.find(jobs::kDigest).has_value());
}

TEST_F(ApplicationTest, CreateTaskSchedulesReminder) {
  auto task = new_task(48h);

  EXPECT_FALSE(task.id.empty());
  EXPECT_EQ(task.status, TaskStatus::Pending);
  EXPECT_TRUE(scheduled(task));

  auto entry = app_->scheduler().job(task.id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->fire_at, task.due_at - 2h);
}

TEST_F(ApplicationTest, CreateTaskRejectsUnknownOwner) {
  auto t = make_task("", "nobody", Clock::now() + 48h);
  auto r = app_->create_task(t);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(ApplicationTest, CreateTaskRejectsEmptyTitle) {
  auto t = make_task("", alice_.str(), Clock::now() + 48h);
  t.title.clear();
  auto r = app_->create_task(t);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(ApplicationTest, LowPriorityTaskIsNotScheduled) {
  auto task = new_task(48h, Priority::Low);
  EXPECT_FALSE(scheduled(task));
}

TEST_F(ApplicationTest, UpdateTaskReschedules) {
  auto task = new_task(48h);

  task.due_at = task.due_at + 24h;
  auto updated = app_->update_task(task);
  ASSERT_TRUE(updated.has_value());

  auto entry = app_->scheduler().job(task.id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->fire_at, task.due_at - 2h);
}

TEST_F(ApplicationTest, UpdateTaskKeepsOwnerAndCreationTime) {
  auto task = new_task(48h);

  auto edit = task;
  edit.owner = UserId{"mallory"};
  edit.created_at = kEpoch;
  auto updated = app_->update_task(edit);

  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->owner, alice_);
  EXPECT_EQ(to_millis(updated->created_at), to_millis(task.created_at));
}

TEST_F(ApplicationTest, CompletingByUpdateCancelsReminder) {
  auto task = new_task(48h);

  task.status = TaskStatus::Completed;
  auto updated = app_->update_task(task);

  ASSERT_TRUE(updated.has_value());
  EXPECT_TRUE(updated->completed_at.has_value());
  EXPECT_FALSE(scheduled(task));
}

TEST_F(ApplicationTest, CompleteTaskCancelsReminder) {
  auto task = new_task(48h);

  ASSERT_TRUE(app_->complete_task(task.id).has_value());
  EXPECT_FALSE(scheduled(task));

  auto stored = app_->store().get_task(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Completed);
  EXPECT_TRUE(stored->completed_at.has_value());
}

TEST_F(ApplicationTest, CompleteUnknownTask) {
  auto r = app_->complete_task(TaskId{"missing"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(ApplicationTest, DeleteTaskCancelsReminder) {
  auto task = new_task(48h);

  ASSERT_TRUE(app_->delete_task(task.id).has_value());
  EXPECT_FALSE(scheduled(task));
  EXPECT_FALSE(app_->store().get_task(task.id).has_value());
}

TEST_F(ApplicationTest, DisablingNotificationsClearsReminders) {
  auto a = new_task(48h);
  auto b = new_task(72h);

  NotificationSettings off;
  off.enabled = false;
  ASSERT_TRUE(app_->update_notification_settings(alice_, off).has_value());

  EXPECT_FALSE(scheduled(a));
  EXPECT_FALSE(scheduled(b));
}

TEST_F(ApplicationTest, LeadHoursChangeReschedules) {
  auto task = new_task(48h);

  NotificationSettings settings;
  settings.reminder_lead_hours = 12;
  ASSERT_TRUE(app_->update_notification_settings(alice_, settings).has_value());

  auto entry = app_->scheduler().job(task.id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->fire_at, task.due_at - 12h);
}

TEST_F(ApplicationTest, InvalidSettingsRejected) {
  NotificationSettings bad;
  bad.reminder_lead_hours = 0;
  auto r = app_->update_notification_settings(alice_, bad);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));

  bad.reminder_lead_hours = 25;
  EXPECT_FALSE(app_->save_user(make_user("bob", bad)).has_value());
}

TEST_F(ApplicationTest, SaveUserWithChangedSettingsReconciles) {
  auto task = new_task(48h);

  auto user = app_->store().get_user(alice_);
  ASSERT_TRUE(user.has_value());
  user->settings.priorities = {Priority::Low};
  ASSERT_TRUE(app_->save_user(*user).has_value());

  EXPECT_FALSE(scheduled(task));
}

TEST_F(ApplicationTest, OverdueSweepNotifiesAndMarksRead) {
  auto t = make_task("", alice_.str(), Clock::now() - 2h);
  t.title = "late";
  ASSERT_TRUE(app_->create_task(t).has_value());

  auto report = app_->run_overdue_sweep();
  EXPECT_EQ(report.tasks_marked, 1u);
  EXPECT_EQ(report.notifications_emitted, 1u);

  auto list = app_->notifications(alice_);
  ASSERT_TRUE(list.has_value());
  ASSERT_EQ(list->size(), 1u);
  EXPECT_EQ(list->front().kind, NotificationKind::Overdue);
  EXPECT_TRUE(list->front().sent);
  EXPECT_FALSE(list->front().read);

  ASSERT_TRUE(app_->mark_read(alice_, list->front().id).has_value());
  auto again = app_->notifications(alice_);
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(again->front().read);

  auto none = app_->mark_all_read(alice_);
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(*none, 0u);
}

TEST_F(ApplicationTest, MarkReadOfOtherUsersNotification) {
  auto t = make_task("", alice_.str(), Clock::now() - 2h);
  t.title = "late";
  ASSERT_TRUE(app_->create_task(t).has_value());
  app_->run_overdue_sweep();

  ASSERT_TRUE(app_->save_user(make_user("bob")).has_value());
  auto list = app_->notifications(alice_);
  ASSERT_TRUE(list.has_value());
  ASSERT_FALSE(list->empty());

  auto r = app_->mark_read(UserId{"bob"}, list->front().id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(ApplicationTest, DigestSweepCountsOutstanding) {
  new_task(48h);
  new_task(72h, Priority::Low);

  auto report = app_->run_digest_sweep();
  EXPECT_EQ(report.users_scanned, 1u);
  EXPECT_EQ(report.notifications_emitted, 1u);

  auto list = app_->notifications(alice_);
  ASSERT_TRUE(list.has_value());
  ASSERT_EQ(list->size(), 1u);
  EXPECT_EQ(list->front().kind, NotificationKind::DailyDigest);
}

TEST_F(ApplicationTest, PushReachesSubscriber) {
  std::vector<std::string> events;
  auto sub = app_->hub().subscribe(
      alice_, [&](std::string_view event, const std::string&) {
        events.emplace_back(event);
      });

  auto t = make_task("", alice_.str(), Clock::now() - 2h);
  t.title = "late";
  ASSERT_TRUE(app_->create_task(t).has_value());
  app_->run_overdue_sweep();

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events.front(), kNotificationEvent);
  app_->hub().unsubscribe(sub);
}

TEST_F(ApplicationTest, StopCancelsEveryJob) {
  new_task(48h);
  new_task(72h);
  ASSERT_GT(app_->scheduler().registry().size(), 0u);

  app_->stop();
  EXPECT_FALSE(app_->is_running());
  EXPECT_EQ(app_->scheduler().registry().size(), 0u);
}

TEST_F(ApplicationTest, RestartReconcilesStoredTasks) {
  auto task = new_task(48h);
  app_->stop();
  EXPECT_FALSE(scheduled(task));

  ASSERT_TRUE(app_->start().has_value());
  EXPECT_TRUE(scheduled(task));
}
