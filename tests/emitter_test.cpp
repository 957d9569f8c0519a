#include "nudge/notify/emitter.hpp"
#include "nudge/notify/event_hub.hpp"

#include "test_utils.hpp"

#include <stdexcept>

#include "gtest/gtest.h"

using namespace nudge;
using namespace nudge::test;

class EmitterTest : public ::testing::Test {
protected:
  auto reminder(std::string text = "hello") -> Notification {
    return Notification{.owner = user_id("u1"),
                        .task = task_id("t1"),
                        .kind = NotificationKind::Reminder,
                        .message = std::move(text),
                        .created_at = kEpoch};
  }

  MemoryStore store_;
  RecordingChannel channel_;
  NotificationEmitter emitter_{store_, channel_};
};

TEST_F(EmitterTest, PersistsThenPublishes) {
  auto result = emitter_.deliver(reminder());

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->id.empty());
  EXPECT_TRUE(result->sent);

  auto stored = store_.notifications();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].id, result->id);
  EXPECT_TRUE(stored[0].sent);

  auto events = channel_.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].name, kNotificationEvent);
  auto payload = nlohmann::json::parse(events[0].payload);
  EXPECT_EQ(payload["id"], result->id.str());
  EXPECT_EQ(payload["type"], "reminder");
  EXPECT_EQ(payload["task"], "t1");
  EXPECT_EQ(payload["message"], "hello");
  EXPECT_EQ(payload["read"], false);
  EXPECT_FALSE(payload.contains("data"));
  EXPECT_EQ(emitter_.delivered(), 1u);
}

TEST_F(EmitterTest, KeepsCallerAssignedId) {
  auto n = reminder();
  n.id = NotificationId{"fixed"};

  auto result = emitter_.deliver(std::move(n));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->id, NotificationId{"fixed"});
}

TEST_F(EmitterTest, ExtraGoesUnderData) {
  auto result = emitter_.deliver(reminder(), {{"total", 3}});

  ASSERT_TRUE(result.has_value());
  auto payload = nlohmann::json::parse(channel_.events().at(0).payload);
  EXPECT_EQ(payload["data"]["total"], 3);
}

TEST_F(EmitterTest, PushFailureKeepsRecord) {
  channel_.closed = true;

  auto result = emitter_.deliver(reminder());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(store_.notifications().size(), 1u);
  EXPECT_TRUE(channel_.events().empty());
  EXPECT_EQ(emitter_.push_failures(), 1u);

  auto listed = store_.list_notifications(user_id("u1"));
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), 1u);
}

TEST_F(EmitterTest, InvalidUtf8MessageStillDelivered) {
  Result<Notification> result;
  EXPECT_NO_THROW(result = emitter_.deliver(reminder("bad \xff title"),
                                            {{"title", "bad \xff title"}}));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(store_.notifications().size(), 1u);
  EXPECT_EQ(store_.notifications()[0].message, "bad \xff title");
  EXPECT_EQ(emitter_.push_failures(), 0u);

  auto events = channel_.events();
  ASSERT_EQ(events.size(), 1u);
  auto payload = nlohmann::json::parse(events[0].payload);
  EXPECT_EQ(payload["message"], "bad \uFFFD title");
  EXPECT_EQ(payload["data"]["title"], "bad \uFFFD title");
}

TEST_F(EmitterTest, PersistFailureSkipsPush) {
  store_.fail_notifications = true;

  auto result = emitter_.deliver(reminder());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DatabaseQueryFailed));
  EXPECT_TRUE(channel_.events().empty());
  EXPECT_EQ(emitter_.delivered(), 0u);
}

TEST_F(EmitterTest, JsonOmitsTaskForAggregates) {
  Notification n{.id = NotificationId{"n1"},
                 .owner = user_id("u1"),
                 .kind = NotificationKind::DailyDigest,
                 .message = "summary",
                 .created_at = kEpoch};

  auto j = notification_to_json(n);

  EXPECT_TRUE(j["task"].is_null());
  EXPECT_EQ(j["type"], "daily_digest");
  EXPECT_EQ(j["created_at"], "2024-01-01T00:00:00Z");
}

class EventHubTest : public ::testing::Test {
protected:
  void SetUp() override { hub_.start(); }

  EventHub hub_;
};

TEST_F(EventHubTest, DeliversOnlyToSubscribersOfThatUser) {
  std::vector<std::string> u1_got;
  std::vector<std::string> u2_got;
  [[maybe_unused]] auto a = hub_.subscribe(
      user_id("u1"),
      [&](std::string_view, const std::string& p) { u1_got.push_back(p); });
  [[maybe_unused]] auto b = hub_.subscribe(
      user_id("u2"),
      [&](std::string_view, const std::string& p) { u2_got.push_back(p); });

  ASSERT_TRUE(hub_.publish(user_id("u1"), "notification", "x").has_value());

  EXPECT_EQ(u1_got, std::vector<std::string>{"x"});
  EXPECT_TRUE(u2_got.empty());
  EXPECT_EQ(hub_.subscriber_count(), 2u);
  EXPECT_EQ(hub_.subscriber_count(user_id("u1")), 1u);
}

TEST_F(EventHubTest, PublishWithoutSubscribersSucceeds) {
  EXPECT_TRUE(hub_.publish(user_id("nobody"), "notification", "{}").has_value());
}

TEST_F(EventHubTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = hub_.subscribe(user_id("u1"),
                           [&](std::string_view, const std::string&) { ++calls; });

  EXPECT_TRUE(hub_.unsubscribe(id));
  EXPECT_FALSE(hub_.unsubscribe(id));
  ASSERT_TRUE(hub_.publish(user_id("u1"), "notification", "{}").has_value());

  EXPECT_EQ(calls, 0);
}

TEST_F(EventHubTest, ClosedHubRejectsPublish) {
  hub_.stop();

  auto result = hub_.publish(user_id("u1"), "notification", "{}");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ChannelClosed));
  EXPECT_FALSE(hub_.is_open());
}

TEST_F(EventHubTest, ThrowingSubscriberDoesNotBlockOthers) {
  int calls = 0;
  [[maybe_unused]] auto a = hub_.subscribe(
      user_id("u1"), [](std::string_view, const std::string&) {
        throw std::runtime_error("client gone");
      });
  [[maybe_unused]] auto b = hub_.subscribe(
      user_id("u1"), [&](std::string_view, const std::string&) { ++calls; });

  EXPECT_TRUE(hub_.publish(user_id("u1"), "notification", "{}").has_value());
  EXPECT_EQ(calls, 1);
}

TEST_F(EventHubTest, EmitterPushesThroughHub) {
  MemoryStore store;
  NotificationEmitter emitter{store, hub_};
  std::vector<std::string> events;
  [[maybe_unused]] auto sub = hub_.subscribe(
      user_id("u1"), [&](std::string_view event, const std::string&) {
        events.emplace_back(event);
      });

  auto result = emitter.deliver(Notification{.owner = user_id("u1"),
                                             .kind = NotificationKind::Overdue,
                                             .message = "late",
                                             .created_at = kEpoch});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(events, std::vector<std::string>{"notification"});
}
