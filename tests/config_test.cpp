#include "nudge/config/config.hpp"

#include <cstdio>
#include <fstream>

#include "gtest/gtest.h"

using namespace nudge;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "nudge.db");
  EXPECT_EQ(config.scheduler.log_level, "info");
  EXPECT_TRUE(config.scheduler.log_file.empty());
  EXPECT_TRUE(config.scheduler.reconcile_on_start);
  EXPECT_EQ(config.sweeps.overdue_cron, "0 20 * * *");
  EXPECT_EQ(config.sweeps.digest_cron, "0 9 * * *");
  EXPECT_EQ(config.sweeps.overdue_preview_limit, 5u);
  EXPECT_EQ(config.sweeps.utc_offset_minutes, 0);
}

TEST(ConfigTest, LoadFromString_FullDocument) {
  auto result = ConfigLoader::load_from_string(R"(
storage:
  db_file: /var/lib/nudge/nudge.db
scheduler:
  log_level: debug
  log_file: /var/log/nudge.log
  reconcile_on_start: false
sweeps:
  overdue_cron: "30 21 * * *"
  digest_cron: "0 8 * * 1-5"
  overdue_preview_limit: 10
  utc_offset_minutes: -300
)");

  ASSERT_TRUE(result.has_value());
  const auto& c = *result;
  EXPECT_EQ(c.storage.db_file, "/var/lib/nudge/nudge.db");
  EXPECT_EQ(c.scheduler.log_level, "debug");
  EXPECT_EQ(c.scheduler.log_file, "/var/log/nudge.log");
  EXPECT_FALSE(c.scheduler.reconcile_on_start);
  EXPECT_EQ(c.sweeps.overdue_cron, "30 21 * * *");
  EXPECT_EQ(c.sweeps.digest_cron, "0 8 * * 1-5");
  EXPECT_EQ(c.sweeps.overdue_preview_limit, 10u);
  EXPECT_EQ(c.sweeps.utc_offset_minutes, -300);
}

TEST(ConfigTest, LoadFromString_PartialKeepsDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
sweeps:
  digest_cron: "0 7 * * *"
)");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->storage.db_file, "nudge.db");
  EXPECT_EQ(result->sweeps.overdue_cron, "0 20 * * *");
  EXPECT_EQ(result->sweeps.digest_cron, "0 7 * * *");
}

TEST(ConfigTest, LoadFromString_InvalidCronRejected) {
  auto result = ConfigLoader::load_from_string(R"(
sweeps:
  overdue_cron: "every evening"
)");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_OffsetOutOfRangeRejected) {
  auto result = ConfigLoader::load_from_string(R"(
sweeps:
  utc_offset_minutes: 100000
)");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, LoadFromString_EmptyIsParseError) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_MalformedYaml) {
  auto result = ConfigLoader::load_from_string("storage: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile_Missing) {
  auto result = ConfigLoader::load_from_file("/nonexistent/nudge.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile_ReadsYaml) {
  std::string path = "/tmp/nudge_config_test.yaml";
  {
    std::ofstream out(path);
    out << "storage:\n  db_file: from_file.db\n";
  }

  auto result = ConfigLoader::load_from_file(path);
  std::remove(path.c_str());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->storage.db_file, "from_file.db");
}

TEST(ConfigTest, ToString_RoundTrips) {
  SystemConfig config;
  config.storage.db_file = "other.db";
  config.scheduler.reconcile_on_start = false;
  config.sweeps.digest_cron = "15 6 * * *";
  config.sweeps.utc_offset_minutes = 60;

  auto text = ConfigLoader::to_string(config);
  auto reloaded = ConfigLoader::load_from_string(text);

  ASSERT_TRUE(reloaded.has_value()) << text;
  EXPECT_EQ(reloaded->storage.db_file, "other.db");
  EXPECT_FALSE(reloaded->scheduler.reconcile_on_start);
  EXPECT_EQ(reloaded->sweeps.digest_cron, "15 6 * * *");
  EXPECT_EQ(reloaded->sweeps.utc_offset_minutes, 60);
}
