#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/notification_manager.hpp"
#include "io/notify/file_notifier.hpp"
#include "io/notify/http_notifier.hpp"
#include "nlohmann/json.hpp"
#include "test_fakes.hpp"

class NotifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_file_path_ = "/tmp/test_neo_watch_notifications.jsonl";
    std::filesystem::remove(test_file_path_);
  }

  void TearDown() override { std::filesystem::remove(test_file_path_); }

  std::vector<nlohmann::json> read_lines() {
    std::vector<nlohmann::json> lines;
    std::ifstream in(test_file_path_);
    std::string line;
    while (std::getline(in, line))
      if (!line.empty())
        lines.push_back(nlohmann::json::parse(line));
    return lines;
  }

  std::string test_file_path_;
};

// =================================================================================
// FileNotifier
// =================================================================================

TEST_F(NotifierTest, FileNotifierTypeIdentification) {
  FileNotifier notifier(test_file_path_);
  EXPECT_EQ(notifier.get_notifier_type(), "file");
  EXPECT_STREQ(notifier.get_name(), "FileNotifier");
  EXPECT_TRUE(notifier.is_open());
}

TEST_F(NotifierTest, FileNotifierAppendsOneJsonLinePerNotification) {
  {
    FileNotifier notifier(test_file_path_);
    EXPECT_TRUE(notifier.notify("user-1", "first", "line one\nline two"));
    EXPECT_TRUE(notifier.notify("user-2", "second", "body"));
  }

  auto lines = read_lines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0]["user_id"], "user-1");
  EXPECT_EQ(lines[0]["subject"], "first");
  EXPECT_EQ(lines[0]["body"], "line one\nline two");
  EXPECT_TRUE(lines[0]["timestamp_ms"].is_number_unsigned());
  EXPECT_EQ(lines[1]["user_id"], "user-2");
}

TEST_F(NotifierTest, FileNotifierKeepsExistingContent) {
  FileNotifier(test_file_path_).notify("a", "s", "b");
  FileNotifier(test_file_path_).notify("c", "s", "b");
  EXPECT_EQ(read_lines().size(), 2u);
}

TEST_F(NotifierTest, FileNotifierWithoutPathFails) {
  FileNotifier notifier("");
  EXPECT_FALSE(notifier.is_open());
  EXPECT_FALSE(notifier.notify("user", "subject", "body"));
}

// =================================================================================
// HttpNotifier
// =================================================================================

TEST_F(NotifierTest, HttpNotifierTypeIdentification) {
  HttpNotifier notifier("http://localhost:8080/hook");
  EXPECT_EQ(notifier.get_notifier_type(), "http");
  EXPECT_STREQ(notifier.get_name(), "HttpNotifier");
  EXPECT_TRUE(notifier.is_valid());
}

TEST_F(NotifierTest, HttpNotifierInvalidUrlFails) {
  HttpNotifier notifier("not a url");
  EXPECT_FALSE(notifier.is_valid());
  EXPECT_FALSE(notifier.notify("user", "subject", "body"));
}

TEST_F(NotifierTest, HttpNotifierUnreachableEndpointFails) {
  // Port 1 on loopback refuses connections
  HttpNotifier notifier("http://127.0.0.1:1/hook", 1);
  EXPECT_FALSE(notifier.notify("user", "subject", "body"));
}

// =================================================================================
// NotificationManager
// =================================================================================

TEST_F(NotifierTest, ManagerWithoutNotifiersLogsAndSucceeds) {
  NotificationManager manager;
  EXPECT_EQ(manager.notifier_count(), 0u);
  EXPECT_TRUE(manager.notify("user", "subject", "body"));
  EXPECT_EQ(manager.get_delivered_count(), 1u);
}

TEST_F(NotifierTest, ManagerReconfigureBuildsNotifiers) {
  Config::NotificationsConfig config;
  config.file_enabled = true;
  config.file_path = test_file_path_;
  config.http_enabled = true;
  config.http_webhook_url = "http://localhost:9/hook";

  NotificationManager manager(config);
  EXPECT_EQ(manager.notifier_count(), 2u);

  config.http_enabled = false;
  manager.reconfigure(config);
  EXPECT_EQ(manager.notifier_count(), 1u);

  config.file_enabled = false;
  manager.reconfigure(config);
  EXPECT_EQ(manager.notifier_count(), 0u);
}

TEST_F(NotifierTest, ManagerSucceedsWhenAnyNotifierDelivers) {
  auto failing = std::make_unique<RecordingNotifier>();
  failing->succeed = false;
  auto working = std::make_unique<RecordingNotifier>();
  RecordingNotifier *working_ptr = working.get();

  NotificationManager manager;
  manager.add_notifier(std::move(failing));
  manager.add_notifier(std::move(working));
  manager.add_notifier(nullptr);
  EXPECT_EQ(manager.notifier_count(), 2u);

  EXPECT_TRUE(manager.notify("user-9", "subject", "body"));
  ASSERT_EQ(working_ptr->count(), 1u);
  EXPECT_EQ(working_ptr->sent[0].user_id, "user-9");
  EXPECT_EQ(manager.get_delivered_count(), 1u);
  EXPECT_EQ(manager.get_failed_count(), 0u);
}

TEST_F(NotifierTest, ManagerFailsWhenEveryNotifierFails) {
  auto failing = std::make_unique<RecordingNotifier>();
  failing->succeed = false;

  NotificationManager manager;
  manager.add_notifier(std::move(failing));

  EXPECT_FALSE(manager.notify("user", "subject", "body"));
  EXPECT_EQ(manager.get_failed_count(), 1u);
}

TEST_F(NotifierTest, ManagerWritesThroughFileNotifier) {
  Config::NotificationsConfig config;
  config.stdout_enabled = false;
  config.file_enabled = true;
  config.file_path = test_file_path_;

  {
    NotificationManager manager(config);
    EXPECT_TRUE(manager.notify("user-3", "NEO alert", "details"));
  }

  auto lines = read_lines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["subject"], "NEO alert");
}
