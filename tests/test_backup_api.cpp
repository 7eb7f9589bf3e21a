#include <gtest/gtest.h>
#include "backup_api.hpp"
#include "backup_config.hpp"
#include "run_lock.hpp"
#include "testing.hpp"
#include <format>

class BackupApiTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    std::string configFile;

    void SetUp() override {
        configFile = (temp_dir.Path() / "mailvault.json").string();
        testutil::WriteFile(configFile, std::format(R"({{
            "work_dir": "{0}/work",
            "log_file": "{0}/mailvault.log",
            "error_log_file": "{0}/mailvault_errors.log",
            "smtp": {{"server": "127.0.0.1", "port": 1, "user": "me@example.com", "password": "x"}},
            "tasks": [
                {{"name": "missing", "path": "{0}/does-not-exist", "cron": "0 4 * * *"}},
                {{"name": "other", "path": "/srv", "cron": "0 5 * * *"}}
            ]
        }})", temp_dir.Path().string()));
    }
};

TEST_F(BackupApiTest, RunTaskReportsFailureKind) {
    auto result = BackupAPI::runTask(configFile, "missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("SourceNotFound"), std::string::npos);

    std::string errors = testutil::ReadFile(temp_dir.Path() / "mailvault_errors.log");
    EXPECT_NE(errors.find("[missing]"), std::string::npos);
}

TEST_F(BackupApiTest, RunTaskRejectsUnknownTaskAndBadConfig) {
    EXPECT_FALSE(BackupAPI::runTask(configFile, "nope").has_value());
    EXPECT_FALSE(BackupAPI::runTask((temp_dir.Path() / "absent.json").string(), "missing").has_value());
}

TEST_F(BackupApiTest, RunTaskRefusesWhileTheTaskIsRunningElsewhere) {
    BackupConfig config(configFile);
    auto held = TaskFileLock::tryAcquire(config.lockDir(), "missing");
    ASSERT_TRUE(held.has_value()) << held.error();

    auto result = BackupAPI::runTask(configFile, "missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("already running"), std::string::npos);
    EXPECT_EQ(result.error().find("SourceNotFound"), std::string::npos);
}

TEST_F(BackupApiTest, UpdateScheduleRewritesOnlyThatTask) {
    auto result = BackupAPI::updateSchedule(configFile, "missing", "  */30 * * * * ");
    ASSERT_TRUE(result.has_value()) << result.error();

    BackupConfig config(configFile);
    EXPECT_EQ(config.findTask("missing")->cron, "*/30 * * * *");
    EXPECT_EQ(config.findTask("other")->cron, "0 5 * * *");
    EXPECT_EQ(config.transport.host, "127.0.0.1");
}

TEST_F(BackupApiTest, UpdateScheduleValidatesFirst) {
    std::string before = testutil::ReadFile(configFile);
    EXPECT_FALSE(BackupAPI::updateSchedule(configFile, "missing", "61 * * * *").has_value());
    EXPECT_FALSE(BackupAPI::updateSchedule(configFile, "nope", "0 1 * * *").has_value());
    EXPECT_EQ(testutil::ReadFile(configFile), before);
}
