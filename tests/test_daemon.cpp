#include <gtest/gtest.h>
#include "daemon.hpp"
#include "testing.hpp"
#include <format>
#include <future>

namespace {

// Holds every send until the gate opens.
class GatedTransport final : public MailTransport {
  public:
    GatedTransport(std::shared_future<void> gate, std::shared_ptr<testutil::MailLog> log)
        : gate_(std::move(gate)), inner_(std::move(log)) {}

    std::expected<void, std::string> send(const MailMessage& message) override {
        gate_.wait();
        return inner_.send(message);
    }

  private:
    std::shared_future<void> gate_;
    testutil::FakeTransport inner_;
};

} // namespace

class BackupDaemonTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    std::shared_ptr<testutil::MailLog> log = std::make_shared<testutil::MailLog>();
    std::string configFile;

    void SetUp() override {
        testutil::WriteFile(temp_dir.Path() / "docs" / "a.txt", "alpha");
        configFile = (temp_dir.Path() / "mailvault.json").string();
        WriteConfig(R"({"name": "docs", "path": "{0}/docs", "cron": "* * * * *"},
                       {"name": "etc", "path": "{0}/docs", "cron": "0 4 1 1 *"})");
    }

    void WriteConfig(const std::string& tasks) {
        std::string root = temp_dir.Path().string();
        std::string taskList = tasks;
        for (size_t pos; (pos = taskList.find("{0}")) != std::string::npos;) {
            taskList.replace(pos, 3, root);
        }
        testutil::WriteFile(configFile, std::format(R"({{
            "work_dir": "{0}/work",
            "log_file": "{0}/mailvault.log",
            "error_log_file": "{0}/mailvault_errors.log",
            "smtp": {{"user": "me@example.com", "password": "x"}},
            "tasks": [{1}]
        }})", root, taskList));
    }

    TransportFactory Factory() {
        auto shared = log;
        return [shared](const TransportConfig&) -> std::unique_ptr<MailTransport> {
            return std::make_unique<testutil::FakeTransport>(shared);
        };
    }
};

TEST_F(BackupDaemonTest, SchedulesEveryConfiguredTask) {
    BackupDaemon daemon(configFile, Factory());
    EXPECT_EQ(daemon.schedule().size(), 2u);
    EXPECT_TRUE(daemon.schedule().nextFireTime("docs").has_value());
}

TEST_F(BackupDaemonTest, TickRunsDueTasks) {
    BackupDaemon daemon(configFile, Factory());
    auto now = std::chrono::system_clock::now();

    EXPECT_EQ(daemon.tick(now - std::chrono::minutes(5)), 0u);
    EXPECT_EQ(daemon.tick(now + std::chrono::minutes(2)), 1u);
    daemon.waitForWorkers();

    ASSERT_EQ(log->sent.size(), 1u);
    EXPECT_EQ(log->sent[0].message.to, "me@example.com");
    EXPECT_EQ(daemon.runLocks().runningCount(), 0u);
    // Only the lock files outlive a run.
    for (const auto& entry : std::filesystem::directory_iterator(temp_dir.Path() / "work")) {
        EXPECT_EQ(entry.path().filename(), "locks");
    }
    EXPECT_EQ(testutil::CountFiles(temp_dir.Path() / "work" / "locks"), 1u);
}

TEST_F(BackupDaemonTest, TaskLockedByAnotherRunIsSkipped) {
    BackupDaemon daemon(configFile, Factory());
    auto now = std::chrono::system_clock::now();
    {
        auto manual = TaskFileLock::tryAcquire(temp_dir.Path() / "work" / "locks", "docs");
        ASSERT_TRUE(manual.has_value()) << manual.error();
        EXPECT_EQ(daemon.tick(now + std::chrono::minutes(2)), 0u);
        EXPECT_FALSE(daemon.runLocks().isRunning("docs"));
    }
    EXPECT_EQ(daemon.tick(now + std::chrono::minutes(4)), 1u);
    daemon.waitForWorkers();
    EXPECT_EQ(log->sent.size(), 1u);
}

TEST_F(BackupDaemonTest, OverlappingTriggerIsSkipped) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    auto shared = log;
    BackupDaemon daemon(configFile, [gate, shared](const TransportConfig&) -> std::unique_ptr<MailTransport> {
        return std::make_unique<GatedTransport>(gate, shared);
    });

    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(daemon.tick(now + std::chrono::minutes(2)), 1u);
    EXPECT_TRUE(daemon.runLocks().isRunning("docs"));
    EXPECT_EQ(daemon.tick(now + std::chrono::minutes(4)), 0u);

    release.set_value();
    daemon.waitForWorkers();
    EXPECT_EQ(log->sent.size(), 1u);
    EXPECT_FALSE(daemon.runLocks().isRunning("docs"));
}

TEST_F(BackupDaemonTest, ReloadAppliesChangesIncrementally) {
    BackupDaemon daemon(configFile, Factory());
    auto etcNext = daemon.schedule().nextFireTime("etc");

    WriteConfig(R"({"name": "etc", "path": "{0}/docs", "cron": "0 4 1 1 *"},
                   {"name": "new", "path": "{0}/docs", "cron": "@daily"})");
    EXPECT_TRUE(daemon.reload(std::chrono::system_clock::now()));
    EXPECT_FALSE(daemon.schedule().contains("docs"));
    EXPECT_TRUE(daemon.schedule().contains("new"));
    EXPECT_EQ(daemon.schedule().nextFireTime("etc"), etcNext);
}

TEST_F(BackupDaemonTest, FailedReloadKeepsPreviousSchedule) {
    BackupDaemon daemon(configFile, Factory());
    testutil::WriteFile(configFile, "{ broken");
    EXPECT_FALSE(daemon.reload(std::chrono::system_clock::now()));
    EXPECT_EQ(daemon.schedule().size(), 2u);
}

TEST_F(BackupDaemonTest, MissingConfigThrows) {
    EXPECT_THROW(BackupDaemon((temp_dir.Path() / "absent.json").string()), std::runtime_error);
}
