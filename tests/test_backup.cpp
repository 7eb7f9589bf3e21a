#include <gtest/gtest.h>
#include "archiver.hpp"
#include "backup.hpp"
#include "logger.hpp"
#include "restore_tool.hpp"
#include "testing.hpp"
#include <format>
#include <fstream>
#include <functional>

namespace fs = std::filesystem;

namespace {

constexpr std::uintmax_t kTestChunk = 45 * 1024;

// Leaves a half-written archive behind and then throws.
class ThrowingArchiver final : public ArchiveStrategy {
  public:
    std::expected<void, BackupError> execute(const fs::path&, const fs::path& outputFile,
                                             const std::optional<std::string>&) override {
        std::ofstream(outputFile, std::ios::binary) << "PK partial";
        throw std::runtime_error("disk on fire");
    }
};

// Writes a truncated archive and reports the failure.
class FailingArchiver final : public ArchiveStrategy {
  public:
    std::expected<void, BackupError> execute(const fs::path&, const fs::path& outputFile,
                                             const std::optional<std::string>&) override {
        std::ofstream(outputFile, std::ios::binary) << "PK truncated";
        return std::unexpected(BackupError{ErrorKind::CompressionFailed, "write failed: No space left on device"});
    }
};

// Archives normally, then lets the test interfere with the files around the archive.
class HookedArchiver final : public ArchiveStrategy {
  public:
    HookedArchiver(const Logger& logger, std::function<void(const fs::path&)> afterArchive)
        : inner_(logger), afterArchive_(std::move(afterArchive)) {}

    std::expected<void, BackupError> execute(const fs::path& sourcePath, const fs::path& outputFile,
                                             const std::optional<std::string>& password) override {
        auto result = inner_.execute(sourcePath, outputFile, password);
        if (result) {
            afterArchive_(outputFile);
        }
        return result;
    }

  private:
    ZipArchiveStrategy inner_;
    std::function<void(const fs::path&)> afterArchive_;
};

} // namespace

class BackupPipelineTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    Logger logger{"", ""};
    std::shared_ptr<testutil::MailLog> log = std::make_shared<testutil::MailLog>();
    TransportConfig transport{"smtp.example.com", 465, "me@example.com", "token"};

    fs::path WorkDir() const { return temp_dir.Path() / "work"; }

    PipelineOptions Options() const {
        PipelineOptions options;
        options.workDir = WorkDir();
        options.chunkSize = kTestChunk;
        options.maxEmailSize = kTestChunk;
        return options;
    }

    TransportFactory Factory() {
        auto shared = log;
        return [shared](const TransportConfig&) -> std::unique_ptr<MailTransport> {
            return std::make_unique<testutil::FakeTransport>(shared);
        };
    }

    TaskConfig Task(const fs::path& source) const {
        TaskConfig task;
        task.name = "docs";
        task.sourcePath = source.string();
        task.subject = "Docs backup";
        return task;
    }
};

TEST_F(BackupPipelineTest, SmallSourceIsOneMailWithoutRestoreTool) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "a.txt", "alpha");
    testutil::WriteFile(src / "b.txt", "beta");

    Backup backup(Options(), logger, nullptr, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    ASSERT_TRUE(outcome.succeeded) << outcome.error->message;
    EXPECT_EQ(outcome.finalState, PipelineState::Succeeded);
    EXPECT_EQ(outcome.partCount, 1u);
    EXPECT_EQ(outcome.batchCount, 1u);
    EXPECT_EQ(outcome.batchesSent, 1u);

    ASSERT_EQ(log->sent.size(), 1u);
    const auto& mail = log->sent[0];
    EXPECT_EQ(mail.message.to, "me@example.com");
    EXPECT_EQ(mail.message.subject.find('['), std::string::npos);
    ASSERT_EQ(mail.attachmentNames.size(), 1u);
    EXPECT_EQ(mail.attachmentNames[0].rfind("backup_docs_", 0), 0u);
    EXPECT_TRUE(mail.attachmentNames[0].ends_with(".zip"));

    fs::path received = temp_dir.Path() / "received.zip";
    testutil::WriteFile(received, mail.attachmentContents[0]);
    auto entries = testutil::ReadZip(received);
    ASSERT_NE(testutil::FindEntry(entries, "docs/a.txt"), nullptr);
    EXPECT_EQ(testutil::FindEntry(entries, "docs/b.txt")->contents, "beta");

    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, LargeSourceIsSplitAndRestorable) {
    fs::path src = temp_dir.Path() / "docs";
    std::string payload = testutil::RandomBytes(120 * 1024);
    testutil::WriteFile(src / "blob.bin", payload);

    Backup backup(Options(), logger, nullptr, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    ASSERT_TRUE(outcome.succeeded) << outcome.error->message;
    EXPECT_EQ(outcome.partCount, 3u);
    EXPECT_EQ(outcome.batchCount, 3u);
    EXPECT_EQ(outcome.batchesSent, 3u);
    ASSERT_EQ(log->sent.size(), 3u);

    const auto& first = log->sent[0];
    ASSERT_EQ(first.attachmentNames.size(), 2u);
    EXPECT_EQ(first.attachmentNames[0], kToolBundleName);
    EXPECT_TRUE(first.attachmentNames[1].ends_with(".zip.001"));
    EXPECT_NE(first.message.body.find(kToolBundleName), std::string::npos);

    std::string joined;
    for (size_t i = 0; i < log->sent.size(); ++i) {
        const auto& mail = log->sent[i];
        EXPECT_EQ(mail.message.subject.rfind(std::format("Docs backup [{}/3] - ", i + 1), 0), 0u);
        const auto& part = mail.attachmentNames.back();
        EXPECT_TRUE(part.ends_with(std::format(".zip.{:03d}", i + 1))) << part;
        EXPECT_LE(mail.attachmentContents.back().size(), kTestChunk);
        joined += mail.attachmentContents.back();
    }

    fs::path restored = temp_dir.Path() / kRestoredArchiveName;
    testutil::WriteFile(restored, joined);
    auto entries = testutil::ReadZip(restored);
    const auto* blob = testutil::FindEntry(entries, "docs/blob.bin");
    ASSERT_NE(blob, nullptr);
    EXPECT_EQ(blob->contents, payload);

    fs::path bundle = temp_dir.Path() / "tool.zip";
    testutil::WriteFile(bundle, first.attachmentContents[0]);
    auto tools = testutil::ReadZip(bundle);
    const auto* script = testutil::FindEntry(tools, kUnixScriptName);
    ASSERT_NE(script, nullptr);
    EXPECT_NE(script->contents.find(first.attachmentNames[1]), std::string::npos);

    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, PasswordIsAppliedToTheArchive) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "a.txt", "alpha");
    TaskConfig task = Task(src);
    task.archivePassword = "hunter2";

    Backup backup(Options(), logger, nullptr, Factory());
    ASSERT_TRUE(backup.run(task, transport).succeeded);

    fs::path received = temp_dir.Path() / "received.zip";
    testutil::WriteFile(received, log->sent.at(0).attachmentContents.at(0));
    EXPECT_THROW(testutil::ReadZip(received), std::runtime_error);
    auto entries = testutil::ReadZip(received, std::string("hunter2"));
    EXPECT_EQ(testutil::FindEntry(entries, "docs/a.txt")->contents, "alpha");
}

TEST_F(BackupPipelineTest, MissingSourceFailsWithoutTouchingDisk) {
    Backup backup(Options(), logger, nullptr, Factory());
    RunOutcome outcome = backup.run(Task(temp_dir.Path() / "missing"), transport);

    EXPECT_FALSE(outcome.succeeded);
    EXPECT_EQ(outcome.finalState, PipelineState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::SourceNotFound);
    EXPECT_EQ(log->attempts, 0u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, RejectionOnSecondBatchReportsPartialDelivery) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "blob.bin", testutil::RandomBytes(120 * 1024));
    log->failOnAttempt = 2;

    Backup backup(Options(), logger, nullptr, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::DeliveryFailed);
    EXPECT_EQ(outcome.failedStage, PipelineState::Dispatching);
    EXPECT_EQ(outcome.batchCount, 3u);
    EXPECT_EQ(outcome.batchesSent, 1u);
    EXPECT_EQ(log->sent.size(), 1u);
    EXPECT_EQ(log->attempts, 2u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, ExceptionIsMappedToUnexpectedFailureAfterCleanup) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "a.txt", "alpha");

    Backup backup(Options(), logger, std::make_shared<ThrowingArchiver>(), Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::UnexpectedFailure);
    EXPECT_NE(outcome.error->message.find("disk on fire"), std::string::npos);
    EXPECT_EQ(outcome.failedStage, PipelineState::Archiving);
    EXPECT_EQ(log->attempts, 0u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, ArchiveNameIsSanitised) {
    auto when = std::chrono::system_clock::now();
    std::string name = Backup::archiveFileName("my docs/../x", when);
    EXPECT_EQ(name.rfind("backup_my_docs____x_", 0), 0u);
    EXPECT_TRUE(name.ends_with(".zip"));
    EXPECT_EQ(name.find('/'), std::string::npos);
}

TEST_F(BackupPipelineTest, CompressionFailureRemovesThePartialArchive) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "a.txt", "alpha");

    Backup backup(Options(), logger, std::make_shared<FailingArchiver>(), Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::CompressionFailed);
    EXPECT_EQ(outcome.failedStage, PipelineState::Archiving);
    EXPECT_EQ(log->attempts, 0u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, SplitFailureRemovesEveryPart) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "blob.bin", testutil::RandomBytes(120 * 1024));

    // A directory where the second part belongs makes the split fail halfway.
    auto archiver = std::make_shared<HookedArchiver>(logger, [](const fs::path& archive) {
        fs::create_directories(ArchiveSplitter::partPath(archive, 2));
    });
    Backup backup(Options(), logger, archiver, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::SplitFailed);
    EXPECT_EQ(outcome.failedStage, PipelineState::Splitting);
    EXPECT_EQ(log->attempts, 0u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, ToolFailureRemovesPartsAndTools) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "blob.bin", testutil::RandomBytes(120 * 1024));

    // A regular file where the tool directory belongs.
    auto archiver = std::make_shared<HookedArchiver>(logger, [](const fs::path& archive) {
        testutil::WriteFile(archive.parent_path() / (archive.stem().string() + "_restore"), "in the way");
    });
    Backup backup(Options(), logger, archiver, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    EXPECT_FALSE(outcome.succeeded);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::ToolGenerationFailed);
    EXPECT_EQ(outcome.failedStage, PipelineState::ToolBuilding);
    EXPECT_EQ(outcome.partCount, 3u);
    EXPECT_EQ(log->attempts, 0u);
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, ToolBundleLeadsASingleBatch) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "blob.bin", testutil::RandomBytes(120 * 1024));

    PipelineOptions options = Options();
    options.maxEmailSize = 1024 * 1024;
    Backup backup(options, logger, nullptr, Factory());
    RunOutcome outcome = backup.run(Task(src), transport);

    ASSERT_TRUE(outcome.succeeded) << outcome.error->message;
    EXPECT_EQ(outcome.partCount, 3u);
    EXPECT_EQ(outcome.batchCount, 1u);
    ASSERT_EQ(log->sent.size(), 1u);

    const auto& mail = log->sent[0];
    EXPECT_EQ(mail.message.subject.find('['), std::string::npos);
    ASSERT_EQ(mail.attachmentNames.size(), 4u);
    EXPECT_EQ(mail.attachmentNames[0], kToolBundleName);
    for (size_t i = 1; i < mail.attachmentNames.size(); ++i) {
        EXPECT_TRUE(mail.attachmentNames[i].ends_with(std::format(".zip.{:03d}", i))) << mail.attachmentNames[i];
    }
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}

TEST_F(BackupPipelineTest, EachRunGetsItsOwnDirectory) {
    fs::path src = temp_dir.Path() / "docs";
    testutil::WriteFile(src / "a.txt", "alpha");

    std::vector<fs::path> archives;
    auto archiver = std::make_shared<HookedArchiver>(logger, [&archives](const fs::path& archive) {
        archives.push_back(archive);
    });
    Backup backup(Options(), logger, archiver, Factory());
    ASSERT_TRUE(backup.run(Task(src), transport).succeeded);
    ASSERT_TRUE(backup.run(Task(src), transport).succeeded);

    ASSERT_EQ(archives.size(), 2u);
    EXPECT_NE(archives[0].parent_path(), archives[1].parent_path());
    for (const auto& archive : archives) {
        EXPECT_EQ(archive.parent_path().parent_path(), WorkDir());
        EXPECT_EQ(archive.parent_path().filename().string().rfind("run_docs_", 0), 0u);
    }
    EXPECT_EQ(testutil::CountFiles(WorkDir()), 0u);
}
