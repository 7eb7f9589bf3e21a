/**
 * @file backup.hpp
 * @brief Backup pipeline orchestration for MailVault.
 *
 * A run archives the task's source path, splits the archive into mail-sized
 * parts, generates the restore tool when there is more than one part, and mails
 * every part in ordered batches. Whatever happens, every temporary file the
 * run created is deleted before run() returns.
 *
 * @note Ensure libarchive and libcurl are installed (apt on Linux, Homebrew on macOS).
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include "backup_types.hpp"
#include "splitter.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

class ArchiveStrategy;
class CleanupSet;
class Logger;
class MailTransport;

namespace fs = std::filesystem;

/**
 * @brief Stages of one pipeline run.
 */
enum class PipelineState {
    Idle,
    Archiving,
    Splitting,
    ToolBuilding,
    Dispatching,
    Succeeded,
    Failed
};

std::string_view pipelineStateName(PipelineState state);

/**
 * @brief Tunables shared by every run.
 */
struct PipelineOptions {
    fs::path workDir;                               ///< Parent of the per-run directories holding archives, parts and tools.
    std::uintmax_t chunkSize = kDefaultChunkSize;    ///< Part ceiling in bytes.
    std::uintmax_t maxEmailSize = kDefaultChunkSize; ///< Batch ceiling in bytes.
};

/**
 * @brief Result of one run as seen by the caller.
 */
struct RunOutcome {
    bool succeeded = false;                       ///< True only if every batch was delivered.
    std::optional<BackupError> error;             ///< Set when succeeded is false.
    PipelineState finalState = PipelineState::Idle; ///< Succeeded or Failed once run() returns.
    PipelineState failedStage = PipelineState::Idle; ///< Stage that was active when the run failed.
    size_t partCount = 0;                         ///< Parts produced by the splitter.
    size_t batchCount = 0;                        ///< Emails planned.
    size_t batchesSent = 0;                       ///< Emails accepted by the server.
};

/**
 * @brief Creates the mail transport for a run.
 */
using TransportFactory = std::function<std::unique_ptr<MailTransport>(const TransportConfig&)>;

/**
 * @brief Main backup orchestration class.
 *
 * Sequences Archiving → Splitting → (ToolBuilding) → Dispatching and maps every
 * failure, including exceptions, to a Failed outcome after cleanup.
 */
class Backup {
public:
    /**
     * @brief Constructs a pipeline.
     *
     * @param options Work directory and size ceilings.
     * @param logger Logger shared with every stage.
     * @param archiveStrategy Archiver override; a ZipArchiveStrategy per run when null.
     * @param transportFactory Transport override; a CurlSmtpTransport when empty.
     */
    Backup(PipelineOptions options,
           const Logger& logger,
           std::shared_ptr<ArchiveStrategy> archiveStrategy = nullptr,
           TransportFactory transportFactory = nullptr);

    /**
     * @brief Executes one backup run for @p task.
     *
     * Synchronous and not idempotent: each call builds a new archive and sends
     * real email.
     *
     * @param task Task to back up.
     * @param transport SMTP server and credentials.
     * @return RunOutcome Success flag, error kind and counters.
     */
    RunOutcome run(const TaskConfig& task, const TransportConfig& transport);

    /**
     * @brief Archive file name for a task, e.g. "backup_docs_20240101_040000.zip".
     */
    static std::string archiveFileName(const std::string& taskName, std::chrono::system_clock::time_point when);

    const PipelineOptions& pipelineOptions() const { return options; }

private:
    std::expected<void, BackupError> execute(const TaskConfig& task,
                                             const TransportConfig& transport,
                                             CleanupSet& cleanup,
                                             RunOutcome& outcome);

    /**
     * @brief Verifies the integrity of an archive.
     *
     * Re-opens the zip and walks every header.
     *
     * @param archiveFile Archive to check.
     * @param password Password the archive was written with.
     * @return std::expected<size_t, BackupError> Entry count or CompressionFailed.
     */
    std::expected<size_t, BackupError> verifyArchive(const fs::path& archiveFile,
                                                     const std::optional<std::string>& password) const;

    /**
     * @brief Creates a private directory for one run under the work directory.
     *
     * Every file of the run lives inside it, so runs started in the same second,
     * by another process or for a similarly named task never touch each other's files.
     */
    std::expected<fs::path, BackupError> createRunDirectory(const std::string& taskName) const;

    void enter(RunOutcome& outcome, PipelineState state, const std::string& tag) const;

    PipelineOptions options;                          ///< Work directory and ceilings.
    const Logger& logger;                             ///< Shared logger.
    std::shared_ptr<ArchiveStrategy> archiveStrategy; ///< Archiver override.
    TransportFactory transportFactory;                ///< Builds the mail transport.
};

#endif // BACKUP_HPP
