#include "backup.hpp"
#include "archiver.hpp"
#include "batcher.hpp"
#include "cleanup_set.hpp"
#include "dispatcher.hpp"
#include "logger.hpp"
#include "mail_transport.hpp"
#include "restore_tool.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <cstring>
#include <format>
#include <stdlib.h>
#include <vector>

std::string_view pipelineStateName(PipelineState state) {
    switch (state) {
    case PipelineState::Idle:
        return "Idle";
    case PipelineState::Archiving:
        return "Archiving";
    case PipelineState::Splitting:
        return "Splitting";
    case PipelineState::ToolBuilding:
        return "ToolBuilding";
    case PipelineState::Dispatching:
        return "Dispatching";
    case PipelineState::Succeeded:
        return "Succeeded";
    case PipelineState::Failed:
        return "Failed";
    }
    return "Failed";
}

Backup::Backup(PipelineOptions options,
               const Logger& logger,
               std::shared_ptr<ArchiveStrategy> archiveStrategy,
               TransportFactory transportFactory)
    : options(std::move(options)),
      logger(logger),
      archiveStrategy(std::move(archiveStrategy)),
      transportFactory(std::move(transportFactory)) {
    if (this->options.workDir.empty()) {
        this->options.workDir = fs::temp_directory_path() / "mailvault";
    }
    if (!this->transportFactory) {
        this->transportFactory = [](const TransportConfig& config) -> std::unique_ptr<MailTransport> {
            return std::make_unique<CurlSmtpTransport>(config);
        };
    }
}

std::string Backup::archiveFileName(const std::string& taskName, std::chrono::system_clock::time_point when) {
    return std::format("backup_{}_{}.zip", sanitizeTaskName(taskName), formatLocalTime(when, "%Y%m%d_%H%M%S"));
}

std::expected<fs::path, BackupError> Backup::createRunDirectory(const std::string& taskName) const {
    std::error_code ec;
    fs::create_directories(options.workDir, ec);
    if (ec) {
        return std::unexpected(BackupError{ErrorKind::CompressionFailed,
                                           std::format("Failed to create work directory {}: {}", options.workDir.string(), ec.message())});
    }

    std::string tmpl = (options.workDir / std::format("run_{}_XXXXXX", sanitizeTaskName(taskName))).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        return std::unexpected(BackupError{ErrorKind::CompressionFailed,
                                           std::format("Failed to create run directory in {}: {}", options.workDir.string(), std::strerror(errno))});
    }
    return fs::path(created);
}

void Backup::enter(RunOutcome& outcome, PipelineState state, const std::string& tag) const {
    logger.logMessage(std::format("[{}] {} -> {}", tag, pipelineStateName(outcome.finalState), pipelineStateName(state)));
    outcome.finalState = state;
}

RunOutcome Backup::run(const TaskConfig& task, const TransportConfig& transport) {
    RunOutcome outcome;
    std::expected<void, BackupError> result;
    auto started = std::chrono::steady_clock::now();

    logger.logMessage(std::format("[{}] Backup started for {}", task.name, task.sourcePath));
    {
        CleanupSet cleanup(logger, task.name);
        try {
            result = execute(task, transport, cleanup, outcome);
        } catch (const std::exception& e) {
            result = std::unexpected(BackupError{ErrorKind::UnexpectedFailure, e.what()});
        }
        cleanup.purge();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);
    if (result) {
        outcome.succeeded = true;
        enter(outcome, PipelineState::Succeeded, task.name);
        logger.logMessage(std::format("[{}] Backup completed: {} part(s) in {} email(s), {}s",
                                      task.name, outcome.partCount, outcome.batchesSent, elapsed.count()));
    } else {
        outcome.error = result.error();
        outcome.failedStage = outcome.finalState;
        enter(outcome, PipelineState::Failed, task.name);
        logger.logError(std::format("[{}] Backup failed during {}: {}: {}{}", task.name,
                                    pipelineStateName(outcome.failedStage), errorKindName(result.error().kind),
                                    result.error().message,
                                    outcome.batchesSent > 0 ? std::format(" ({} of {} email(s) already sent)", outcome.batchesSent, outcome.batchCount) : ""));
    }
    return outcome;
}

std::expected<void, BackupError> Backup::execute(const TaskConfig& task,
                                                 const TransportConfig& transport,
                                                 CleanupSet& cleanup,
                                                 RunOutcome& outcome) {
    std::error_code ec;
    if (task.sourcePath.empty() || !fs::exists(task.sourcePath, ec)) {
        return std::unexpected(BackupError{ErrorKind::SourceNotFound, std::format("Source path does not exist: {}", task.sourcePath)});
    }

    enter(outcome, PipelineState::Archiving, task.name);
    auto runDir = createRunDirectory(task.name);
    if (!runDir) {
        return std::unexpected(runDir.error());
    }
    cleanup.add(*runDir);

    fs::path archivePath = *runDir / archiveFileName(task.name, std::chrono::system_clock::now());
    cleanup.add(archivePath);

    std::shared_ptr<ArchiveStrategy> archiver = archiveStrategy;
    if (!archiver) {
        archiver = std::make_shared<ZipArchiveStrategy>(logger, task.name);
    }
    auto archived = archiver->execute(task.sourcePath, archivePath, task.archivePassword);
    if (!archived) {
        return std::unexpected(archived.error());
    }

    auto verified = verifyArchive(archivePath, ZipArchiveStrategy::effectivePassword(task.archivePassword));
    if (!verified) {
        return std::unexpected(verified.error());
    }
    logger.logMessage(std::format("[{}] Archive verified: {} entries", task.name, *verified));

    enter(outcome, PipelineState::Splitting, task.name);
    ArchiveSplitter splitter(options.chunkSize);
    auto parts = splitter.split(archivePath, cleanup);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    outcome.partCount = parts->size();
    logger.logMessage(std::format("[{}] Archive is {} bytes, {} part(s)", task.name, fs::file_size(archivePath), parts->size()));

    std::optional<AttachmentFile> toolBundle;
    if (parts->size() > 1) {
        enter(outcome, PipelineState::ToolBuilding, task.name);
        fs::path toolDir = *runDir / (archivePath.stem().string() + "_restore");
        cleanup.add(toolDir);

        std::vector<std::string> partNames;
        for (const auto& part : *parts) {
            partNames.push_back(part.filename().string());
        }
        auto tool = RestoreToolBuilder(toolDir).build(partNames, cleanup);
        if (!tool) {
            return std::unexpected(tool.error());
        }
        toolBundle = AttachmentFile{tool->bundle, fs::file_size(tool->bundle)};
    }

    enter(outcome, PipelineState::Dispatching, task.name);
    AttachmentBatcher batcher(options.maxEmailSize);
    auto batches = batcher.plan(describeFiles(*parts), toolBundle);
    outcome.batchCount = batches.size();

    auto mailer = transportFactory(transport);
    if (!mailer) {
        return std::unexpected(BackupError{ErrorKind::DeliveryFailed, "No mail transport available"});
    }
    MailDispatcher dispatcher(*mailer, logger);
    auto delivered = dispatcher.dispatch(batches, task, transport);
    outcome.batchesSent = dispatcher.sentCount();
    if (!delivered) {
        return std::unexpected(delivered.error());
    }
    return {};
}

std::expected<size_t, BackupError> Backup::verifyArchive(const fs::path& archiveFile,
                                                         const std::optional<std::string>& password) const {
    struct archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (password) {
        archive_read_add_passphrase(a, password->c_str());
    }
    if (archive_read_open_filename(a, archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        const char* detail = archive_error_string(a);
        std::string errorMsg = std::format("Failed to open archive for verification: {} (error: {})",
                                           archiveFile.string(), detail ? detail : "unknown");
        archive_read_free(a);
        return std::unexpected(BackupError{ErrorKind::CompressionFailed, errorMsg});
    }

    struct archive_entry* entry;
    size_t entries = 0;
    int result;
    while ((result = archive_read_next_header(a, &entry)) == ARCHIVE_OK || result == ARCHIVE_WARN) {
        ++entries;
    }

    std::string errorMsg;
    if (result != ARCHIVE_EOF) {
        const char* detail = archive_error_string(a);
        errorMsg = std::format("Archive verification failed after {} entries: {} (error: {})",
                               entries, archiveFile.string(), detail ? detail : "unknown");
    }
    archive_read_close(a);
    archive_read_free(a);

    if (!errorMsg.empty()) {
        return std::unexpected(BackupError{ErrorKind::CompressionFailed, errorMsg});
    }
    return entries;
}
