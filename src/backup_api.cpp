#include "backup_api.hpp"
#include "backup.hpp"
#include "backup_config.hpp"
#include "logger.hpp"
#include "run_lock.hpp"
#include "scheduler.hpp"
#include <format>
#include <fstream>
#include <memory>

std::expected<void, std::string> BackupAPI::runTask(const std::string& configFile, const std::string& taskName) {
    try {
        BackupConfig config(configFile);
        const TaskConfig* task = config.findTask(taskName);
        if (!task) {
            return std::unexpected(std::format("No task named {} in {}", taskName, configFile));
        }

        Logger logger(config.logFile, config.errorLogFile);
        auto fileLock = TaskFileLock::tryAcquire(config.lockDir(), task->name);
        if (!fileLock) {
            logger.logError(std::format("[{}] Not started: {}", task->name, fileLock.error()));
            return std::unexpected(fileLock.error());
        }

        Backup backup(config.pipelineOptions(), logger);
        RunOutcome outcome = backup.run(*task, config.transport);
        if (!outcome.succeeded) {
            return std::unexpected(std::format("{}: {}", errorKindName(outcome.error->kind), outcome.error->message));
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to run task: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::updateSchedule(const std::string& configFile,
                                                           const std::string& taskName,
                                                           const std::string& cron) {
    auto schedule = CronSchedule::parse(cron);
    if (!schedule) {
        return std::unexpected(std::format("Invalid cron expression: {}", schedule.error()));
    }

    try {
        std::ifstream file(configFile);
        if (!file.is_open()) {
            return std::unexpected("Failed to open config file for reading: " + configFile);
        }
        Json::Value configJson;
        Json::Reader reader;
        if (!reader.parse(file, configJson)) {
            return std::unexpected("Failed to parse config file: " + configFile);
        }
        file.close();

        bool found = false;
        for (auto& task : configJson["tasks"]) {
            if (trim(task.get("name", "").asString()) == taskName) {
                task["cron"] = schedule->expression();
                found = true;
            }
        }
        if (!found) {
            return std::unexpected(std::format("No task named {} in {}", taskName, configFile));
        }

        std::ofstream outFile(configFile);
        if (!outFile.is_open()) {
            return std::unexpected("Failed to open config file for writing: " + configFile);
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "    ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(configJson, &outFile);
        outFile << '\n';
        outFile.close();

        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to update schedule: {}", e.what()));
    }
}
