#include "backup_api.hpp"
#include "backup_config.hpp"
#include "daemon.hpp"
#include "logger.hpp"
#include "scheduler.hpp"
#include <curl/curl.h>
#include <format>
#include <print>

namespace {

void printUsage(const char* program) {
    std::println(stderr, "Usage: {} [--config <path>] [--list] [--daemon] [--set-cron <task> <expr>] [<task-name>]", program);
}

int listTasks(const std::string& configFile) {
    BackupConfig config(configFile);
    auto now = std::chrono::system_clock::now();
    if (config.tasks.empty()) {
        std::println("No tasks configured in {}", configFile);
        return 0;
    }
    for (const auto& task : config.tasks) {
        std::string next;
        if (task.cron.empty()) {
            next = "manual only";
        } else if (auto schedule = CronSchedule::parse(task.cron); !schedule) {
            next = std::format("invalid cron: {}", schedule.error());
        } else if (auto fire = schedule->nextAfter(now)) {
            next = formatLocalTime(*fire, "%Y-%m-%d %H:%M");
        } else {
            next = "never";
        }
        std::println("{:<20} {:<16} {:<40} next: {}", task.name, task.cron, task.sourcePath, next);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    bool listMode = false;
    std::string taskName;
    std::string cronTask;
    std::string cronExpression;
    std::string configFile = "mailvault.json";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--list") {
            listMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--set-cron" && i + 2 < argc) {
            cronTask = argv[++i];
            cronExpression = argv[++i];
        } else if (arg.starts_with("--")) {
            printUsage(argv[0]);
            return 1;
        } else {
            taskName = arg;
        }
    }

    if (!daemonMode && !listMode && taskName.empty() && cronTask.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (!cronTask.empty()) {
        auto result = BackupAPI::updateSchedule(configFile, cronTask, cronExpression);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        std::println("Schedule of {} set to '{}'", cronTask, cronExpression);
        return 0;
    }

    if (listMode) {
        try {
            return listTasks(configFile);
        } catch (const std::exception& e) {
            std::println(stderr, "Error: Failed to load config: {}", e.what());
            return 1;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::println(stderr, "Error: Failed to initialise libcurl");
        return 1;
    }

    int status = 0;
    if (daemonMode) {
        std::println("Entering daemon mode with {}", configFile);
        try {
            BackupDaemon daemon(configFile);
            daemon.run();
        } catch (const std::exception& e) {
            std::println(stderr, "Error: Daemon failed to start: {}", e.what());
            status = 1;
        }
    } else {
        auto result = BackupAPI::runTask(configFile, taskName);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            status = 1;
        } else {
            std::println("Backup of {} completed successfully.", taskName);
        }
    }

    curl_global_cleanup();
    return status;
}
