#include "daemon.hpp"
#include <csignal>
#include <format>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;
volatile std::sig_atomic_t gReloadFlag = 0;

void signalHandler(int sig) {
    if (sig == SIGHUP) {
        gReloadFlag = 1;
    } else {
        gShutdownFlag = 1;
    }
}

void installSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

} // namespace

BackupDaemon::BackupDaemon(std::string configFile, TransportFactory transportFactory)
    : configFile(std::move(configFile)),
      config(std::make_unique<BackupConfig>(this->configFile)),
      logger(config->logFile, config->errorLogFile),
      transportFactory(std::move(transportFactory)),
      scheduler(logger) {
    scheduler.sync(config->tasks, std::chrono::system_clock::now());
}

BackupDaemon::~BackupDaemon() {
    waitForWorkers();
}

void BackupDaemon::requestShutdown() {
    gShutdownFlag = 1;
}

void BackupDaemon::requestReload() {
    gReloadFlag = 1;
}

void BackupDaemon::run() {
    gShutdownFlag = 0;
    gReloadFlag = 0;
    installSignalHandlers();

    logger.logMessage(std::format("Daemon started with {} scheduled task(s), config {}", scheduler.size(), configFile));

    while (!gShutdownFlag) {
        try {
            if (gReloadFlag) {
                gReloadFlag = 0;
                reload(std::chrono::system_clock::now());
            }
            tick(std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            logger.logError(std::format("Daemon error: {}", e.what()));
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    logger.logMessage(std::format("Daemon shutting down, waiting for {} running backup(s)", locks.runningCount()));
    waitForWorkers();
    logger.logMessage("Daemon shut down gracefully");
}

size_t BackupDaemon::tick(TimePoint now) {
    reapWorkers();
    size_t started = 0;
    for (const auto& task : scheduler.dueTasks(now)) {
        if (launch(task)) {
            ++started;
        }
    }
    return started;
}

bool BackupDaemon::reload(TimePoint now) {
    logger.logMessage(std::format("Reloading configuration from {}", configFile));
    try {
        auto fresh = std::make_unique<BackupConfig>(configFile);
        config = std::move(fresh);
    } catch (const std::exception& e) {
        logger.logError(std::format("Reload failed, keeping previous configuration: {}", e.what()));
        return false;
    }
    scheduler.sync(config->tasks, now);
    logger.logMessage(std::format("Configuration reloaded, {} task(s) scheduled", scheduler.size()));
    return true;
}

bool BackupDaemon::launch(const TaskConfig& task) {
    auto slot = locks.tryAcquire(task.name);
    if (!slot) {
        logger.logMessage(std::format("[{}] Previous run still in progress, skipping this trigger", task.name));
        return false;
    }

    auto fileLock = TaskFileLock::tryAcquire(config->lockDir(), task.name);
    if (!fileLock) {
        logger.logMessage(std::format("[{}] Skipping this trigger: {}", task.name, fileLock.error()));
        return false;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, lease = std::move(*slot), held = std::move(*fileLock), task, transport = config->transport,
                        options = config->pipelineOptions(), done]() {
        try {
            Backup backup(options, logger, nullptr, transportFactory);
            backup.run(task, transport);
        } catch (const std::exception& e) {
            logger.logError(std::format("[{}] Backup could not start: {}", task.name, e.what()));
        }
        done->store(true);
    });
    workers.push_back(Worker{std::move(thread), done});
    return true;
}

void BackupDaemon::reapWorkers() {
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

void BackupDaemon::waitForWorkers() {
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    workers.clear();
}
