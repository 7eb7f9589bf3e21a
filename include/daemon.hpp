/**
 * @file daemon.hpp
 * @brief Long-running scheduler loop for MailVault.
 *
 * The daemon wakes once per second, launches every task whose cron expression
 * is due on its own worker thread, and reloads the configuration on SIGHUP.
 * SIGINT and SIGTERM stop the loop; running backups are allowed to finish.
 */

#ifndef DAEMON_HPP
#define DAEMON_HPP

#include "backup.hpp"
#include "backup_config.hpp"
#include "logger.hpp"
#include "run_lock.hpp"
#include "scheduler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class BackupDaemon {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Loads the configuration and schedules every task.
     *
     * @param configFile Path to the JSON configuration file.
     * @param transportFactory Transport override handed to every run.
     * @throws std::runtime_error If the configuration cannot be loaded.
     */
    BackupDaemon(std::string configFile, TransportFactory transportFactory = nullptr);

    BackupDaemon(const BackupDaemon&) = delete;
    BackupDaemon& operator=(const BackupDaemon&) = delete;

    /**
     * @brief Waits for running backups.
     */
    ~BackupDaemon();

    /**
     * @brief Installs the signal handlers and runs until SIGINT or SIGTERM.
     */
    void run();

    /**
     * @brief Launches the tasks due at @p now.
     *
     * A due task whose previous run is still in flight is skipped.
     *
     * @return size_t Number of runs started.
     */
    size_t tick(TimePoint now);

    /**
     * @brief Re-reads the configuration file and updates the schedule in place.
     *
     * On failure the previous configuration stays active.
     *
     * @return bool True if the new configuration was applied.
     */
    bool reload(TimePoint now);

    /**
     * @brief Blocks until every worker has finished.
     */
    void waitForWorkers();

    const BackupScheduler& schedule() const { return scheduler; }
    const TaskRunLocks& runLocks() const { return locks; }

    /**
     * @brief Async-signal-safe requests, as raised by the installed handlers.
     */
    static void requestShutdown();
    static void requestReload();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    bool launch(const TaskConfig& task);
    void reapWorkers();

    std::string configFile;                   ///< Re-read on reload.
    std::unique_ptr<BackupConfig> config;     ///< Active configuration.
    Logger logger;                            ///< Log paths are fixed at startup.
    TransportFactory transportFactory;        ///< Transport override, may be empty.
    BackupScheduler scheduler;                ///< Next fire time per task.
    TaskRunLocks locks;                       ///< One run in flight per task.
    std::vector<Worker> workers;              ///< Launched runs, reaped each tick.
};

#endif // DAEMON_HPP
