/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the MailVault backup system.
 *
 * Provides a simplified interface for running a task immediately and for
 * editing a task's schedule, abstracting the underlying pipeline.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <expected>
#include <string>

/**
 * @brief API for managing backups in MailVault.
 *
 * Serves as the entry point for the command line and for external applications.
 */
class BackupAPI {
public:
    /**
     * @brief Runs one configured task now ("run now").
     *
     * Loads the configuration, executes the pipeline synchronously and reports
     * the outcome.
     *
     * @param configFile Path to the JSON configuration file.
     * @param taskName Name of the task to run.
     * @return std::expected<void, std::string> Success or an error message naming the failure kind.
     */
    static std::expected<void, std::string> runTask(const std::string& configFile, const std::string& taskName);

    /**
     * @brief Replaces the cron expression of a task in the configuration file.
     *
     * The expression is validated before the file is rewritten. A running daemon
     * picks the change up on its next reload (SIGHUP).
     *
     * @param configFile Path to the JSON configuration file.
     * @param taskName Task to update.
     * @param cron New five-field cron expression.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> updateSchedule(const std::string& configFile,
                                                           const std::string& taskName,
                                                           const std::string& cron);
};

#endif // BACKUP_API_HPP
