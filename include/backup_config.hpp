/**
 * @file backup_config.hpp
 * @brief Configuration management for the MailVault backup system.
 *
 * Defines the configuration class holding the mail server settings, the size
 * ceilings, the log locations and the list of backup tasks.
 *
 * @note Configuration is loaded from a JSON file, by default mailvault.json in
 * the working directory.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include "backup.hpp"
#include "backup_types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @brief Configuration class for the backup system.
 *
 * Loads and validates settings from a JSON configuration file, providing defaults
 * for everything except the task list.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, is not valid JSON, or
     * declares a task without a name or path, or two tasks with the same name.
     */
    BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed document.
     *
     * @throws std::runtime_error On the same validation failures as the file constructor.
     */
    explicit BackupConfig(const Json::Value& configJson);

    /**
     * @brief Looks up a task by name.
     *
     * @return const TaskConfig* The task, or nullptr if none is configured under @p name.
     */
    const TaskConfig* findTask(const std::string& name) const;

    /**
     * @brief Pipeline tunables derived from this configuration.
     */
    PipelineOptions pipelineOptions() const;

    /**
     * @brief Directory of the per-task lock files, "<work_dir>/locks".
     */
    std::filesystem::path lockDir() const;

    std::string configFile;          ///< Source file, empty when built from a document.
    std::string workDir;             ///< Holds the per-run directories and the lock files.
    std::string logFile;             ///< Path to the log file.
    std::string errorLogFile;        ///< Path to the error log file.
    std::uintmax_t chunkSize;        ///< Part ceiling in bytes.
    std::uintmax_t maxEmailSize;     ///< Batch ceiling in bytes.
    TransportConfig transport;       ///< SMTP server and credentials.
    std::vector<TaskConfig> tasks;   ///< Configured backup tasks, in file order.

private:
    void load(const Json::Value& configJson);
};

#endif // BACKUP_CONFIG_HPP
