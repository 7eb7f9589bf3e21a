/**
 * @file backup_types.hpp
 * @brief Value types shared by every stage of the MailVault pipeline.
 *
 * Holds the per-invocation task and transport inputs together with the error
 * taxonomy that stage results carry back to the orchestrator.
 */

#ifndef BACKUP_TYPES_HPP
#define BACKUP_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Failure categories a pipeline run can terminate with.
 */
enum class ErrorKind {
    SourceNotFound,
    CompressionFailed,
    SplitFailed,
    ToolGenerationFailed,
    DeliveryFailed,
    UnexpectedFailure
};

/**
 * @brief Returns the stable name of an error kind (e.g. "DeliveryFailed").
 */
std::string_view errorKindName(ErrorKind kind);

/**
 * @brief Error payload returned by pipeline stages.
 *
 * The kind is what callers branch on; the message carries the diagnostic detail
 * (libarchive error string, SMTP rejection text, ...).
 */
struct BackupError {
    ErrorKind kind;      ///< Failure category.
    std::string message; ///< Human readable detail.
};

/**
 * @brief One backup task as resolved by the caller.
 */
struct TaskConfig {
    std::string name;                           ///< Task name, also used as log tag and file prefix.
    std::string sourcePath;                     ///< File or directory to back up.
    std::string cron;                           ///< Five-field cron expression (scheduler only).
    std::string subject;                        ///< Email subject stem.
    std::optional<std::string> recipient;       ///< Destination address; the sender when unset or empty.
    std::optional<std::string> archivePassword; ///< Zip password; blank means no protection.
};

/**
 * @brief Credentials for the authenticated mail submission session.
 */
struct TransportConfig {
    std::string host = "smtp.qq.com"; ///< SMTP server host.
    int port = 465;                   ///< 465 selects implicit TLS, anything else STARTTLS.
    std::string username;             ///< Login, also the sender address.
    std::string secret;               ///< Password or app token.
};

/**
 * @brief Strips leading and trailing whitespace.
 */
std::string trim(std::string_view text);

/**
 * @brief Task name reduced to [A-Za-z0-9_-], for file names ("task" when empty).
 *
 * Distinct tasks of one configuration never share a sanitized name.
 */
std::string sanitizeTaskName(std::string_view name);

#endif // BACKUP_TYPES_HPP
