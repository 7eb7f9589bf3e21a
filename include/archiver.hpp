/**
 * @file archiver.hpp
 * @brief Archive strategies for MailVault.
 *
 * Turns a source file or directory into a single zip archive whose entries are
 * rooted at the source's base name, so extracting the archive recreates the
 * directory itself rather than its flattened contents. Transient and
 * version-control paths are never archived.
 *
 * @note Requires libarchive. Install via apt on Linux or Homebrew on macOS.
 */

#ifndef ARCHIVER_HPP
#define ARCHIVER_HPP

#include "backup_types.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class Logger;

/**
 * @brief Interface for archive strategies.
 *
 * Defines the contract for compressing one source path into one archive file.
 */
class ArchiveStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ArchiveStrategy() = default;

    /**
     * @brief Archives a source path.
     *
     * @param sourcePath File or directory to archive.
     * @param outputFile Path of the archive to create.
     * @param password Optional password; blank or whitespace-only means no protection.
     * @return std::expected<void, BackupError> Success, SourceNotFound or CompressionFailed.
     */
    virtual std::expected<void, BackupError> execute(const std::filesystem::path& sourcePath,
                                                     const std::filesystem::path& outputFile,
                                                     const std::optional<std::string>& password) = 0;
};

/**
 * @brief Zip archive strategy backed by libarchive.
 *
 * Walks the source tree, skipping excluded paths and special files, and
 * writes deflate-compressed entries. Files and subdirectories that disappear or
 * cannot be read while the walk is running are logged and skipped, and the walk
 * carries on with their siblings. Any other listing error and every failure of
 * the archive itself abort the run.
 */
class ZipArchiveStrategy : public ArchiveStrategy {
public:
    /**
     * @brief Constructs a zip archive strategy.
     *
     * @param logger Logger for per-entry warnings.
     * @param tag Log tag (usually the task name).
     */
    ZipArchiveStrategy(const Logger& logger, std::string tag = "archive");

    /**
     * @brief Called with each directory entry as the walk reaches it, before it is archived.
     */
    using EntryCallback = std::function<void(const std::filesystem::path&)>;

    void setEntryCallback(EntryCallback callback);

    std::expected<void, BackupError> execute(const std::filesystem::path& sourcePath,
                                             const std::filesystem::path& outputFile,
                                             const std::optional<std::string>& password) override;

    /**
     * @brief Glob patterns that are never archived.
     *
     * Matched with fnmatch against the entry path rooted at the source's base
     * name (e.g. "project/.git/config").
     */
    static const std::vector<std::string>& excludedPatterns();

    /**
     * @brief Returns true if an entry path matches one of excludedPatterns().
     */
    static bool isExcluded(const std::string& entryPath);

    /**
     * @brief Normalizes a task password: trimmed, std::nullopt when blank.
     */
    static std::optional<std::string> effectivePassword(const std::optional<std::string>& password);

private:
    const Logger& logger;
    std::string tag;
    EntryCallback onEntry; ///< Optional walk observer.
};

#endif // ARCHIVER_HPP
