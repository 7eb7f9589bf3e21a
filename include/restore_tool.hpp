/**
 * @file restore_tool.hpp
 * @brief Generates the scripts a recipient uses to rejoin split archives.
 *
 * Two scripts are produced, one for Windows (`copy /b`) and one for Unix
 * shells (`cat`), and bundled into `restore_tool.zip`. Both reference parts by
 * basename only and expect to run from the folder holding every part.
 */

#ifndef RESTORE_TOOL_HPP
#define RESTORE_TOOL_HPP

#include "backup_types.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

class CleanupSet;

inline constexpr const char* kRestoredArchiveName = "full_restored.zip";
inline constexpr const char* kWindowsScriptName = "windows_restore.bat";
inline constexpr const char* kUnixScriptName = "linux_restore.sh";
inline constexpr const char* kToolBundleName = "restore_tool.zip";

/**
 * @brief Files produced by RestoreToolBuilder::build().
 */
struct RestoreTool {
    std::filesystem::path bundle;                   ///< restore_tool.zip
    std::vector<std::filesystem::path> createdFiles; ///< Every file written, bundle included.
};

class RestoreToolBuilder {
public:
    /**
     * @brief Constructs a builder writing into @p outputDir.
     *
     * The directory is created on demand.
     */
    explicit RestoreToolBuilder(std::filesystem::path outputDir);

    /**
     * @brief Writes both scripts and the bundle.
     *
     * Each created file is registered with @p cleanup before anything else
     * can fail.
     *
     * @param partNames Part basenames in restore order (at least two).
     * @param cleanup Cleanup set of the current run.
     * @return std::expected<RestoreTool, BackupError> The bundle or ToolGenerationFailed.
     */
    std::expected<RestoreTool, BackupError> build(const std::vector<std::string>& partNames, CleanupSet& cleanup) const;

    static std::string windowsScript(const std::vector<std::string>& partNames);
    static std::string unixScript(const std::vector<std::string>& partNames);

private:
    std::filesystem::path outputDir;
};

#endif // RESTORE_TOOL_HPP
