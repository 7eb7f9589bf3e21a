/**
 * @file cleanup_set.hpp
 * @brief Tracks ephemeral files created during a run and removes them.
 */

#ifndef CLEANUP_SET_HPP
#define CLEANUP_SET_HPP

#include <filesystem>
#include <string>
#include <vector>

class Logger;

/**
 * @brief Set of ephemeral paths owned by one pipeline run.
 *
 * Paths are deleted by purge() and, for anything still pending, by the
 * destructor. Removal failures are logged and never thrown.
 */
class CleanupSet {
public:
    /**
     * @brief Constructs an empty cleanup set.
     *
     * @param logger Logger for removal diagnostics.
     * @param tag Prefix for log lines (the task name).
     */
    CleanupSet(const Logger& logger, std::string tag);
    ~CleanupSet();

    CleanupSet(const CleanupSet&) = delete;
    CleanupSet& operator=(const CleanupSet&) = delete;

    /**
     * @brief Registers a path for deletion. Duplicates are ignored.
     */
    void add(const std::filesystem::path& path);

    /**
     * @brief Deletes every registered path, most recent first.
     *
     * Directories are removed recursively.
     *
     * @return size_t Number of paths that existed and were removed.
     */
    size_t purge() noexcept;

    const std::vector<std::filesystem::path>& pending() const { return paths; }

private:
    const Logger& logger;
    std::string tag;
    std::vector<std::filesystem::path> paths;
};

#endif // CLEANUP_SET_HPP
