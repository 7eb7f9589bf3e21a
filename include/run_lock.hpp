/**
 * @file run_lock.hpp
 * @brief Single-flight guard for backup runs.
 *
 * A task may only have one run in flight at a time. A scheduled trigger that
 * fires while a manual or previous run of the same task is still going is
 * rejected rather than queued. TaskRunLocks covers the runs of one daemon;
 * TaskFileLock extends the rule to a "run now" started from another process.
 */

#ifndef RUN_LOCK_HPP
#define RUN_LOCK_HPP

#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>

class TaskRunLocks {
public:
    /**
     * @brief Ownership of one task's run slot; released on destruction.
     */
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        const std::string& task() const { return name; }

    private:
        friend class TaskRunLocks;
        Lease(TaskRunLocks* owner, std::string name);

        TaskRunLocks* owner; ///< Null once moved from.
        std::string name;
    };

    /**
     * @brief Claims the run slot of @p task.
     *
     * @return std::optional<Lease> The lease, or std::nullopt if a run is already in flight.
     */
    std::optional<Lease> tryAcquire(const std::string& task);

    bool isRunning(const std::string& task) const;
    size_t runningCount() const;

private:
    void release(const std::string& task);

    mutable std::mutex mutex;
    std::set<std::string> running;
};

/**
 * @brief Exclusive flock(2) on "<lockDir>/<task>.lock", released when destroyed.
 *
 * The lock file itself is left in place; unlinking it would let a second
 * process lock a fresh inode while the first still holds the old one.
 */
class TaskFileLock {
public:
    /**
     * @brief Takes the lock without blocking.
     *
     * @param lockDir Directory holding the lock files; created when missing.
     * @param task Task name.
     * @return std::expected<TaskFileLock, std::string> The lock, or why it could not be taken.
     */
    static std::expected<TaskFileLock, std::string> tryAcquire(const std::filesystem::path& lockDir, const std::string& task);

    TaskFileLock(TaskFileLock&& other) noexcept;
    TaskFileLock& operator=(TaskFileLock&&) = delete;
    TaskFileLock(const TaskFileLock&) = delete;
    TaskFileLock& operator=(const TaskFileLock&) = delete;
    ~TaskFileLock();

    const std::filesystem::path& path() const { return lockPath; }

private:
    TaskFileLock(int fd, std::filesystem::path lockPath);

    int fd; ///< -1 once moved from.
    std::filesystem::path lockPath;
};

#endif // RUN_LOCK_HPP
