#include "run_lock.hpp"
#include "backup_types.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/file.h>
#include <unistd.h>

TaskRunLocks::Lease::Lease(TaskRunLocks* owner, std::string name) : owner(owner), name(std::move(name)) {}

TaskRunLocks::Lease::Lease(Lease&& other) noexcept : owner(other.owner), name(std::move(other.name)) {
    other.owner = nullptr;
}

TaskRunLocks::Lease::~Lease() {
    if (owner) {
        owner->release(name);
    }
}

std::optional<TaskRunLocks::Lease> TaskRunLocks::tryAcquire(const std::string& task) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running.insert(task).second) {
        return std::nullopt;
    }
    return Lease(this, task);
}

bool TaskRunLocks::isRunning(const std::string& task) const {
    std::lock_guard<std::mutex> lock(mutex);
    return running.contains(task);
}

size_t TaskRunLocks::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running.size();
}

void TaskRunLocks::release(const std::string& task) {
    std::lock_guard<std::mutex> lock(mutex);
    running.erase(task);
}

TaskFileLock::TaskFileLock(int fd, std::filesystem::path lockPath) : fd(fd), lockPath(std::move(lockPath)) {}

TaskFileLock::TaskFileLock(TaskFileLock&& other) noexcept : fd(other.fd), lockPath(std::move(other.lockPath)) {
    other.fd = -1;
}

TaskFileLock::~TaskFileLock() {
    if (fd >= 0) {
        ::flock(fd, LOCK_UN);
        ::close(fd);
    }
}

std::expected<TaskFileLock, std::string> TaskFileLock::tryAcquire(const std::filesystem::path& lockDir, const std::string& task) {
    std::error_code ec;
    std::filesystem::create_directories(lockDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create lock directory {}: {}", lockDir.string(), ec.message()));
    }

    std::filesystem::path lockPath = lockDir / (sanitizeTaskName(task) + ".lock");
    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(std::format("Failed to open lock file {}: {}", lockPath.string(), std::strerror(errno)));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        ::close(fd);
        if (error == EWOULDBLOCK) {
            return std::unexpected(std::format("Task {} is already running", task));
        }
        return std::unexpected(std::format("Failed to lock {}: {}", lockPath.string(), std::strerror(error)));
    }
    return TaskFileLock(fd, std::move(lockPath));
}
