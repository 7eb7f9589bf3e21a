#include <gtest/gtest.h>
#include "run_lock.hpp"
#include "testing.hpp"
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

TEST(TaskRunLocksTest, SecondAcquireIsRejectedUntilRelease) {
    TaskRunLocks locks;
    {
        auto lease = locks.tryAcquire("docs");
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(lease->task(), "docs");
        EXPECT_TRUE(locks.isRunning("docs"));
        EXPECT_FALSE(locks.tryAcquire("docs").has_value());

        auto other = locks.tryAcquire("etc");
        EXPECT_TRUE(other.has_value());
        EXPECT_EQ(locks.runningCount(), 2u);
    }
    EXPECT_FALSE(locks.isRunning("docs"));
    EXPECT_EQ(locks.runningCount(), 0u);
    EXPECT_TRUE(locks.tryAcquire("docs").has_value());
}

TEST(TaskRunLocksTest, MovedLeaseReleasesOnce) {
    TaskRunLocks locks;
    auto lease = locks.tryAcquire("docs");
    ASSERT_TRUE(lease.has_value());
    {
        TaskRunLocks::Lease moved(std::move(*lease));
        lease.reset();
        EXPECT_TRUE(locks.isRunning("docs"));
    }
    EXPECT_FALSE(locks.isRunning("docs"));
}

TEST(TaskRunLocksTest, OnlyOneThreadWins) {
    TaskRunLocks locks;
    std::atomic<int> winners{0};
    std::atomic<bool> go{false};
    std::vector<std::optional<TaskRunLocks::Lease>> held(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < held.size(); ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto lease = locks.tryAcquire("docs");
            if (lease) {
                ++winners;
                held[i].emplace(std::move(*lease));
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(locks.runningCount(), 1u);
}

class TaskFileLockTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    std::filesystem::path LockDir() const { return temp_dir.Path() / "work" / "locks"; }
};

TEST_F(TaskFileLockTest, SecondHolderIsRejectedUntilRelease) {
    {
        auto first = TaskFileLock::tryAcquire(LockDir(), "docs");
        ASSERT_TRUE(first.has_value()) << first.error();
        EXPECT_EQ(first->path(), LockDir() / "docs.lock");

        auto second = TaskFileLock::tryAcquire(LockDir(), "docs");
        ASSERT_FALSE(second.has_value());
        EXPECT_NE(second.error().find("already running"), std::string::npos);

        EXPECT_TRUE(TaskFileLock::tryAcquire(LockDir(), "etc").has_value());
    }
    EXPECT_TRUE(TaskFileLock::tryAcquire(LockDir(), "docs").has_value());
}

TEST_F(TaskFileLockTest, MovedLockStaysHeld) {
    auto lock = TaskFileLock::tryAcquire(LockDir(), "my docs");
    ASSERT_TRUE(lock.has_value());
    {
        TaskFileLock moved(std::move(*lock));
        EXPECT_EQ(moved.path().filename(), "my_docs.lock");
        EXPECT_FALSE(TaskFileLock::tryAcquire(LockDir(), "my docs").has_value());
    }
    EXPECT_TRUE(TaskFileLock::tryAcquire(LockDir(), "my docs").has_value());
}
