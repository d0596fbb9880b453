// tests/test_layer2_service/test_filelock_singleprocess.cpp
/**
 * @file test_filelock_singleprocess.cpp
 * @brief FileLock behaviour within a single process.
 *
 * The daemon's singleton guard takes `FileLock(dir / "daemon", File, NonBlocking)`;
 * these tests cover the properties it relies on: exclusivity, the lock file name,
 * release semantics and move ownership.
 */
#include "shared_test_helpers.h"
#include "wk_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace walkie::utils;
using namespace walkie::tests::helper;
using namespace std::chrono_literals;

class FileLockSingleProcessTest : public ::testing::Test
{
  protected:
    TempDir m_dir{"wk-lock"};
};

TEST_F(FileLockSingleProcessTest, LockFileNameForFileAndDirectory)
{
    const auto file_lock =
        FileLock::get_expected_lock_fullname_for(m_dir / "daemon", ResourceType::File);
    EXPECT_EQ(file_lock.filename(), "daemon.lock");

    const auto dir_lock =
        FileLock::get_expected_lock_fullname_for(m_dir.path(), ResourceType::Directory);
    EXPECT_EQ(dir_lock.filename().string(), m_dir.path().filename().string() + ".dir.lock");

    EXPECT_TRUE(FileLock::get_expected_lock_fullname_for("", ResourceType::File).empty());
}

TEST_F(FileLockSingleProcessTest, AcquireCreatesLockFile)
{
    FileLock lock(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid()) << lock.error_code().message();
    ASSERT_TRUE(lock.get_lock_file_path().has_value());
    EXPECT_TRUE(fs::exists(*lock.get_lock_file_path()));
}

TEST_F(FileLockSingleProcessTest, SecondNonBlockingLockFails)
{
    FileLock first(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(first.valid());

    FileLock second(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    EXPECT_FALSE(second.valid());
    EXPECT_EQ(second.error_code(), std::errc::resource_unavailable_try_again);
}

TEST_F(FileLockSingleProcessTest, ReleaseAllowsReacquire)
{
    FileLock first(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(first.valid());
    first.release();
    EXPECT_FALSE(first.valid());

    FileLock again(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    EXPECT_TRUE(again.valid());
}

TEST_F(FileLockSingleProcessTest, ReleaseWithRemoveDeletesLockFile)
{
    FileLock lock(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid());
    const auto lock_file = *lock.get_lock_file_path();

    lock.release(true);
    EXPECT_FALSE(fs::exists(lock_file));
}

TEST_F(FileLockSingleProcessTest, TimedLockTimesOut)
{
    FileLock holder(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(holder.valid());

    const auto start = std::chrono::steady_clock::now();
    FileLock waiter(m_dir / "daemon", ResourceType::File, 100ms);
    EXPECT_FALSE(waiter.valid());
    EXPECT_EQ(waiter.error_code(), std::errc::timed_out);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST_F(FileLockSingleProcessTest, BlockingLockWaitsForRelease)
{
    auto holder = std::make_unique<FileLock>(m_dir / "daemon", ResourceType::File,
                                             LockMode::NonBlocking);
    ASSERT_TRUE(holder->valid());

    std::atomic<bool> acquired{false};
    std::thread waiter(
        [&]
        {
            FileLock lock(m_dir / "daemon", ResourceType::File, LockMode::Blocking);
            acquired.store(lock.valid());
        });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    holder.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(FileLockSingleProcessTest, MoveTransfersOwnership)
{
    FileLock original(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(original.valid());

    FileLock moved(std::move(original));
    EXPECT_TRUE(moved.valid());

    FileLock contender(m_dir / "daemon", ResourceType::File, LockMode::NonBlocking);
    EXPECT_FALSE(contender.valid());
}
