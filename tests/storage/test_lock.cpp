/**
 * @file test_lock.cpp
 * @brief Write lock tests
 */

#include "keydir/lock.hpp"

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

#include <gtest/gtest.h>

using keydir::storage::LockGuard;
using keydir::test::TempDir;

TEST(LockGuard, AcquireAndRelease)
{
    TempDir temp_dir("keydir_lock_test");
    auto guard = LockGuard::acquire(temp_dir.path());
    ASSERT_TRUE(guard.has_value()) << guard.error().message;
    EXPECT_TRUE(guard->owns_lock());
    guard->release();
    EXPECT_FALSE(guard->owns_lock());

    auto again = LockGuard::acquire(temp_dir.path());
    ASSERT_TRUE(again.has_value()) << again.error().message;
    EXPECT_TRUE(again->owns_lock());
}

TEST(LockGuard, MoveTransfersOwnership)
{
    TempDir temp_dir("keydir_lock_move_test");
    auto guard = LockGuard::acquire(temp_dir.path());
    ASSERT_TRUE(guard.has_value()) << guard.error().message;

    LockGuard moved = std::move(*guard);
    EXPECT_TRUE(moved.owns_lock());
    EXPECT_FALSE(guard->owns_lock());  // NOLINT(bugprone-use-after-move)
}

TEST(LockGuard, MissingDirectory)
{
    auto guard = LockGuard::acquire("/nonexistent/keydir/lock");
    ASSERT_FALSE(guard.has_value());
    EXPECT_EQ(guard.error().code, "IOError");
}

TEST(LockGuard, SecondAcquirerBlocks)
{
    TempDir temp_dir("keydir_lock_block_test");
    auto guard = LockGuard::acquire(temp_dir.path());
    ASSERT_TRUE(guard.has_value()) << guard.error().message;

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto second = LockGuard::acquire(temp_dir.path());
        acquired = second.has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());

    guard->release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}
