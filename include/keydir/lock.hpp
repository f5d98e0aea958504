#pragma once

/**
 * @file lock.hpp
 * @brief Process-wide advisory write lock
 */

#include "keydir/common.hpp"

#include <filesystem>

namespace keydir::storage {

/**
 * @brief Exclusive flock(2) on a directory, held for one logical merge
 *
 * Acquisition blocks until the lock is free. The lock is released when
 * the guard is destroyed or moved from and then destroyed; every
 * mutation of the store happens while one guard is alive.
 */
class LockGuard
{
public:
    [[nodiscard]] static keydir::Result<LockGuard> acquire(const std::filesystem::path& dir);

    LockGuard(LockGuard&& other) noexcept;
    LockGuard& operator=(LockGuard&& other) noexcept;
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;
    ~LockGuard();

    [[nodiscard]] bool owns_lock() const noexcept { return m_fd >= 0; }

    /// Release early; the destructor becomes a no-op
    void release() noexcept;

private:
    explicit LockGuard(int fd) noexcept
        : m_fd(fd)
    {}

    int m_fd = -1;
};

}  // namespace keydir::storage
