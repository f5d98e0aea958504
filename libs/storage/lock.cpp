/**
 * @file lock.cpp
 * @brief flock-based write lock
 */

#include "keydir/lock.hpp"

#include "keydir/logging.hpp"

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace keydir::storage {

keydir::Result<LockGuard> LockGuard::acquire(const std::filesystem::path& dir)
{
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        const std::error_code ec(errno, std::generic_category());
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to open lock directory {}: {}", dir.string(), ec.message())));
    }
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) {
            continue;
        }
        const std::error_code ec(errno, std::generic_category());
        ::close(fd);
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to lock {}: {}", dir.string(), ec.message())));
    }
    logging::logger()->trace("Acquired lock on {}", dir.string());
    return LockGuard(fd);
}

LockGuard::LockGuard(LockGuard&& other) noexcept
    : m_fd(std::exchange(other.m_fd, -1))
{}

LockGuard& LockGuard::operator=(LockGuard&& other) noexcept
{
    if (this != &other) {
        release();
        m_fd = std::exchange(other.m_fd, -1);
    }
    return *this;
}

LockGuard::~LockGuard()
{
    release();
}

void LockGuard::release() noexcept
{
    if (m_fd < 0) {
        return;
    }
    // Closing the descriptor drops the flock
    ::flock(m_fd, LOCK_UN);
    ::close(m_fd);
    m_fd = -1;
}

}  // namespace keydir::storage
