/**
 * @file atomic_file.cpp
 * @brief Write-then-rename and symlink replacement
 */

#include "keydir/atomic_file.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace keydir::storage {

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kRandomBytes = 16;

[[nodiscard]] keydir::Error io_error(std::string_view what,
                                     const fs::path& path,
                                     const std::error_code& ec)
{
    return make_error(errc::kIOError, std::format("{} {}: {}", what, path.string(), ec.message()));
}

[[nodiscard]] std::error_code last_error() noexcept
{
    return {errno, std::generic_category()};
}

/// Scratch file removed on destruction unless it was published
class ScratchFile
{
public:
    explicit ScratchFile(fs::path path)
        : m_path(std::move(path))
    {}
    ~ScratchFile()
    {
        close_fd();
        if (!m_published) {
            std::error_code ec;
            fs::remove(m_path, ec);
        }
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    [[nodiscard]] keydir::VoidResult open()
    {
        m_fd = ::open(m_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (m_fd < 0) {
            return std::unexpected(io_error("Failed to create scratch file", m_path, last_error()));
        }
        return {};
    }

    [[nodiscard]] keydir::VoidResult write_all(std::string_view content)
    {
        while (!content.empty()) {
            const ssize_t written = ::write(m_fd, content.data(), content.size());
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(io_error("Failed to write", m_path, last_error()));
            }
            content.remove_prefix(static_cast<std::size_t>(written));
        }
        return {};
    }

    [[nodiscard]] keydir::VoidResult sync_and_close()
    {
        if (::fsync(m_fd) != 0) {
            return std::unexpected(io_error("Failed to sync", m_path, last_error()));
        }
        const int fd = std::exchange(m_fd, -1);
        if (::close(fd) != 0) {
            return std::unexpected(io_error("Failed to close", m_path, last_error()));
        }
        return {};
    }

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

    void mark_published() noexcept { m_published = true; }

private:
    void close_fd() noexcept
    {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    fs::path m_path;
    int m_fd = -1;
    bool m_published = false;
};

/// Scratch directory removed (with whatever is left inside) on destruction
class ScratchDir
{
public:
    explicit ScratchDir(fs::path path)
        : m_path(std::move(path))
    {}
    ~ScratchDir()
    {
        if (m_created) {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] keydir::VoidResult create()
    {
        std::error_code ec;
        if (!fs::create_directory(m_path, ec)) {
            if (!ec) {
                ec = std::make_error_code(std::errc::file_exists);
            }
            return std::unexpected(io_error("Failed to create scratch directory", m_path, ec));
        }
        m_created = true;
        return {};
    }

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

private:
    fs::path m_path;
    bool m_created = false;
};

}  // namespace

std::string random_name(std::string_view prefix)
{
    thread_local std::mt19937_64 engine{std::random_device{}()};
    constexpr std::array<char, 16> kHex =
        {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string name(prefix);
    name.reserve(prefix.size() + 2 * kRandomBytes);
    std::uniform_int_distribution<unsigned> byte_dist(0, 255);
    for (std::size_t i = 0; i < kRandomBytes; ++i) {
        const auto byte = static_cast<std::uint8_t>(byte_dist(engine));
        name.push_back(kHex[byte >> 4U]);
        name.push_back(kHex[byte & 0x0FU]);
    }
    return name;
}

keydir::VoidResult ensure_parent(const fs::path& path)
{
    const fs::path parent = path.parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to create directory", parent, ec));
    }
    return {};
}

keydir::VoidResult write_then_publish(const fs::path& tmp_dir,
                                      const fs::path& target,
                                      std::string_view content,
                                      fs::perms perms)
{
    ScratchFile scratch(tmp_dir / random_name("key"));
    if (auto result = scratch.open(); !result) {
        return result;
    }
    if (auto result = scratch.write_all(content); !result) {
        return result;
    }
    if (auto result = scratch.sync_and_close(); !result) {
        return result;
    }

    std::error_code ec;
    fs::permissions(scratch.path(), perms, fs::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to set permissions on", scratch.path(), ec));
    }
    if (auto result = ensure_parent(target); !result) {
        return result;
    }
    fs::rename(scratch.path(), target, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to publish", target, ec));
    }
    scratch.mark_published();
    return {};
}

keydir::VoidResult replace_symlink(const fs::path& target, const fs::path& link)
{
    if (auto result = ensure_parent(link); !result) {
        return result;
    }
    ScratchDir scratch(link.parent_path() / random_name("link"));
    if (auto result = scratch.create(); !result) {
        return result;
    }

    const fs::path staged = scratch.path() / "link";
    std::error_code ec;
    fs::create_symlink(target, staged, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to create symlink", staged, ec));
    }
    fs::rename(staged, link, ec);
    if (ec) {
        return std::unexpected(io_error("Failed to replace symlink", link, ec));
    }
    return {};
}

}  // namespace keydir::storage
