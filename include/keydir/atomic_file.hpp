#pragma once

/**
 * @file atomic_file.hpp
 * @brief Crash-safe publish primitives
 */

#include "keydir/common.hpp"

#include <filesystem>
#include <string_view>

namespace keydir::storage {

/// Permission bits for internal-only records (rw-rw----)
inline constexpr std::filesystem::perms kInternalPerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
    | std::filesystem::perms::group_read | std::filesystem::perms::group_write;

/// Permission bits for published records (rw-r--r--)
inline constexpr std::filesystem::perms kPublicPerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
    | std::filesystem::perms::group_read | std::filesystem::perms::others_read;

/**
 * @brief Random hex string used to name scratch files and directories
 */
[[nodiscard]] std::string random_name(std::string_view prefix);

/**
 * @brief Create the parent directory of @p path if it does not exist
 */
[[nodiscard]] keydir::VoidResult ensure_parent(const std::filesystem::path& path);

/**
 * @brief Write @p content to a scratch file in @p tmp_dir and rename it onto @p target
 *
 * The file is flushed to disk and given @p perms before the rename, so
 * @p target is either absent, the previous file, or the complete new
 * content. The scratch file never survives the call.
 */
[[nodiscard]] keydir::VoidResult write_then_publish(const std::filesystem::path& tmp_dir,
                                                    const std::filesystem::path& target,
                                                    std::string_view content,
                                                    std::filesystem::perms perms);

/**
 * @brief Point @p link at @p target, replacing an existing symlink atomically
 *
 * The new symlink is created inside a fresh scratch directory next to
 * @p link and renamed over it; the scratch directory is removed on
 * every exit path.
 */
[[nodiscard]] keydir::VoidResult replace_symlink(const std::filesystem::path& target,
                                                 const std::filesystem::path& link);

}  // namespace keydir::storage
