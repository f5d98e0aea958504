#pragma once

/**
 * @file store.hpp
 * @brief Certificate record tiers (full, quarantined, published)
 */

#include "keydir/common.hpp"
#include "keydir/identifier.hpp"
#include "keydir/path_layout.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace keydir::storage {

class RecordStore
{
public:
    RecordStore(PathLayout layout, std::filesystem::path tmp_dir, bool dry_run);

    /**
     * @brief Atomically write @p content as the record of @p fingerprint in @p tier
     *
     * Full and quarantined records are written rw-rw----, published
     * records rw-r--r--. Under dry run nothing is written.
     * @return Path the record was (or would have been) published at
     */
    [[nodiscard]] keydir::Result<std::filesystem::path>
    write(Tier tier, const Fingerprint& fingerprint, std::string_view content) const;

    /**
     * @brief Read the record of @p fingerprint in @p tier
     * @return Record bytes, std::nullopt if absent, or an I/O error
     */
    [[nodiscard]] keydir::Result<std::optional<std::string>>
    read(Tier tier, const Fingerprint& fingerprint) const;

    /**
     * @brief Resolve @p identifier through its index family and read the published record
     */
    [[nodiscard]] keydir::Result<std::optional<std::string>>
    read_by_index(const Identifier& identifier) const;

    /**
     * @brief Read a file below the external root (or the internal root if
     *        @p allow_internal is set)
     *
     * A path escaping those roots, lexically or through its symlink
     * target, aborts the process.
     */
    [[nodiscard]] keydir::Result<std::optional<std::string>>
    read_path(const std::filesystem::path& path, bool allow_internal) const;

    [[nodiscard]] const PathLayout& layout() const noexcept { return m_layout; }
    [[nodiscard]] bool dry_run() const noexcept { return m_dry_run; }

private:
    void enforce_confinement(const std::filesystem::path& path, bool allow_internal) const;

    PathLayout m_layout;
    std::filesystem::path m_tmp_dir;
    bool m_dry_run;
};

}  // namespace keydir::storage
