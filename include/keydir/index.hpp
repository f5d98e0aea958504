#pragma once

/**
 * @file index.hpp
 * @brief Symlink-based secondary indices (by-fpr, by-keyid, by-email)
 *
 * An index entry is a relative symlink from the identifier's sharded
 * path to the published record of its primary certificate. The entry's
 * existence is the only record of the association.
 */

#include "keydir/common.hpp"
#include "keydir/identifier.hpp"
#include "keydir/path_layout.hpp"

#include <filesystem>
#include <optional>

namespace keydir::storage {

class IndexManager
{
public:
    IndexManager(PathLayout layout, bool dry_run);

    /**
     * @brief Point the entry for @p identifier at the published record of @p primary
     *
     * No-op if the entry already has exactly this target. An existing
     * entry with another target is replaced; callers linking subkeys
     * run check() first.
     */
    [[nodiscard]] keydir::VoidResult link(const Identifier& identifier,
                                          const Fingerprint& primary) const;

    /**
     * @brief Remove the entry for @p identifier if it points at @p primary
     *
     * Missing entries and entries pointing elsewhere are left alone.
     */
    [[nodiscard]] keydir::VoidResult unlink(const Identifier& identifier,
                                            const Fingerprint& primary) const;

    /// Link both the by-fpr and the derived by-keyid entry of @p key
    [[nodiscard]] keydir::VoidResult link_fingerprint(const Fingerprint& key,
                                                      const Fingerprint& primary) const;

    /// Unlink both the by-fpr and the derived by-keyid entry of @p key
    [[nodiscard]] keydir::VoidResult unlink_fingerprint(const Fingerprint& key,
                                                        const Fingerprint& primary) const;

    /**
     * @brief Verify the by-fpr and by-keyid entries of @p key before linking it to @p primary
     *
     * @return Collision error if either entry resolves to another
     *         published record; @p key if at least one entry is missing;
     *         std::nullopt if both already resolve to @p primary.
     */
    [[nodiscard]] keydir::Result<std::optional<Fingerprint>>
    check(const Fingerprint& key, const Fingerprint& primary) const;

    /// Primary fingerprint encoded in the entry's target, without touching the record
    [[nodiscard]] std::optional<Fingerprint>
    lookup_primary_fingerprint(const Identifier& identifier) const;

    /// Entry path relative to the external root, if the entry resolves to a record
    [[nodiscard]] std::optional<std::filesystem::path>
    lookup_path(const Identifier& identifier) const;

    [[nodiscard]] const PathLayout& layout() const noexcept { return m_layout; }

private:
    [[nodiscard]] keydir::VoidResult verify_target(const std::filesystem::path& link,
                                                   const std::filesystem::path& published,
                                                   std::string_view label,
                                                   const Fingerprint& key) const;

    PathLayout m_layout;
    bool m_dry_run;
};

}  // namespace keydir::storage
