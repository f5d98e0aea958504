#pragma once

/**
 * @file path_layout.hpp
 * @brief Mapping between identifiers and filesystem paths
 *
 * Layout below the two configured roots:
 *
 *   internal/full/<shard(fpr)>
 *   internal/quarantined/<fpr>
 *   external/pub/<shard(fpr)>
 *   external/links/by-fpr/<shard(fpr)>    -> ../../../../pub/<shard(primary)>
 *   external/links/by-keyid/<shard(kid)>  -> ../../../../pub/<shard(primary)>
 *   external/links/by-email/<shard(enc)>  -> ../../../../pub/<shard(primary)>
 *
 * A shard splits a string into "ab" / "cd" / "ef..."; strings of four
 * characters or fewer are left unsharded.
 */

#include "keydir/identifier.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace keydir::storage {

/// Certificate record store
enum class Tier {
    kFull,
    kQuarantined,
    kPublished,
};

[[nodiscard]] std::string_view to_string(Tier tier) noexcept;

/**
 * @brief Split @p text into the three-level shard path
 */
[[nodiscard]] std::filesystem::path shard(std::string_view text);

/**
 * @brief Concatenate the last three components of @p path (inverse of shard)
 */
[[nodiscard]] std::string merge(const std::filesystem::path& path);

/**
 * @brief Percent-encode @p text into a single valid path segment
 *
 * ASCII letters, digits, '-', '_' and '*' pass through, a space becomes
 * '+', everything else (including '.', so no "." or ".." component can
 * ever be produced by sharding) becomes %XX.
 */
[[nodiscard]] std::string percent_encode(std::string_view text);

/**
 * @brief Inverse of percent_encode
 * @return std::nullopt on a truncated or non-hex escape
 */
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view text);

/// Reverse mappings; std::nullopt when the path does not decode
[[nodiscard]] std::optional<Fingerprint> path_to_fingerprint(const std::filesystem::path& path);
[[nodiscard]] std::optional<KeyId> path_to_keyid(const std::filesystem::path& path);
[[nodiscard]] std::optional<Email> path_to_email(const std::filesystem::path& path);

/**
 * @brief Resolve the primary fingerprint behind @p path
 *
 * Follows at most one level of indirection: a symlink is resolved by
 * decoding its target, any other entry by decoding its own path.
 */
[[nodiscard]] std::optional<Fingerprint> path_to_primary(const std::filesystem::path& path);

class PathLayout
{
public:
    PathLayout(std::filesystem::path internal_dir, std::filesystem::path external_dir);

    [[nodiscard]] const std::filesystem::path& internal_dir() const noexcept
    {
        return m_internal_dir;
    }
    [[nodiscard]] const std::filesystem::path& external_dir() const noexcept
    {
        return m_external_dir;
    }

    [[nodiscard]] std::filesystem::path tier_dir(Tier tier) const;
    [[nodiscard]] std::filesystem::path index_dir(IndexKind kind) const;

    /// Path of the record of @p fingerprint in @p tier
    [[nodiscard]] std::filesystem::path record_path(Tier tier,
                                                    const Fingerprint& fingerprint) const;

    /// Path of the index entry for @p identifier in its own index family
    [[nodiscard]] std::filesystem::path link_path(const Identifier& identifier) const;

    /**
     * @brief Relative symlink content for @p link resolving to the published record
     *        of @p primary
     */
    [[nodiscard]] std::filesystem::path link_target(const std::filesystem::path& link,
                                                    const Fingerprint& primary) const;

private:
    std::filesystem::path m_internal_dir;
    std::filesystem::path m_external_dir;
};

}  // namespace keydir::storage
