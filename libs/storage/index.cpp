/**
 * @file index.cpp
 * @brief Index link maintenance and collision checks
 */

#include "keydir/index.hpp"

#include "keydir/atomic_file.hpp"
#include "keydir/logging.hpp"

#include <format>
#include <system_error>
#include <utility>

namespace keydir::storage {

namespace {

namespace fs = std::filesystem;

/// Symlink content, or std::nullopt if @p link is absent or not a symlink
[[nodiscard]] keydir::Result<std::optional<fs::path>> read_link(const fs::path& link)
{
    std::error_code ec;
    fs::path target = fs::read_symlink(link, ec);
    if (!ec) {
        return std::optional<fs::path>{std::move(target)};
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::invalid_argument
        || ec == std::errc::not_a_directory) {
        return std::optional<fs::path>{};
    }
    return std::unexpected(make_error(
        errc::kIOError, std::format("Failed to read link {}: {}", link.string(), ec.message())));
}

}  // namespace

IndexManager::IndexManager(PathLayout layout, bool dry_run)
    : m_layout(std::move(layout))
    , m_dry_run(dry_run)
{}

keydir::VoidResult IndexManager::link(const Identifier& identifier,
                                      const Fingerprint& primary) const
{
    if (m_dry_run) {
        logging::logger()->debug("dry run: skipping link {} -> {}", keydir::to_string(identifier),
                                 primary.to_string());
        return {};
    }

    const fs::path link_path = m_layout.link_path(identifier);
    const fs::path target = m_layout.link_target(link_path, primary);

    auto existing = read_link(link_path);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (*existing && **existing == target) {
        return {};
    }
    return replace_symlink(target, link_path);
}

keydir::VoidResult IndexManager::unlink(const Identifier& identifier,
                                        const Fingerprint& primary) const
{
    if (m_dry_run) {
        logging::logger()->debug("dry run: skipping unlink {} -> {}",
                                 keydir::to_string(identifier), primary.to_string());
        return {};
    }

    const fs::path link_path = m_layout.link_path(identifier);
    auto existing = read_link(link_path);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (!*existing || **existing != m_layout.link_target(link_path, primary)) {
        return {};
    }

    std::error_code ec;
    fs::remove(link_path, ec);
    if (ec) {
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to remove link {}: {}", link_path.string(), ec.message())));
    }
    return {};
}

keydir::VoidResult IndexManager::link_fingerprint(const Fingerprint& key,
                                                  const Fingerprint& primary) const
{
    if (auto result = link(Identifier{key}, primary); !result) {
        return result;
    }
    return link(Identifier{KeyId::from(key)}, primary);
}

keydir::VoidResult IndexManager::unlink_fingerprint(const Fingerprint& key,
                                                    const Fingerprint& primary) const
{
    if (auto result = unlink(Identifier{key}, primary); !result) {
        return result;
    }
    return unlink(Identifier{KeyId::from(key)}, primary);
}

keydir::Result<std::optional<Fingerprint>> IndexManager::check(const Fingerprint& key,
                                                               const Fingerprint& primary) const
{
    const fs::path link_fpr = m_layout.link_path(Identifier{key});
    const fs::path link_keyid = m_layout.link_path(Identifier{KeyId::from(key)});

    std::error_code ec;
    fs::path published = fs::weakly_canonical(m_layout.record_path(Tier::kPublished, primary), ec);
    if (ec) {
        published = fs::absolute(m_layout.record_path(Tier::kPublished, primary)).lexically_normal();
    }

    if (auto result = verify_target(link_fpr, published, "Fingerprint", key); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = verify_target(link_keyid, published, "KeyID", key); !result) {
        return std::unexpected(result.error());
    }

    if (!fs::exists(link_fpr, ec) || !fs::exists(link_keyid, ec)) {
        return std::optional<Fingerprint>{key};
    }
    return std::optional<Fingerprint>{};
}

keydir::VoidResult IndexManager::verify_target(const fs::path& link,
                                               const fs::path& published,
                                               std::string_view label,
                                               const Fingerprint& key) const
{
    std::error_code ec;
    const fs::path resolved = fs::canonical(link, ec);
    // Absent or dangling entries are not collisions; check() reports them as missing
    if (ec) {
        return {};
    }
    if (common::path_ends_with(resolved, published)) {
        return {};
    }
    logging::logger()->info("{} points to different key for {} (expected {} to be suffix of {})",
                            label, key.to_string(), published.string(), resolved.string());
    return std::unexpected(make_error(
        errc::kCollision, std::format("{} collision for key {}", label, key.to_string())));
}

std::optional<Fingerprint> IndexManager::lookup_primary_fingerprint(const Identifier& identifier) const
{
    std::error_code ec;
    const fs::path target = fs::read_symlink(m_layout.link_path(identifier), ec);
    if (ec) {
        return std::nullopt;
    }
    return path_to_fingerprint(target);
}

std::optional<fs::path> IndexManager::lookup_path(const Identifier& identifier) const
{
    const fs::path link_path = m_layout.link_path(identifier);
    std::error_code ec;
    if (!fs::exists(link_path, ec)) {
        return std::nullopt;
    }
    return fs::path(
        common::make_relative(link_path.string(), m_layout.external_dir().string()));
}

}  // namespace keydir::storage
