#pragma once

/**
 * @file database.hpp
 * @brief Filesystem certificate database: tiers, indices, lock and checker
 *
 * All write, link and unlink calls must be made while holding the guard
 * returned by lock(). Reads need no lock: every mutation is a single
 * rename, so a reader sees either the old or the new file or link.
 */

#include "keydir/certificate.hpp"
#include "keydir/common.hpp"
#include "keydir/config.hpp"
#include "keydir/consistency.hpp"
#include "keydir/identifier.hpp"
#include "keydir/index.hpp"
#include "keydir/lock.hpp"
#include "keydir/path_layout.hpp"
#include "keydir/store.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace keydir {

/// Index changes made by Database::import_certificate
struct ImportSummary
{
    std::size_t linked_keys = 0;
    std::size_t linked_emails = 0;
    std::size_t unlinked_keys = 0;
    std::size_t unlinked_emails = 0;
};

class Database
{
public:
    /**
     * @brief Open the database described by @p requested, creating missing directories
     *
     * Relative roots are resolved against the working directory once, here;
     * config() reports the absolute roots in use.
     */
    [[nodiscard]] static keydir::Result<Database> open(const StoreConfig& requested);

    /// Block until the process-wide write lock is held
    [[nodiscard]] keydir::Result<storage::LockGuard> lock() const;

    // Record tiers
    [[nodiscard]] keydir::Result<std::filesystem::path>
    write_to_full(const Fingerprint& fingerprint, std::string_view content) const;
    [[nodiscard]] keydir::Result<std::filesystem::path>
    write_to_published(const Fingerprint& fingerprint, std::string_view content) const;
    [[nodiscard]] keydir::Result<std::filesystem::path>
    write_to_quarantine(const Fingerprint& fingerprint, std::string_view content) const;

    [[nodiscard]] keydir::Result<std::optional<std::string>>
    by_fpr_full(const Fingerprint& fingerprint) const;
    [[nodiscard]] keydir::Result<std::optional<std::string>>
    by_primary_fpr(const Fingerprint& fingerprint) const;
    [[nodiscard]] keydir::Result<std::optional<std::string>>
    read_by_index(const Identifier& identifier) const;

    // Index entries
    [[nodiscard]] keydir::VoidResult link_fingerprint(const Fingerprint& key,
                                                      const Fingerprint& primary) const;
    [[nodiscard]] keydir::VoidResult unlink_fingerprint(const Fingerprint& key,
                                                        const Fingerprint& primary) const;
    [[nodiscard]] keydir::VoidResult link_email(const Email& email,
                                                const Fingerprint& primary) const;
    [[nodiscard]] keydir::VoidResult unlink_email(const Email& email,
                                                  const Fingerprint& primary) const;
    [[nodiscard]] keydir::Result<std::optional<Fingerprint>>
    check_link_fpr(const Fingerprint& key, const Fingerprint& primary) const;

    // Lookups
    [[nodiscard]] std::optional<Fingerprint>
    lookup_primary_fingerprint(const Identifier& identifier) const;
    [[nodiscard]] std::optional<std::filesystem::path> lookup_path(const Identifier& identifier) const;

    /**
     * @brief Read the published record behind @p identifier and parse it
     * @return Parsed certificate, std::nullopt if not indexed, or an error
     */
    [[nodiscard]] keydir::Result<std::optional<std::unique_ptr<Certificate>>>
    lookup(const Identifier& identifier, const CertificateParser& parser) const;

    /**
     * @brief Store @p record for @p cert in the full and published tiers and index it
     *
     * Keys and emails the previously published record carried but @p cert
     * drops are unlinked. Fails with Collision, before anything is written,
     * if a capable key or an email is already indexed under another primary.
     *
     * @param guard Lock returned by lock(); must still own the lock
     * @param parser Reads the previously published record
     */
    [[nodiscard]] keydir::Result<ImportSummary> import_certificate(const storage::LockGuard& guard,
                                                                   const Certificate& cert,
                                                                   std::string_view record,
                                                                   const CertificateParser& parser) const;

    /**
     * @brief Verify every record and index entry; may take a long time
     */
    [[nodiscard]] keydir::Result<storage::CheckSummary>
    check_consistency(const CertificateParser& parser) const;

    [[nodiscard]] const StoreConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const storage::PathLayout& layout() const noexcept { return m_store.layout(); }
    [[nodiscard]] const storage::RecordStore& store() const noexcept { return m_store; }
    [[nodiscard]] const storage::IndexManager& index() const noexcept { return m_index; }

private:
    explicit Database(StoreConfig config);

    StoreConfig m_config;
    storage::RecordStore m_store;
    storage::IndexManager m_index;
};

}  // namespace keydir
