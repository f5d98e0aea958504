/**
 * @file database.cpp
 * @brief Database facade over the record store and index manager
 */

#include "keydir/database.hpp"

#include "keydir/common.hpp"
#include "keydir/logging.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <system_error>
#include <utility>
#include <vector>

namespace keydir {

namespace fs = std::filesystem;

using storage::IndexManager;
using storage::PathLayout;
using storage::RecordStore;
using storage::Tier;

Database::Database(StoreConfig config)
    : m_config(std::move(config))
    , m_store(PathLayout(m_config.internal_dir, m_config.external_dir), m_config.tmp_dir,
              m_config.dry_run)
    , m_index(PathLayout(m_config.internal_dir, m_config.external_dir), m_config.dry_run)
{}

namespace {

/// Absolute, lexically normal form of @p dir, resolved against the working directory
keydir::Result<fs::path> resolve_root(const fs::path& dir)
{
    std::error_code ec;
    const fs::path absolute = fs::absolute(dir, ec);
    if (ec) {
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to resolve {}: {}", dir.string(), ec.message())));
    }
    return fs::path(common::normalize_path(absolute.string()));
}

}  // namespace

keydir::Result<Database> Database::open(const StoreConfig& requested)
{
    StoreConfig config = requested;
    for (fs::path* dir : {&config.internal_dir, &config.external_dir, &config.tmp_dir}) {
        auto resolved = resolve_root(*dir);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        *dir = std::move(*resolved);
    }

    Database db(config);
    const PathLayout& layout = db.layout();

    const fs::path dirs[] = {
        config.tmp_dir,
        layout.tier_dir(Tier::kFull),
        layout.tier_dir(Tier::kQuarantined),
        layout.tier_dir(Tier::kPublished),
        layout.index_dir(IndexKind::kByFingerprint),
        layout.index_dir(IndexKind::kByKeyId),
        layout.index_dir(IndexKind::kByEmail),
    };
    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return std::unexpected(make_error(
                errc::kIOError, std::format("Failed to create {}: {}", dir.string(), ec.message())));
        }
    }

    auto log = logging::logger();
    log->info("Opened filesystem database.");
    log->info("keys_internal_dir: '{}'", config.internal_dir.string());
    log->info("keys_external_dir: '{}'", config.external_dir.string());
    log->info("tmp_dir: '{}'", config.tmp_dir.string());
    if (config.dry_run) {
        log->info("dry run: mutations are validated but not applied");
    }
    return db;
}

keydir::Result<storage::LockGuard> Database::lock() const
{
    return storage::LockGuard::acquire(m_config.internal_dir);
}

keydir::Result<fs::path> Database::write_to_full(const Fingerprint& fingerprint,
                                                 std::string_view content) const
{
    return m_store.write(Tier::kFull, fingerprint, content);
}

keydir::Result<fs::path> Database::write_to_published(const Fingerprint& fingerprint,
                                                      std::string_view content) const
{
    return m_store.write(Tier::kPublished, fingerprint, content);
}

keydir::Result<fs::path> Database::write_to_quarantine(const Fingerprint& fingerprint,
                                                       std::string_view content) const
{
    return m_store.write(Tier::kQuarantined, fingerprint, content);
}

keydir::Result<std::optional<std::string>> Database::by_fpr_full(const Fingerprint& fingerprint) const
{
    return m_store.read(Tier::kFull, fingerprint);
}

keydir::Result<std::optional<std::string>>
Database::by_primary_fpr(const Fingerprint& fingerprint) const
{
    return m_store.read(Tier::kPublished, fingerprint);
}

keydir::Result<std::optional<std::string>> Database::read_by_index(const Identifier& identifier) const
{
    return m_store.read_by_index(identifier);
}

keydir::VoidResult Database::link_fingerprint(const Fingerprint& key,
                                              const Fingerprint& primary) const
{
    return m_index.link_fingerprint(key, primary);
}

keydir::VoidResult Database::unlink_fingerprint(const Fingerprint& key,
                                                const Fingerprint& primary) const
{
    return m_index.unlink_fingerprint(key, primary);
}

keydir::VoidResult Database::link_email(const Email& email, const Fingerprint& primary) const
{
    return m_index.link(Identifier{email}, primary);
}

keydir::VoidResult Database::unlink_email(const Email& email, const Fingerprint& primary) const
{
    return m_index.unlink(Identifier{email}, primary);
}

keydir::Result<std::optional<Fingerprint>> Database::check_link_fpr(const Fingerprint& key,
                                                                    const Fingerprint& primary) const
{
    return m_index.check(key, primary);
}

std::optional<Fingerprint> Database::lookup_primary_fingerprint(const Identifier& identifier) const
{
    return m_index.lookup_primary_fingerprint(identifier);
}

std::optional<fs::path> Database::lookup_path(const Identifier& identifier) const
{
    return m_index.lookup_path(identifier);
}

keydir::Result<std::optional<std::unique_ptr<Certificate>>>
Database::lookup(const Identifier& identifier, const CertificateParser& parser) const
{
    auto record = m_store.read_by_index(identifier);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!*record) {
        return std::optional<std::unique_ptr<Certificate>>{};
    }
    auto cert = parser.parse(**record);
    if (!cert) {
        return std::unexpected(cert.error());
    }
    return std::optional<std::unique_ptr<Certificate>>{std::move(*cert)};
}

keydir::Result<ImportSummary> Database::import_certificate(const storage::LockGuard& guard,
                                                           const Certificate& cert,
                                                           std::string_view record,
                                                           const CertificateParser& parser) const
{
    if (!guard.owns_lock()) {
        return std::unexpected(
            make_error(errc::kInvalidArgument, "Import requires the database write lock"));
    }

    const Fingerprint primary = cert.primary_fingerprint();
    const std::vector<Fingerprint> keys = cert.capable_key_fingerprints();
    const std::vector<Email> emails = cert.emails();
    auto log = logging::logger();

    // Refuse collisions before touching anything
    std::vector<Fingerprint> missing_keys;
    for (const auto& key : keys) {
        auto missing = m_index.check(key, primary);
        if (!missing) {
            return std::unexpected(missing.error());
        }
        if (*missing) {
            missing_keys.push_back(**missing);
        }
    }
    for (const auto& email : emails) {
        const auto owner = m_index.lookup_primary_fingerprint(Identifier{email});
        if (owner && *owner != primary) {
            log->info("Email {} is linked to {}, refusing to move it to {}", email.to_string(),
                      owner->to_string(), primary.to_string());
            return std::unexpected(make_error(
                errc::kCollision, std::format("Email collision for {}", email.to_string())));
        }
    }

    std::vector<Fingerprint> dropped_keys;
    std::vector<Email> dropped_emails;
    auto previous_record = m_store.read(Tier::kPublished, primary);
    if (!previous_record) {
        return std::unexpected(previous_record.error());
    }
    if (*previous_record) {
        auto previous = parser.parse(**previous_record);
        if (!previous) {
            return std::unexpected(previous.error());
        }
        for (const auto& key : (*previous)->capable_key_fingerprints()) {
            if (std::ranges::find(keys, key) == keys.end()) {
                dropped_keys.push_back(key);
            }
        }
        for (const auto& email : (*previous)->emails()) {
            if (std::ranges::find(emails, email) == emails.end()) {
                dropped_emails.push_back(email);
            }
        }
    }

    if (auto result = m_store.write(Tier::kFull, primary, record); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = m_store.write(Tier::kPublished, primary, record); !result) {
        return std::unexpected(result.error());
    }

    ImportSummary summary;
    for (const auto& key : dropped_keys) {
        if (auto result = m_index.unlink_fingerprint(key, primary); !result) {
            return std::unexpected(result.error());
        }
        ++summary.unlinked_keys;
    }
    for (const auto& email : dropped_emails) {
        if (auto result = m_index.unlink(Identifier{email}, primary); !result) {
            return std::unexpected(result.error());
        }
        ++summary.unlinked_emails;
    }
    for (const auto& key : missing_keys) {
        if (auto result = m_index.link_fingerprint(key, primary); !result) {
            return std::unexpected(result.error());
        }
        ++summary.linked_keys;
    }
    for (const auto& email : emails) {
        if (auto result = m_index.link(Identifier{email}, primary); !result) {
            return std::unexpected(result.error());
        }
        ++summary.linked_emails;
    }

    log->debug("Imported {}: {} keys and {} emails linked, {} keys and {} emails unlinked",
               primary.to_string(), summary.linked_keys, summary.linked_emails,
               summary.unlinked_keys, summary.unlinked_emails);
    return summary;
}

keydir::Result<storage::CheckSummary> Database::check_consistency(const CertificateParser& parser) const
{
    storage::ConsistencyChecker checker(m_store, m_index, parser);
    return checker.run();
}

}  // namespace keydir
