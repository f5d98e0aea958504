/**
 * @file consistency.cpp
 * @brief Forward and reverse index verification
 */

#include "keydir/consistency.hpp"

#include "keydir/logging.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <system_error>
#include <vector>

namespace keydir::storage {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] keydir::Error malformed_path(const fs::path& path)
{
    return make_error(errc::kMalformedPath, std::format("Malformed path: {}", path.string()));
}

/// Non-directory entries below @p dir in lexicographic order
[[nodiscard]] keydir::Result<std::vector<fs::path>> collect_entries(const fs::path& dir)
{
    std::vector<fs::path> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to walk {}: {}", dir.string(), ec.message())));
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(make_error(
                errc::kIOError, std::format("Failed to walk {}: {}", dir.string(), ec.message())));
        }
        std::error_code status_ec;
        const auto status = it->symlink_status(status_ec);
        if (status_ec) {
            return std::unexpected(make_error(errc::kIOError,
                                              std::format("Failed to stat {}: {}",
                                                          it->path().string(),
                                                          status_ec.message())));
        }
        if (fs::is_directory(status)) {
            continue;
        }
        entries.push_back(it->path());
    }
    if (ec) {
        return std::unexpected(make_error(
            errc::kIOError, std::format("Failed to walk {}: {}", dir.string(), ec.message())));
    }
    std::ranges::sort(entries);
    return entries;
}

}  // namespace

ConsistencyChecker::ConsistencyChecker(const RecordStore& store,
                                       const IndexManager& index,
                                       const keydir::CertificateParser& parser)
    : m_store(store)
    , m_index(index)
    , m_parser(parser)
{}

keydir::Result<CheckSummary> ConsistencyChecker::run() const
{
    const PathLayout& layout = m_store.layout();
    Cache cache;
    CheckSummary summary;

    // Published records carry the certificate named by their own path
    auto published = perform_checks(
        layout.tier_dir(Tier::kPublished),
        cache,
        [](const fs::path& path, const keydir::Certificate& cert, const Fingerprint& primary)
            -> keydir::VoidResult {
            const Fingerprint actual = cert.primary_fingerprint();
            if (actual != primary) {
                return std::unexpected(make_error(
                    check_errc::kPathIdentityViolation,
                    std::format("{} points to the wrong certificate, expected {} but found {}",
                                path.string(),
                                primary.to_string(),
                                actual.to_string())));
            }
            return {};
        });
    if (!published) {
        return std::unexpected(published.error());
    }
    summary.published_records = *published;

    // Every capable key is reachable by fingerprint and key id
    auto subkeys = perform_checks(
        layout.tier_dir(Tier::kPublished),
        cache,
        [this](const fs::path&, const keydir::Certificate& cert, const Fingerprint& primary)
            -> keydir::VoidResult {
            for (const auto& key : cert.capable_key_fingerprints()) {
                auto missing = m_index.check(key, primary);
                if (!missing) {
                    return std::unexpected(missing.error());
                }
                if (*missing) {
                    return std::unexpected(make_error(
                        check_errc::kMissingKeyLink,
                        std::format("Missing link to key {} for sub {}",
                                    primary.to_string(),
                                    (*missing)->to_string())));
                }
            }
            return {};
        });
    if (!subkeys) {
        return std::unexpected(subkeys.error());
    }

    // Every user id email is reachable by email
    auto emails = perform_checks(
        layout.tier_dir(Tier::kPublished),
        cache,
        [this, &layout](const fs::path&, const keydir::Certificate& cert, const Fingerprint& primary)
            -> keydir::VoidResult {
            for (const auto& email : cert.emails()) {
                const Identifier id{email};
                std::error_code ec;
                if (!fs::exists(layout.link_path(id), ec)) {
                    return std::unexpected(make_error(
                        check_errc::kMissingEmailLink,
                        std::format("Missing link to key {} for email {}",
                                    primary.to_string(),
                                    email.to_string())));
                }
                // The link exists but may belong to another certificate
                const auto owner = m_index.lookup_primary_fingerprint(id);
                if (owner != primary) {
                    return std::unexpected(make_error(
                        check_errc::kMissingEmailLink,
                        std::format("Link for email {} resolves to {} instead of key {}",
                                    email.to_string(),
                                    owner ? owner->to_string() : std::string("an unknown target"),
                                    primary.to_string())));
                }
            }
            return {};
        });
    if (!emails) {
        return std::unexpected(emails.error());
    }

    for (const IndexKind kind : {IndexKind::kByFingerprint, IndexKind::kByKeyId}) {
        auto links = perform_checks(
            layout.index_dir(kind),
            cache,
            [kind](const fs::path& path, const keydir::Certificate& cert, const Fingerprint&) {
                return check_key_entry(path, cert, kind);
            });
        if (!links) {
            return std::unexpected(links.error());
        }
        summary.key_links += *links;
    }

    auto email_links = perform_checks(
        layout.index_dir(IndexKind::kByEmail),
        cache,
        [](const fs::path& path, const keydir::Certificate& cert, const Fingerprint&)
            -> keydir::VoidResult {
            auto email = path_to_email(path);
            if (!email) {
                return std::unexpected(malformed_path(path));
            }
            if (!cert.has_email(*email)) {
                return std::unexpected(make_error(
                    check_errc::kForeignEmailLink,
                    std::format("{} points to the wrong certificate, the certificate does not "
                                "contain the email {}",
                                path.string(),
                                email->to_string())));
            }
            return {};
        });
    if (!email_links) {
        return std::unexpected(email_links.error());
    }
    summary.email_links = *email_links;

    logging::logger()->info("Consistency check passed: {} records, {} key links, {} email links",
                            summary.published_records,
                            summary.key_links,
                            summary.email_links);
    return summary;
}

keydir::Result<std::size_t> ConsistencyChecker::perform_checks(const fs::path& dir,
                                                               Cache& cache,
                                                               const EntryCheck& check) const
{
    auto entries = collect_entries(dir);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    for (const auto& path : *entries) {
        // The owning certificate follows from the path alone
        auto primary = path_to_primary(path);
        if (!primary) {
            return std::unexpected(malformed_path(path));
        }
        auto cert = load(path, *primary, cache);
        if (!cert) {
            return std::unexpected(cert.error());
        }
        if (auto result = check(path, **cert, *primary); !result) {
            return std::unexpected(result.error());
        }
    }
    return entries->size();
}

keydir::Result<const keydir::Certificate*>
ConsistencyChecker::load(const fs::path& path, const Fingerprint& primary, Cache& cache) const
{
    if (auto it = cache.find(primary); it != cache.end()) {
        return it->second.get();
    }

    auto record = m_store.read(Tier::kPublished, primary);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!*record) {
        return std::unexpected(make_error(
            check_errc::kBrokenLink,
            std::format("Broken link {}: no published certificate {}", path.string(), primary.to_string())));
    }
    auto cert = m_parser.parse(**record);
    if (!cert) {
        return std::unexpected(Error::make(
            cert.error().code,
            std::format("Failed to load certificate {}: {}", primary.to_string(), cert.error().message)));
    }
    const keydir::Certificate* loaded = cert->get();
    cache.emplace(primary, std::move(*cert));
    return loaded;
}

keydir::VoidResult ConsistencyChecker::check_key_entry(const fs::path& path,
                                                       const keydir::Certificate& cert,
                                                       IndexKind kind)
{
    bool found = false;
    std::string id;
    if (kind == IndexKind::kByFingerprint) {
        auto fingerprint = path_to_fingerprint(path);
        if (!fingerprint) {
            return std::unexpected(malformed_path(path));
        }
        found = cert.has_key(*fingerprint);
        id = fingerprint->to_string();
    } else {
        auto key_id = path_to_keyid(path);
        if (!key_id) {
            return std::unexpected(malformed_path(path));
        }
        found = cert.has_key(*key_id);
        id = key_id->to_string();
    }
    if (!found) {
        return std::unexpected(make_error(
            check_errc::kForeignKeyLink,
            std::format("{} points to the wrong certificate, the certificate does not "
                        "contain the (sub)key {}",
                        path.string(),
                        id)));
    }
    return {};
}

}  // namespace keydir::storage
