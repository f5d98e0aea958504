#pragma once

/**
 * @file consistency.hpp
 * @brief Whole-tree verification of records against their indices
 *
 * Checks, in order, aborting at the first violation:
 *   1. every published record decodes to the primary fingerprint of the
 *      certificate it holds                              (PathIdentityViolation)
 *   2. every capable key of a published certificate has a by-fpr and a
 *      by-keyid entry resolving to it                    (MissingKeyLink, Collision)
 *   3. every email of a published certificate has a by-email entry
 *                                                         (MissingEmailLink)
 *   4. every by-fpr / by-keyid entry names a key of its target
 *                                                         (ForeignKeyLink)
 *   5. every by-email entry names an email of its target  (ForeignEmailLink)
 *
 * Entries that do not decode report MalformedPath, entries whose target
 * record is missing report BrokenLink. The checker never repairs.
 */

#include "keydir/certificate.hpp"
#include "keydir/common.hpp"
#include "keydir/index.hpp"
#include "keydir/store.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace keydir::storage {

namespace check_errc {
inline constexpr std::string_view kBrokenLink = "BrokenLink";
inline constexpr std::string_view kPathIdentityViolation = "PathIdentityViolation";
inline constexpr std::string_view kMissingKeyLink = "MissingKeyLink";
inline constexpr std::string_view kMissingEmailLink = "MissingEmailLink";
inline constexpr std::string_view kForeignKeyLink = "ForeignKeyLink";
inline constexpr std::string_view kForeignEmailLink = "ForeignEmailLink";
}  // namespace check_errc

struct CheckSummary
{
    std::size_t published_records = 0;
    std::size_t key_links = 0;
    std::size_t email_links = 0;
};

class ConsistencyChecker
{
public:
    ConsistencyChecker(const RecordStore& store,
                       const IndexManager& index,
                       const keydir::CertificateParser& parser);

    [[nodiscard]] keydir::Result<CheckSummary> run() const;

private:
    /// Certificates loaded during one pass, keyed by primary fingerprint
    using Cache = std::unordered_map<Fingerprint, std::unique_ptr<keydir::Certificate>>;
    using EntryCheck = std::function<keydir::VoidResult(
        const std::filesystem::path&, const keydir::Certificate&, const Fingerprint&)>;

    /**
     * @brief Run @p check on every non-directory entry below @p dir
     * @return Number of entries checked, or the first violation
     */
    [[nodiscard]] keydir::Result<std::size_t>
    perform_checks(const std::filesystem::path& dir, Cache& cache, const EntryCheck& check) const;

    [[nodiscard]] keydir::Result<const keydir::Certificate*>
    load(const std::filesystem::path& path, const Fingerprint& primary, Cache& cache) const;

    [[nodiscard]] static keydir::VoidResult check_key_entry(const std::filesystem::path& path,
                                                            const keydir::Certificate& cert,
                                                            IndexKind kind);

    const RecordStore& m_store;
    const IndexManager& m_index;
    const keydir::CertificateParser& m_parser;
};

}  // namespace keydir::storage
