#pragma once

/**
 * @file descriptor.hpp
 * @brief JSON certificate descriptor (cert_descriptor.v1)
 *
 * A descriptor lists what a certificate claims without carrying any key
 * material:
 *
 *   {
 *     "schema_version": "cert_descriptor.v1",
 *     "primary": "<40 hex>",
 *     "keys": [{"fingerprint": "<40 hex>", "certify": true, "sign": false}, ...],
 *     "emails": ["alice@example.org", ...],
 *     "revoked": false
 *   }
 */

#include "keydir/certificate.hpp"
#include "keydir/common.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace keydir::certificate {

struct KeyEntry
{
    Fingerprint fingerprint;
    bool certify;
    bool sign;
};

class Descriptor : public keydir::Certificate
{
public:
    Descriptor(Fingerprint primary, std::vector<KeyEntry> keys, std::vector<Email> emails, bool revoked);

    /**
     * @brief Build a descriptor from JSON, validating it against its schema
     * @return Descriptor or error (schema, identifier or primary-key mismatch)
     */
    [[nodiscard]] static keydir::Result<Descriptor>
    from_json(const nlohmann::json& payload, const std::filesystem::path& schema_dir);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Record bytes: indented JSON with sorted keys and a trailing newline
    [[nodiscard]] keydir::Result<std::string> serialize() const;

    [[nodiscard]] Fingerprint primary_fingerprint() const override { return m_primary; }
    [[nodiscard]] std::vector<Fingerprint> key_fingerprints() const override;
    [[nodiscard]] std::vector<Fingerprint> capable_key_fingerprints() const override;
    [[nodiscard]] std::vector<Email> emails() const override { return m_emails; }
    [[nodiscard]] bool is_revoked() const override { return m_revoked; }

private:
    Fingerprint m_primary;
    std::vector<KeyEntry> m_keys;
    std::vector<Email> m_emails;
    bool m_revoked;
};

/**
 * @brief CertificateParser for records holding a descriptor
 */
class DescriptorParser : public keydir::CertificateParser
{
public:
    explicit DescriptorParser(std::filesystem::path schema_dir);

    [[nodiscard]] keydir::Result<std::unique_ptr<keydir::Certificate>>
    parse(std::string_view record) const override;

private:
    std::filesystem::path m_schema_dir;
};

}  // namespace keydir::certificate
