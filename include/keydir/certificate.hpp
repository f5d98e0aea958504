#pragma once

/**
 * @file certificate.hpp
 * @brief Read-only certificate capability used by the storage engine
 *
 * The engine never parses or merges certificates itself. It only needs
 * to know which identifiers a certificate claims.
 */

#include "keydir/common.hpp"
#include "keydir/identifier.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace keydir {

class Certificate
{
public:
    virtual ~Certificate() = default;

    [[nodiscard]] virtual Fingerprint primary_fingerprint() const = 0;

    /// Every key of the certificate, primary included
    [[nodiscard]] virtual std::vector<Fingerprint> key_fingerprints() const = 0;

    /// Keys that are certification- or signing-capable; these must be indexed
    [[nodiscard]] virtual std::vector<Fingerprint> capable_key_fingerprints() const = 0;

    /// Email addresses of the certificate's user ids
    [[nodiscard]] virtual std::vector<Email> emails() const = 0;

    [[nodiscard]] virtual bool is_revoked() const = 0;

    [[nodiscard]] bool has_key(const Fingerprint& fingerprint) const;
    [[nodiscard]] bool has_key(const KeyId& key_id) const;
    [[nodiscard]] bool has_email(const Email& email) const;
};

/**
 * @brief Turns stored record bytes back into a Certificate
 */
class CertificateParser
{
public:
    virtual ~CertificateParser() = default;

    [[nodiscard]] virtual keydir::Result<std::unique_ptr<Certificate>>
    parse(std::string_view record) const = 0;
};

}  // namespace keydir
