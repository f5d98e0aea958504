/**
 * @file certificate.cpp
 * @brief Membership helpers shared by all Certificate implementations
 */

#include "keydir/certificate.hpp"

#include <algorithm>

namespace keydir {

bool Certificate::has_key(const Fingerprint& fingerprint) const
{
    return std::ranges::contains(key_fingerprints(), fingerprint);
}

bool Certificate::has_key(const KeyId& key_id) const
{
    return std::ranges::any_of(key_fingerprints(), [&key_id](const Fingerprint& fingerprint) {
        return KeyId::from(fingerprint) == key_id;
    });
}

bool Certificate::has_email(const Email& email) const
{
    return std::ranges::contains(emails(), email);
}

}  // namespace keydir
