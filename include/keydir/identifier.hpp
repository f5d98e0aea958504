#pragma once

/**
 * @file identifier.hpp
 * @brief Fingerprint, key-id and email value types
 *
 * Validation here is intentionally shallow: callers hand the engine
 * identifiers that were already validated upstream. Parsing only has to
 * be strict enough to reject strings that cannot have come from the
 * forward path mapping.
 */

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace keydir {

/// Primary or subkey fingerprint: 40 hex characters, upper case
class Fingerprint
{
public:
    static constexpr std::size_t kLength = 40;

    [[nodiscard]] static std::optional<Fingerprint> parse(std::string_view text);

    [[nodiscard]] const std::string& to_string() const noexcept { return m_hex; }

    auto operator<=>(const Fingerprint&) const = default;

private:
    explicit Fingerprint(std::string hex)
        : m_hex(std::move(hex))
    {}

    std::string m_hex;
};

/// Key id: the last 16 hex characters of a fingerprint, upper case
class KeyId
{
public:
    static constexpr std::size_t kLength = 16;

    [[nodiscard]] static std::optional<KeyId> parse(std::string_view text);
    [[nodiscard]] static KeyId from(const Fingerprint& fingerprint);

    [[nodiscard]] const std::string& to_string() const noexcept { return m_hex; }

    auto operator<=>(const KeyId&) const = default;

private:
    explicit KeyId(std::string hex)
        : m_hex(std::move(hex))
    {}

    std::string m_hex;
};

/// User-id email address in canonical (lower case) form
class Email
{
public:
    [[nodiscard]] static std::optional<Email> parse(std::string_view text);

    [[nodiscard]] const std::string& to_string() const noexcept { return m_address; }

    auto operator<=>(const Email&) const = default;

private:
    explicit Email(std::string address)
        : m_address(std::move(address))
    {}

    std::string m_address;
};

/// Index family an identifier is looked up in
enum class IndexKind {
    kByFingerprint,
    kByKeyId,
    kByEmail,
};

using Identifier = std::variant<Fingerprint, KeyId, Email>;

[[nodiscard]] IndexKind index_kind_of(const Identifier& identifier) noexcept;
[[nodiscard]] std::string to_string(const Identifier& identifier);
[[nodiscard]] std::string_view to_string(IndexKind kind) noexcept;

}  // namespace keydir

template <>
struct std::hash<keydir::Fingerprint>
{
    std::size_t operator()(const keydir::Fingerprint& fingerprint) const noexcept
    {
        return std::hash<std::string>{}(fingerprint.to_string());
    }
};

template <>
struct std::hash<keydir::KeyId>
{
    std::size_t operator()(const keydir::KeyId& key_id) const noexcept
    {
        return std::hash<std::string>{}(key_id.to_string());
    }
};

template <>
struct std::hash<keydir::Email>
{
    std::size_t operator()(const keydir::Email& email) const noexcept
    {
        return std::hash<std::string>{}(email.to_string());
    }
};
