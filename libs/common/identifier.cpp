/**
 * @file identifier.cpp
 * @brief Identifier parsing and canonical forms
 */

#include "keydir/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>

namespace keydir {

namespace {

[[nodiscard]] std::optional<std::string> parse_hex(std::string_view text, std::size_t length)
{
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    if (text.size() != length) {
        return std::nullopt;
    }
    if (!std::ranges::all_of(text, [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        return std::nullopt;
    }
    std::string hex(text);
    std::ranges::transform(hex, hex.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::toupper(c));
    });
    return hex;
}

}  // namespace

std::optional<Fingerprint> Fingerprint::parse(std::string_view text)
{
    auto hex = parse_hex(text, kLength);
    if (!hex) {
        return std::nullopt;
    }
    return Fingerprint(std::move(*hex));
}

std::optional<KeyId> KeyId::parse(std::string_view text)
{
    auto hex = parse_hex(text, kLength);
    if (!hex) {
        return std::nullopt;
    }
    return KeyId(std::move(*hex));
}

KeyId KeyId::from(const Fingerprint& fingerprint)
{
    const std::string& hex = fingerprint.to_string();
    return KeyId(hex.substr(hex.size() - kLength));
}

std::optional<Email> Email::parse(std::string_view text)
{
    const auto at = text.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 == text.size()
        || text.find('@', at + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    if (std::ranges::any_of(text, [](unsigned char c) {
            return std::isspace(c) != 0 || std::iscntrl(c) != 0;
        })) {
        return std::nullopt;
    }
    std::string address(text);
    std::ranges::transform(address, address.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return Email(std::move(address));
}

IndexKind index_kind_of(const Identifier& identifier) noexcept
{
    switch (identifier.index()) {
    case 0:
        return IndexKind::kByFingerprint;
    case 1:
        return IndexKind::kByKeyId;
    default:
        return IndexKind::kByEmail;
    }
}

std::string to_string(const Identifier& identifier)
{
    return std::visit([](const auto& value) { return value.to_string(); }, identifier);
}

std::string_view to_string(IndexKind kind) noexcept
{
    switch (kind) {
    case IndexKind::kByFingerprint:
        return "by-fpr";
    case IndexKind::kByKeyId:
        return "by-keyid";
    case IndexKind::kByEmail:
        return "by-email";
    }
    return "unknown";
}

}  // namespace keydir
