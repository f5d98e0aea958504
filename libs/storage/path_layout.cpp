/**
 * @file path_layout.cpp
 * @brief Sharded path layout and reverse mapping
 */

#include "keydir/path_layout.hpp"

#include "keydir/common.hpp"

#include <array>
#include <system_error>
#include <utility>
#include <vector>

namespace keydir::storage {

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kShardWidth = 2;
constexpr std::size_t kUnshardedMax = 4;
constexpr std::size_t kShardDepth = 3;

constexpr std::array<char, 16> kHexDigits =
    {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

[[nodiscard]] bool is_unreserved(unsigned char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-'
           || c == '_' || c == '*';
}

[[nodiscard]] int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string_view to_string(Tier tier) noexcept
{
    switch (tier) {
    case Tier::kFull:
        return "full";
    case Tier::kQuarantined:
        return "quarantined";
    case Tier::kPublished:
        return "pub";
    }
    return "unknown";
}

fs::path shard(std::string_view text)
{
    if (text.size() <= kUnshardedMax) {
        return fs::path(text);
    }
    fs::path result(text.substr(0, kShardWidth));
    result /= text.substr(kShardWidth, kShardWidth);
    result /= text.substr(2 * kShardWidth);
    return result;
}

std::string merge(const fs::path& path)
{
    std::vector<std::string> components;
    for (const auto& component : path) {
        components.push_back(component.string());
    }
    // A trailing separator yields an empty last component
    if (!components.empty() && components.back().empty()) {
        components.pop_back();
    }
    const std::size_t start =
        components.size() > kShardDepth ? components.size() - kShardDepth : 0UZ;
    std::string merged;
    for (std::size_t i = start; i < components.size(); ++i) {
        merged += components[i];
    }
    return merged;
}

std::string percent_encode(std::string_view text)
{
    std::string encoded;
    encoded.reserve(text.size());
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else if (c == ' ') {
            encoded.push_back('+');
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[c >> 4U]);
            encoded.push_back(kHexDigits[c & 0x0FU]);
        }
    }
    return encoded;
}

std::optional<std::string> percent_decode(std::string_view text)
{
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            decoded.push_back(' ');
            continue;
        }
        if (c != '%') {
            decoded.push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        const int high = hex_value(text[i + 1]);
        const int low = hex_value(text[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return decoded;
}

std::optional<Fingerprint> path_to_fingerprint(const fs::path& path)
{
    return Fingerprint::parse(merge(path));
}

std::optional<KeyId> path_to_keyid(const fs::path& path)
{
    return KeyId::parse(merge(path));
}

std::optional<Email> path_to_email(const fs::path& path)
{
    const std::string encoded = merge(path);
    auto decoded = percent_decode(encoded);
    if (!decoded) {
        return std::nullopt;
    }
    auto email = Email::parse(*decoded);
    // Only canonical addresses and their exact escaping round-trip through link_path
    if (!email || email->to_string() != *decoded
        || percent_encode(email->to_string()) != encoded) {
        return std::nullopt;
    }
    return email;
}

std::optional<Fingerprint> path_to_primary(const fs::path& path)
{
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec) {
        return std::nullopt;
    }
    if (fs::is_symlink(status)) {
        auto target = fs::read_symlink(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return path_to_fingerprint(target);
    }
    return path_to_fingerprint(path);
}

PathLayout::PathLayout(fs::path internal_dir, fs::path external_dir)
    : m_internal_dir(std::move(internal_dir))
    , m_external_dir(std::move(external_dir))
{}

fs::path PathLayout::tier_dir(Tier tier) const
{
    switch (tier) {
    case Tier::kFull:
        return m_internal_dir / "full";
    case Tier::kQuarantined:
        return m_internal_dir / "quarantined";
    case Tier::kPublished:
        break;
    }
    return m_external_dir / "pub";
}

fs::path PathLayout::index_dir(IndexKind kind) const
{
    return m_external_dir / "links" / std::string(keydir::to_string(kind));
}

fs::path PathLayout::record_path(Tier tier, const Fingerprint& fingerprint) const
{
    if (tier == Tier::kQuarantined) {
        return tier_dir(tier) / fingerprint.to_string();
    }
    return tier_dir(tier) / shard(fingerprint.to_string());
}

fs::path PathLayout::link_path(const Identifier& identifier) const
{
    const IndexKind kind = index_kind_of(identifier);
    if (kind == IndexKind::kByEmail) {
        return index_dir(kind) / shard(percent_encode(std::get<Email>(identifier).to_string()));
    }
    return index_dir(kind) / shard(keydir::to_string(identifier));
}

fs::path PathLayout::link_target(const fs::path& link, const Fingerprint& primary) const
{
    const fs::path published = record_path(Tier::kPublished, primary);
    return fs::path(
        keydir::common::make_relative(published.string(), link.parent_path().string()));
}

}  // namespace keydir::storage
