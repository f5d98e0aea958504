/**
 * @file descriptor.cpp
 * @brief cert_descriptor.v1 parsing and serialization
 */

#include "keydir/descriptor.hpp"

#include "keydir/schema_validate.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace keydir::certificate {

namespace {

constexpr std::string_view kSchemaName = "cert_descriptor.v1";

[[nodiscard]] keydir::Error invalid_identifier(std::string_view what, const std::string& value)
{
    return make_error(errc::kInvalidIdentifier,
                      std::string("Invalid ") + std::string(what) + " in descriptor: " + value);
}

}  // namespace

Descriptor::Descriptor(Fingerprint primary,
                       std::vector<KeyEntry> keys,
                       std::vector<Email> emails,
                       bool revoked)
    : m_primary(std::move(primary))
    , m_keys(std::move(keys))
    , m_emails(std::move(emails))
    , m_revoked(revoked)
{}

keydir::Result<Descriptor> Descriptor::from_json(const nlohmann::json& payload,
                                                 const std::filesystem::path& schema_dir)
{
    if (auto result =
            keydir::common::validate_json(payload,
                                          keydir::common::schema_file(schema_dir, kSchemaName));
        !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "Certificate descriptor schema validation failed: "
                                               + result.error().message));
    }

    const auto primary_text = payload.at("primary").get<std::string>();
    auto primary = Fingerprint::parse(primary_text);
    if (!primary) {
        return std::unexpected(invalid_identifier("primary fingerprint", primary_text));
    }

    std::vector<KeyEntry> keys;
    for (const auto& key : payload.at("keys")) {
        const auto text = key.at("fingerprint").get<std::string>();
        auto fingerprint = Fingerprint::parse(text);
        if (!fingerprint) {
            return std::unexpected(invalid_identifier("key fingerprint", text));
        }
        keys.push_back(KeyEntry{.fingerprint = std::move(*fingerprint),
                                .certify = key.value("certify", false),
                                .sign = key.value("sign", false)});
    }
    if (std::ranges::none_of(keys, [&primary](const KeyEntry& entry) {
            return entry.fingerprint == *primary;
        })) {
        return std::unexpected(make_error(
            errc::kInvalidIdentifier, "Descriptor primary " + primary->to_string() + " is not among its keys"));
    }

    std::vector<Email> emails;
    for (const auto& item : payload.at("emails")) {
        const auto text = item.get<std::string>();
        auto email = Email::parse(text);
        if (!email) {
            return std::unexpected(invalid_identifier("email", text));
        }
        if (!std::ranges::contains(emails, *email)) {
            emails.push_back(std::move(*email));
        }
    }

    return Descriptor(std::move(*primary), std::move(keys), std::move(emails),
                      payload.value("revoked", false));
}

nlohmann::json Descriptor::to_json() const
{
    nlohmann::json keys = nlohmann::json::array();
    for (const auto& key : m_keys) {
        keys.push_back({
            {"fingerprint", key.fingerprint.to_string()},
            {    "certify",                 key.certify},
            {       "sign",                    key.sign}
        });
    }
    nlohmann::json emails = nlohmann::json::array();
    for (const auto& email : m_emails) {
        emails.push_back(email.to_string());
    }
    return nlohmann::json{
        {"schema_version",             kSchemaName},
        {       "primary", m_primary.to_string()},
        {          "keys",        std::move(keys)},
        {        "emails",      std::move(emails)},
        {       "revoked",              m_revoked}
    };
}

keydir::Result<std::string> Descriptor::serialize() const
{
    // nlohmann::json objects keep keys sorted, so equal descriptors serialize identically
    try {
        return to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::strict) + '\n';
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(make_error(errc::kParseError,
                                          std::string("Failed to serialize descriptor: ") + ex.what()));
    }
}

std::vector<Fingerprint> Descriptor::key_fingerprints() const
{
    std::vector<Fingerprint> result;
    result.reserve(m_keys.size());
    for (const auto& key : m_keys) {
        result.push_back(key.fingerprint);
    }
    return result;
}

std::vector<Fingerprint> Descriptor::capable_key_fingerprints() const
{
    std::vector<Fingerprint> result;
    for (const auto& key : m_keys) {
        if (key.certify || key.sign) {
            result.push_back(key.fingerprint);
        }
    }
    return result;
}

DescriptorParser::DescriptorParser(std::filesystem::path schema_dir)
    : m_schema_dir(std::move(schema_dir))
{}

keydir::Result<std::unique_ptr<keydir::Certificate>>
DescriptorParser::parse(std::string_view record) const
{
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(record);
    } catch (const std::exception& ex) {
        return std::unexpected(make_error(
            errc::kParseError, std::string("Failed to parse certificate descriptor: ") + ex.what()));
    }
    auto descriptor = Descriptor::from_json(payload, m_schema_dir);
    if (!descriptor) {
        return std::unexpected(descriptor.error());
    }
    return std::make_unique<Descriptor>(std::move(*descriptor));
}

}  // namespace keydir::certificate
