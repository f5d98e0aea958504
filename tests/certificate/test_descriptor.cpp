/**
 * @file test_descriptor.cpp
 * @brief Certificate descriptor parsing tests
 */

#include "keydir/descriptor.hpp"

#include "test_support.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using keydir::certificate::Descriptor;
using keydir::certificate::DescriptorParser;
using json = nlohmann::json;

namespace {

const std::string kPrimary = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA";
const std::string kSigning = "BBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBB";
const std::string kEncryption = "CCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCC";

json make_descriptor_json()
{
    return json{
        {"schema_version", "cert_descriptor.v1"},
        {"primary", kPrimary},
        {"keys",
         json::array({json{{"fingerprint", kPrimary}, {"certify", true}, {"sign", false}},
                      json{{"fingerprint", kSigning}, {"certify", false}, {"sign", true}},
                      json{{"fingerprint", kEncryption}, {"certify", false}, {"sign", false}}})},
        {"emails", json::array({"Alice@Example.org", "alice@example.org", "bob@example.org"})},
        {"revoked", false}
    };
}

}  // namespace

TEST(Descriptor, FromJson)
{
    auto cert = Descriptor::from_json(make_descriptor_json(), KEYDIR_SCHEMA_DIR);
    ASSERT_TRUE(cert.has_value()) << cert.error().message;

    EXPECT_EQ(cert->primary_fingerprint().to_string(), kPrimary);
    EXPECT_EQ(cert->key_fingerprints().size(), 3U);
    ASSERT_EQ(cert->capable_key_fingerprints().size(), 2U);
    EXPECT_EQ(cert->capable_key_fingerprints()[1].to_string(), kSigning);
    // Case-folded duplicates collapse
    ASSERT_EQ(cert->emails().size(), 2U);
    EXPECT_EQ(cert->emails()[0].to_string(), "alice@example.org");
    EXPECT_FALSE(cert->is_revoked());
}

TEST(Descriptor, Membership)
{
    auto cert = Descriptor::from_json(make_descriptor_json(), KEYDIR_SCHEMA_DIR);
    ASSERT_TRUE(cert.has_value()) << cert.error().message;

    EXPECT_TRUE(cert->has_key(keydir::test::fpr('C')));
    EXPECT_TRUE(cert->has_key(keydir::KeyId::from(keydir::test::fpr('B'))));
    EXPECT_FALSE(cert->has_key(keydir::test::fpr('D')));
    EXPECT_TRUE(cert->has_email(keydir::test::email("BOB@example.org")));
    EXPECT_FALSE(cert->has_email(keydir::test::email("carol@example.org")));
}

TEST(Descriptor, RejectsPrimaryNotAmongKeys)
{
    json payload = make_descriptor_json();
    payload["primary"] = "DDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDD";
    auto cert = Descriptor::from_json(payload, KEYDIR_SCHEMA_DIR);
    ASSERT_FALSE(cert.has_value());
    EXPECT_EQ(cert.error().code, "InvalidIdentifier");
}

TEST(Descriptor, RejectsInvalidEmail)
{
    json payload = make_descriptor_json();
    payload["emails"] = json::array({"not-an-email"});
    auto cert = Descriptor::from_json(payload, KEYDIR_SCHEMA_DIR);
    ASSERT_FALSE(cert.has_value());
    EXPECT_EQ(cert.error().code, "InvalidIdentifier");
}

TEST(Descriptor, RejectsSchemaViolation)
{
    json payload = make_descriptor_json();
    payload["extra"] = 1;
    auto cert = Descriptor::from_json(payload, KEYDIR_SCHEMA_DIR);
    ASSERT_FALSE(cert.has_value());
    EXPECT_EQ(cert.error().code, "SchemaValidationFailed");

    payload = make_descriptor_json();
    payload["primary"] = "0123";
    cert = Descriptor::from_json(payload, KEYDIR_SCHEMA_DIR);
    ASSERT_FALSE(cert.has_value());
    EXPECT_EQ(cert.error().code, "SchemaValidationFailed");
}

TEST(DescriptorParser, ParsesSerializedRecord)
{
    auto cert = Descriptor::from_json(make_descriptor_json(), KEYDIR_SCHEMA_DIR);
    ASSERT_TRUE(cert.has_value()) << cert.error().message;
    auto record = cert->serialize();
    ASSERT_TRUE(record.has_value()) << record.error().message;

    DescriptorParser parser(KEYDIR_SCHEMA_DIR);
    auto parsed = parser.parse(*record);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ((*parsed)->primary_fingerprint(), cert->primary_fingerprint());
    EXPECT_EQ((*parsed)->emails(), cert->emails());
    EXPECT_EQ((*parsed)->capable_key_fingerprints(), cert->capable_key_fingerprints());
}

TEST(DescriptorParser, SerializationIsStable)
{
    auto cert = Descriptor::from_json(make_descriptor_json(), KEYDIR_SCHEMA_DIR);
    ASSERT_TRUE(cert.has_value()) << cert.error().message;
    auto first = cert->serialize();
    auto second = cert->serialize();
    ASSERT_TRUE(first.has_value() && second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(DescriptorParser, RejectsGarbage)
{
    DescriptorParser parser(KEYDIR_SCHEMA_DIR);
    auto parsed = parser.parse("-----BEGIN PGP PUBLIC KEY BLOCK-----");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, "ParseError");
}
