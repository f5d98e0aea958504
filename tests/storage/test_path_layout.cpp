/**
 * @file test_path_layout.cpp
 * @brief Sharding, percent-encoding and identifier path mapping tests
 */

#include "keydir/path_layout.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

using namespace keydir::storage;
using keydir::Identifier;
using keydir::IndexKind;
using keydir::KeyId;
using keydir::test::TempDir;
namespace fs = std::filesystem;

TEST(Shard, SplitsIntoThreeLevels)
{
    EXPECT_EQ(shard("0123456789ABCDEF"), fs::path("01/23/456789ABCDEF"));
    EXPECT_EQ(shard("abcde"), fs::path("ab/cd/e"));
    EXPECT_EQ(shard("abcd"), fs::path("abcd"));
    EXPECT_EQ(shard("a"), fs::path("a"));
}

TEST(Shard, MergeInvertsShard)
{
    EXPECT_EQ(merge(shard("0123456789ABCDEF")), "0123456789ABCDEF");
    EXPECT_EQ(merge("/srv/keys/pub/AB/CD/EF01"), "ABCDEF01");
    EXPECT_EQ(merge("../../../../pub/AB/CD/EF01"), "ABCDEF01");
    EXPECT_EQ(merge("AB/CD/EF01/"), "ABCDEF01");
    EXPECT_EQ(merge("abcd"), "abcd");
}

TEST(PercentEncode, EmailAddresses)
{
    EXPECT_EQ(percent_encode("alice@example.org"), "alice%40example%2Eorg");
    EXPECT_EQ(percent_encode("a b"), "a+b");
    EXPECT_EQ(percent_encode("x-y_z*"), "x-y_z*");
    EXPECT_EQ(percent_encode("a/b"), "a%2Fb");
    EXPECT_EQ(percent_encode(".."), "%2E%2E");
}

TEST(PercentEncode, DecodeInvertsEncode)
{
    for (const char* text : {"alice@example.org", "o'brien+tag@example.org", "a b/c..d", "\xc3\xa9@x"}) {
        auto decoded = percent_decode(percent_encode(text));
        ASSERT_TRUE(decoded.has_value()) << text;
        EXPECT_EQ(*decoded, text);
    }
    EXPECT_EQ(percent_decode("alice%40example.org"), "alice@example.org");
}

TEST(PercentEncode, RejectsBadEscapes)
{
    EXPECT_FALSE(percent_decode("abc%4").has_value());
    EXPECT_FALSE(percent_decode("abc%").has_value());
    EXPECT_FALSE(percent_decode("abc%zz").has_value());
}

TEST(PathLayout, RecordPaths)
{
    PathLayout layout("/int", "/ext");
    const auto fpr = keydir::test::fpr('A', "0123");

    EXPECT_EQ(layout.record_path(Tier::kFull, fpr),
              fs::path("/int/full/AA/AA") / (std::string(32, 'A') + "0123"));
    EXPECT_EQ(layout.record_path(Tier::kQuarantined, fpr),
              fs::path("/int/quarantined") / fpr.to_string());
    EXPECT_EQ(layout.record_path(Tier::kPublished, fpr),
              fs::path("/ext/pub/AA/AA") / (std::string(32, 'A') + "0123"));
}

TEST(PathLayout, LinkPaths)
{
    PathLayout layout("/int", "/ext");
    const auto fpr = keydir::test::fpr('B');
    const auto email = keydir::test::email("alice@example.org");

    EXPECT_EQ(layout.link_path(Identifier{fpr}),
              fs::path("/ext/links/by-fpr/BB/BB") / std::string(36, 'B'));
    EXPECT_EQ(layout.link_path(Identifier{KeyId::from(fpr)}),
              fs::path("/ext/links/by-keyid/BB/BB") / std::string(12, 'B'));
    EXPECT_EQ(layout.link_path(Identifier{email}),
              fs::path("/ext/links/by-email/al/ic/e%40example%2Eorg"));
    EXPECT_EQ(layout.index_dir(IndexKind::kByEmail), fs::path("/ext/links/by-email"));
}

TEST(PathLayout, LinkTargetIsRelative)
{
    PathLayout layout("/int", "/ext");
    const auto key = keydir::test::fpr('B');
    const auto primary = keydir::test::fpr('A');
    const auto link = layout.link_path(Identifier{key});

    const auto target = layout.link_target(link, primary);
    EXPECT_TRUE(target.is_relative());
    EXPECT_EQ(target, fs::path("../../../../pub/AA/AA") / std::string(36, 'A'));
    EXPECT_EQ((link.parent_path() / target).lexically_normal(),
              layout.record_path(Tier::kPublished, primary));
}

TEST(PathLayout, ReverseMappings)
{
    PathLayout layout("/int", "/ext");
    const auto fpr = keydir::test::fpr('C', "0042");
    const auto email = keydir::test::email("bob@example.org");

    EXPECT_EQ(path_to_fingerprint(layout.record_path(Tier::kPublished, fpr)), fpr);
    EXPECT_EQ(path_to_fingerprint(layout.link_path(Identifier{fpr})), fpr);
    EXPECT_EQ(path_to_keyid(layout.link_path(Identifier{KeyId::from(fpr)})), KeyId::from(fpr));
    EXPECT_EQ(path_to_email(layout.link_path(Identifier{email})), email);

    EXPECT_FALSE(path_to_fingerprint("/ext/pub/AB/CD/xyz").has_value());
    EXPECT_FALSE(path_to_keyid("/ext/links/by-keyid/AB/CD").has_value());
    // Non-canonical spellings never come out of link_path
    EXPECT_FALSE(path_to_email("/ext/links/by-email/Bo/b%/40example%2Eorg").has_value());
    EXPECT_FALSE(path_to_email("/ext/links/by-email/bo/b%/4").has_value());
    EXPECT_FALSE(path_to_email("/ext/links/by-email/bo/b%/40example%2eorg").has_value());
    EXPECT_FALSE(path_to_email("/ext/links/by-email/bo/b@/example.org").has_value());
}

TEST(PathLayout, PathToPrimaryFollowsOneSymlink)
{
    TempDir temp_dir("keydir_path_to_primary_test");
    PathLayout layout(temp_dir.path(), temp_dir.path());
    const auto primary = keydir::test::fpr('D');
    const auto key = keydir::test::fpr('E');

    const auto published = layout.record_path(Tier::kPublished, primary);
    fs::create_directories(published.parent_path());
    { std::ofstream(published) << "record"; }
    const auto link = layout.link_path(Identifier{key});
    fs::create_directories(link.parent_path());
    fs::create_symlink(layout.link_target(link, primary), link);

    EXPECT_EQ(path_to_primary(published), primary);
    EXPECT_EQ(path_to_primary(link), primary);
    EXPECT_FALSE(path_to_primary(temp_dir.path() / "missing").has_value());
}

TEST(Tier, Names)
{
    EXPECT_EQ(to_string(Tier::kFull), "full");
    EXPECT_EQ(to_string(Tier::kQuarantined), "quarantined");
    EXPECT_EQ(to_string(Tier::kPublished), "pub");
}
