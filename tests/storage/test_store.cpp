/**
 * @file test_store.cpp
 * @brief Record tier tests
 */

#include "keydir/store.hpp"

#include "keydir/atomic_file.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

using namespace keydir::storage;
using keydir::Identifier;
using keydir::KeyId;
using keydir::StoreConfig;
using keydir::test::TempDir;
namespace fs = std::filesystem;

TEST(RecordStore, WriteAndReadEachTier)
{
    TempDir temp_dir("keydir_store_tiers_test");
    auto db = keydir::test::open_database(temp_dir.path());
    const auto fpr = keydir::test::fpr('A');

    auto full = db.write_to_full(fpr, "full record");
    ASSERT_TRUE(full.has_value()) << full.error().message;
    EXPECT_EQ(*full, db.layout().record_path(Tier::kFull, fpr));
    auto published = db.write_to_published(fpr, "published record");
    ASSERT_TRUE(published.has_value()) << published.error().message;
    auto quarantined = db.write_to_quarantine(fpr, "quarantined record");
    ASSERT_TRUE(quarantined.has_value()) << quarantined.error().message;
    EXPECT_EQ(quarantined->parent_path(), db.layout().tier_dir(Tier::kQuarantined));

    auto read_full = db.by_fpr_full(fpr);
    ASSERT_TRUE(read_full.has_value()) << read_full.error().message;
    EXPECT_EQ(*read_full, std::optional<std::string>("full record"));

    auto read_published = db.by_primary_fpr(fpr);
    ASSERT_TRUE(read_published.has_value()) << read_published.error().message;
    EXPECT_EQ(*read_published, std::optional<std::string>("published record"));

    auto read_quarantined = db.store().read(Tier::kQuarantined, fpr);
    ASSERT_TRUE(read_quarantined.has_value()) << read_quarantined.error().message;
    EXPECT_EQ(*read_quarantined, std::optional<std::string>("quarantined record"));
}

TEST(RecordStore, Permissions)
{
    TempDir temp_dir("keydir_store_perms_test");
    auto db = keydir::test::open_database(temp_dir.path());
    const auto fpr = keydir::test::fpr('B');

    auto full = db.write_to_full(fpr, "x");
    auto published = db.write_to_published(fpr, "x");
    auto quarantined = db.write_to_quarantine(fpr, "x");
    ASSERT_TRUE(full.has_value() && published.has_value() && quarantined.has_value());

    EXPECT_EQ(fs::status(*full).permissions() & fs::perms::all, kInternalPerms);
    EXPECT_EQ(fs::status(*quarantined).permissions() & fs::perms::all, kInternalPerms);
    EXPECT_EQ(fs::status(*published).permissions() & fs::perms::all, kPublicPerms);
}

TEST(RecordStore, ReplaceOverwrites)
{
    TempDir temp_dir("keydir_store_replace_test");
    auto db = keydir::test::open_database(temp_dir.path());
    const auto fpr = keydir::test::fpr('C');

    ASSERT_TRUE(db.write_to_published(fpr, "v1").has_value());
    ASSERT_TRUE(db.write_to_published(fpr, "v2").has_value());
    auto read = db.by_primary_fpr(fpr);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, std::optional<std::string>("v2"));
}

TEST(RecordStore, MissingRecordIsAbsent)
{
    TempDir temp_dir("keydir_store_missing_test");
    auto db = keydir::test::open_database(temp_dir.path());

    auto read = db.by_primary_fpr(keydir::test::fpr('D'));
    ASSERT_TRUE(read.has_value()) << read.error().message;
    EXPECT_FALSE(read->has_value());

    auto by_index = db.read_by_index(Identifier{keydir::test::email("nobody@example.org")});
    ASSERT_TRUE(by_index.has_value()) << by_index.error().message;
    EXPECT_FALSE(by_index->has_value());
}

TEST(RecordStore, ReadByIndex)
{
    TempDir temp_dir("keydir_store_by_index_test");
    auto db = keydir::test::open_database(temp_dir.path());
    const auto primary = keydir::test::fpr('E');
    const auto subkey = keydir::test::fpr('F');
    const auto email = keydir::test::email("erin@example.org");

    ASSERT_TRUE(db.write_to_published(primary, "erin's certificate").has_value());
    ASSERT_TRUE(db.link_fingerprint(subkey, primary).has_value());
    ASSERT_TRUE(db.link_email(email, primary).has_value());

    for (const Identifier& id : {Identifier{subkey}, Identifier{KeyId::from(subkey)}, Identifier{email}}) {
        auto read = db.read_by_index(id);
        ASSERT_TRUE(read.has_value()) << read.error().message;
        EXPECT_EQ(*read, std::optional<std::string>("erin's certificate"));
    }
}

TEST(RecordStore, DryRunWritesNothing)
{
    TempDir temp_dir("keydir_store_dry_run_test");
    auto db = keydir::test::open_database(temp_dir.path(), true);
    const auto fpr = keydir::test::fpr('A');

    auto full = db.write_to_full(fpr, "x");
    auto published = db.write_to_published(fpr, "x");
    auto quarantined = db.write_to_quarantine(fpr, "x");
    ASSERT_TRUE(full.has_value() && published.has_value() && quarantined.has_value());
    EXPECT_EQ(*published, db.layout().record_path(Tier::kPublished, fpr));
    EXPECT_FALSE(fs::exists(*full));
    EXPECT_FALSE(fs::exists(*published));
    EXPECT_FALSE(fs::exists(*quarantined));

    ASSERT_TRUE(db.link_fingerprint(keydir::test::fpr('B'), fpr).has_value());
    ASSERT_TRUE(db.link_email(keydir::test::email("a@example.org"), fpr).has_value());
    EXPECT_FALSE(db.lookup_path(Identifier{keydir::test::fpr('B')}).has_value());
    EXPECT_FALSE(db.lookup_path(Identifier{keydir::test::email("a@example.org")}).has_value());
}

TEST(RecordStore, DryRunUnlinkKeepsExistingEntries)
{
    TempDir temp_dir("keydir_store_dry_run_unlink_test");
    const auto primary = keydir::test::fpr('C');
    const auto subkey = keydir::test::fpr('D');
    const auto email = keydir::test::email("carol@example.org");
    {
        auto db = keydir::test::open_database(temp_dir.path());
        ASSERT_TRUE(db.write_to_published(primary, "carol's certificate").has_value());
        ASSERT_TRUE(db.link_fingerprint(subkey, primary).has_value());
        ASSERT_TRUE(db.link_email(email, primary).has_value());
    }

    auto dry = keydir::test::open_database(temp_dir.path(), true);
    EXPECT_TRUE(dry.unlink_fingerprint(subkey, primary).has_value());
    EXPECT_TRUE(dry.unlink_email(email, primary).has_value());
    auto quarantined = dry.write_to_quarantine(primary, "quarantined");
    ASSERT_TRUE(quarantined.has_value()) << quarantined.error().message;
    EXPECT_FALSE(fs::exists(*quarantined));

    for (const Identifier& id : {Identifier{subkey}, Identifier{KeyId::from(subkey)}, Identifier{email}}) {
        EXPECT_EQ(dry.lookup_primary_fingerprint(id), primary) << keydir::to_string(id);
        auto read = dry.read_by_index(id);
        ASSERT_TRUE(read.has_value()) << read.error().message;
        EXPECT_EQ(*read, std::optional<std::string>("carol's certificate"));
    }
}

namespace {

/// Switch the working directory for the lifetime of the guard
class WorkingDirectory
{
public:
    explicit WorkingDirectory(const fs::path& dir)
        : m_previous(fs::current_path())
    {
        fs::current_path(dir);
    }
    ~WorkingDirectory()
    {
        std::error_code ec;
        fs::current_path(m_previous, ec);
    }
    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;

private:
    fs::path m_previous;
};

}  // namespace

TEST(RecordStore, RootAboveWorkingDirectory)
{
    TempDir temp_dir("keydir_store_relative_root_test");
    fs::create_directories(temp_dir.path() / "work");
    WorkingDirectory cwd(temp_dir.path() / "work");

    auto db = keydir::test::open_database("../store");
    EXPECT_TRUE(db.config().internal_dir.is_absolute());
    EXPECT_TRUE(db.config().external_dir.is_absolute());
    EXPECT_TRUE(db.config().tmp_dir.is_absolute());
    EXPECT_TRUE(fs::is_directory(temp_dir.path() / "store" / "keys"));

    const auto primary = keydir::test::fpr('A');
    const auto email = keydir::test::email("alice@example.org");
    ASSERT_TRUE(db.write_to_full(primary, "full").has_value());
    ASSERT_TRUE(db.write_to_published(primary, "published").has_value());
    ASSERT_TRUE(db.link_email(email, primary).has_value());

    auto full = db.by_fpr_full(primary);
    ASSERT_TRUE(full.has_value()) << full.error().message;
    EXPECT_EQ(*full, std::optional<std::string>("full"));
    auto published = db.by_primary_fpr(primary);
    ASSERT_TRUE(published.has_value()) << published.error().message;
    EXPECT_EQ(*published, std::optional<std::string>("published"));
    auto by_email = db.read_by_index(Identifier{email});
    ASSERT_TRUE(by_email.has_value()) << by_email.error().message;
    EXPECT_EQ(*by_email, std::optional<std::string>("published"));
}

TEST(RecordStoreDeathTest, PathOutsideRootsAborts)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    TempDir temp_dir("keydir_store_confinement_test");
    auto db = keydir::test::open_database(temp_dir.path() / "store");

    EXPECT_DEATH((void)db.store().read_path("/etc/passwd", true), "outside of the storage roots");
    EXPECT_DEATH((void)db.store().read_path(db.layout().external_dir() / ".." / "secret", false),
                 "outside of the storage roots");
}

TEST(RecordStoreDeathTest, InternalTierNotReadableAsPublic)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    TempDir temp_dir("keydir_store_internal_test");
    StoreConfig config{.internal_dir = temp_dir.path() / "internal",
                       .external_dir = temp_dir.path() / "external",
                       .tmp_dir = temp_dir.path() / "tmp",
                       .dry_run = false};
    auto db = keydir::Database::open(config);
    ASSERT_TRUE(db.has_value()) << db.error().message;
    const auto fpr = keydir::test::fpr('A');

    auto read = db->store().read(Tier::kFull, fpr);
    ASSERT_TRUE(read.has_value()) << read.error().message;
    EXPECT_DEATH((void)db->store().read_path(db->layout().record_path(Tier::kFull, fpr), false),
                 "outside of the storage roots");
}

TEST(RecordStoreDeathTest, SymlinkEscapeAborts)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    TempDir temp_dir("keydir_store_symlink_escape_test");
    auto db = keydir::test::open_database(temp_dir.path() / "store");
    { std::ofstream(temp_dir.path() / "secret") << "secret"; }

    const auto email = keydir::test::email("mallory@example.org");
    const auto link = db.layout().link_path(Identifier{email});
    fs::create_directories(link.parent_path());
    fs::create_symlink(temp_dir.path() / "secret", link);

    EXPECT_DEATH((void)db.read_by_index(Identifier{email}), "outside of the storage roots");
}
