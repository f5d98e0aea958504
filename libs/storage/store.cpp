/**
 * @file store.cpp
 * @brief Tiered record store implementation
 */

#include "keydir/store.hpp"

#include "keydir/atomic_file.hpp"
#include "keydir/common.hpp"
#include "keydir/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace keydir::storage {

namespace fs = std::filesystem;

RecordStore::RecordStore(PathLayout layout, fs::path tmp_dir, bool dry_run)
    : m_layout(std::move(layout))
    , m_tmp_dir(std::move(tmp_dir))
    , m_dry_run(dry_run)
{}

keydir::Result<fs::path>
RecordStore::write(Tier tier, const Fingerprint& fingerprint, std::string_view content) const
{
    fs::path target = m_layout.record_path(tier, fingerprint);
    if (m_dry_run) {
        logging::logger()->debug("dry run: skipping {} write of {}", to_string(tier),
                                 fingerprint.to_string());
        return target;
    }
    const fs::perms perms = tier == Tier::kPublished ? kPublicPerms : kInternalPerms;
    if (auto result = write_then_publish(m_tmp_dir, target, content, perms); !result) {
        return std::unexpected(result.error());
    }
    return target;
}

keydir::Result<std::optional<std::string>> RecordStore::read(Tier tier,
                                                             const Fingerprint& fingerprint) const
{
    return read_path(m_layout.record_path(tier, fingerprint), tier != Tier::kPublished);
}

keydir::Result<std::optional<std::string>>
RecordStore::read_by_index(const Identifier& identifier) const
{
    return read_path(m_layout.link_path(identifier), false);
}

keydir::Result<std::optional<std::string>> RecordStore::read_path(const fs::path& path,
                                                                  bool allow_internal) const
{
    enforce_confinement(path, allow_internal);

    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(path, ec))) {
        const fs::path target = fs::read_symlink(path, ec);
        if (!ec) {
            enforce_confinement(target.is_absolute() ? target : path.parent_path() / target,
                                allow_internal);
        }
    }

    if (!fs::exists(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(
                make_error(errc::kIOError, "Failed to stat " + path.string() + ": " + ec.message()));
        }
        return std::optional<std::string>{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        // Removed between the existence check and the open
        if (!fs::exists(path, ec)) {
            return std::optional<std::string>{};
        }
        return std::unexpected(
            make_error(errc::kIOError, "Failed to open file for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(make_error(errc::kIOError, "Failed to read file: " + path.string()));
    }
    return std::optional<std::string>{std::move(content)};
}

void RecordStore::enforce_confinement(const fs::path& path, bool allow_internal) const
{
    // Compare in absolute form so a root given as ../store still contains its own files
    std::error_code ec;
    const auto absolute = [&ec](const fs::path& p) { return p.is_absolute() ? p : fs::absolute(p, ec); };
    const fs::path candidate = absolute(path);
    const fs::path external = absolute(m_layout.external_dir());
    const fs::path internal = absolute(m_layout.internal_dir());
    if (!ec
        && (common::is_within(candidate, external)
            || (allow_internal && common::is_within(candidate, internal)))) {
        return;
    }
    auto log = logging::logger();
    log->critical("Attempted to access {} outside of the storage roots", path.string());
    log->flush();
    std::abort();
}

}  // namespace keydir::storage
