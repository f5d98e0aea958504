#pragma once

/**
 * @file config.hpp
 * @brief Storage roots and engine configuration
 */

#include "keydir/common.hpp"

#include <filesystem>
#include <string>

namespace keydir {

struct StoreConfig
{
    std::filesystem::path internal_dir;  ///< Full and quarantined records, lock
    std::filesystem::path external_dir;  ///< Published records and index links
    std::filesystem::path tmp_dir;       ///< Scratch space; same filesystem as the roots
    bool dry_run = false;                ///< Validate but skip every mutation

    /**
     * @brief Single-directory layout: base/keys for both roots, base/tmp for scratch
     */
    [[nodiscard]] static StoreConfig from_base(const std::filesystem::path& base);
};

struct AppConfig
{
    StoreConfig store;
    std::string log_level = "info";
};

/**
 * @brief Load a keydir_config.v1 JSON file
 *
 * The file is validated against keydir_config.v1.schema.json in
 * @p schema_dir. Relative directories are resolved against the
 * directory containing the file.
 */
[[nodiscard]] keydir::Result<AppConfig> load_config(const std::filesystem::path& path,
                                                    const std::filesystem::path& schema_dir);

}  // namespace keydir
