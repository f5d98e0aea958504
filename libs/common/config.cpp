/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "keydir/config.hpp"

#include "keydir/schema_validate.hpp"

#include <exception>
#include <fstream>

#include <nlohmann/json.hpp>

namespace keydir {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kSchemaName = "keydir_config.v1";

[[nodiscard]] fs::path resolve_dir(const fs::path& base, const std::string& value)
{
    fs::path dir(value);
    if (dir.is_relative()) {
        dir = base / dir;
    }
    return dir.lexically_normal();
}

}  // namespace

StoreConfig StoreConfig::from_base(const fs::path& base)
{
    return StoreConfig{.internal_dir = base / "keys",
                       .external_dir = base / "keys",
                       .tmp_dir = base / "tmp",
                       .dry_run = false};
}

keydir::Result<AppConfig> load_config(const fs::path& path, const fs::path& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            make_error(errc::kConfigError, "Failed to open config file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(make_error(
            errc::kParseError, "Failed to parse config file " + path.string() + ": " + ex.what()));
    }

    if (auto result =
            common::validate_json(payload, common::schema_file(schema_dir, kSchemaName));
        !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "Config schema validation failed: "
                                               + result.error().message));
    }

    const fs::path base = path.parent_path();
    return AppConfig{
        .store = StoreConfig{.internal_dir =
                                 resolve_dir(base, payload.at("internal_dir").get<std::string>()),
                             .external_dir =
                                 resolve_dir(base, payload.at("external_dir").get<std::string>()),
                             .tmp_dir = resolve_dir(base, payload.at("tmp_dir").get<std::string>()),
                             .dry_run = payload.value("dry_run", false)},
        .log_level = payload.value("log_level", std::string("info")),
    };
}

}  // namespace keydir
