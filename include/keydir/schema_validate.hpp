#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema (draft-07) validation of configuration files and descriptors
 */

#include "keydir/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace keydir::common {

/**
 * Validate @p document against the schema file at @p schema_path.
 *
 * Compiled schemas are cached per path for the lifetime of the process,
 * so validating many records against one schema reads it once.
 *
 * @return Empty on success; SchemaFileOpenFailed, SchemaParseFailed,
 *         SchemaBuildFailed or SchemaValidationFailed otherwise
 */
[[nodiscard]] keydir::VoidResult validate_json(const nlohmann::json& document,
                                               const std::filesystem::path& schema_path);

/// "<schema_dir>/<schema_name>.schema.json"
[[nodiscard]] inline std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                                       std::string_view schema_name)
{
    return schema_dir / (std::string(schema_name) + ".schema.json");
}

}  // namespace keydir::common
