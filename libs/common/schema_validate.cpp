/**
 * @file schema_validate.cpp
 * @brief valijson-backed schema validation with a compiled-schema cache
 */

#include "keydir/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validation_results.hpp>
#include <valijson/validator.hpp>

namespace keydir::common {

namespace {

namespace fs = std::filesystem;

using SchemaPtr = std::shared_ptr<const valijson::Schema>;

[[nodiscard]] keydir::Result<SchemaPtr> compile_schema(const fs::path& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(make_error(
            errc::kSchemaFileOpenFailed, "Failed to open schema file: " + schema_path.string()));
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const std::exception& ex) {
        return std::unexpected(make_error(
            errc::kSchemaParseFailed,
            std::format("Failed to parse schema {}: {}", schema_path.string(), ex.what())));
    }

    auto schema = std::make_shared<valijson::Schema>();
    try {
        valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
        valijson::adapters::NlohmannJsonAdapter adapter(document);
        parser.populateSchema(adapter, *schema);
    } catch (const std::exception& ex) {
        return std::unexpected(make_error(
            errc::kSchemaBuildFailed,
            std::format("Failed to build schema {}: {}", schema_path.string(), ex.what())));
    }
    return SchemaPtr{std::move(schema)};
}

/// Process-wide cache of compiled schemas keyed by path
[[nodiscard]] keydir::Result<SchemaPtr> cached_schema(const fs::path& schema_path)
{
    static std::mutex mutex;
    static std::unordered_map<std::string, SchemaPtr> cache;

    const std::string key = schema_path.lexically_normal().string();
    std::scoped_lock lock(mutex);
    if (auto it = cache.find(key); it != cache.end()) {
        return it->second;
    }
    auto compiled = compile_schema(schema_path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    cache.emplace(key, *compiled);
    return compiled;
}

/// One line per violation: "/json/pointer: description"
[[nodiscard]] std::string describe(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        // context[0] is the "<root>" marker
        for (std::size_t i = 1; i < error.context.size(); ++i) {
            pointer += "/" + error.context[i];
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text.empty() ? std::string("Schema validation failed.") : text;
}

}  // namespace

keydir::VoidResult validate_json(const nlohmann::json& document, const fs::path& schema_path)
{
    auto schema = cached_schema(schema_path);
    if (!schema) {
        return std::unexpected(schema.error());
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter adapter(document);
    if (!validator.validate(**schema, adapter, &results)) {
        return std::unexpected(make_error(errc::kSchemaValidationFailed, describe(results)));
    }
    return {};
}

}  // namespace keydir::common
