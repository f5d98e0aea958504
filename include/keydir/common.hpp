#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, path normalization
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace keydir {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Error codes shared across the engine
namespace errc {
inline constexpr std::string_view kIOError = "IOError";
inline constexpr std::string_view kMalformedPath = "MalformedPath";
inline constexpr std::string_view kCollision = "Collision";
inline constexpr std::string_view kInvalidIdentifier = "InvalidIdentifier";
inline constexpr std::string_view kConfigError = "ConfigError";
inline constexpr std::string_view kParseError = "ParseError";
inline constexpr std::string_view kInvalidArgument = "InvalidArgument";
inline constexpr std::string_view kMissingArgument = "MissingArgument";
inline constexpr std::string_view kSchemaFileOpenFailed = "SchemaFileOpenFailed";
inline constexpr std::string_view kSchemaParseFailed = "SchemaParseFailed";
inline constexpr std::string_view kSchemaBuildFailed = "SchemaBuildFailed";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
}  // namespace errc

[[nodiscard]] inline Error make_error(std::string_view code, std::string message)
{
    return Error::make(std::string(code), std::move(message));
}

}  // namespace keydir

namespace keydir::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path lexically
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 *
 * @param input Input path
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Make path relative to base
 *
 * Both paths are normalized first. Used to compute symlink targets, so
 * the result is always expressed with ".." steps from @p base.
 */
[[nodiscard]] std::string make_relative(std::string_view path, std::string_view base);

/**
 * Check whether @p path lies at or below @p root after lexical normalization
 */
[[nodiscard]] bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

/**
 * Check whether the trailing components of @p path equal all components of @p suffix
 */
[[nodiscard]] bool path_ends_with(const std::filesystem::path& path,
                                  const std::filesystem::path& suffix);

}  // namespace keydir::common
