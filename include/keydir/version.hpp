#pragma once

/**
 * @file version.hpp
 * @brief keydir version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace keydir {

/// keydir version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// On-disk layout version (sharding and link format)
constexpr const char* kLayoutVersion = "layout.v1";

}  // namespace keydir
