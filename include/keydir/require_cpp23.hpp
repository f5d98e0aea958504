#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check for the C++23 library features keydir relies on
 *
 * Include early in a translation unit (main.cpp does) to get a readable
 * error instead of a wall of template diagnostics on an old toolchain.
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "keydir requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Result<T> / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "keydir requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// CLI output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "keydir requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "keydir requires std::format (__cpp_lib_format >= 202110L)."
#endif

// CLI argument loops
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "keydir requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// Certificate membership queries
#if !defined(__cpp_lib_ranges_contains) || __cpp_lib_ranges_contains < 202'207L
    #error "keydir requires std::ranges::contains (__cpp_lib_ranges_contains >= 202207L)."
#endif

// Lexical path prefix/suffix checks
#if !defined(__cpp_lib_ranges_starts_ends_with) || __cpp_lib_ranges_starts_ends_with < 202'106L
    #error "keydir requires std::ranges::starts_with/ends_with (__cpp_lib_ranges_starts_ends_with >= 202106L)."
#endif

#define KEYDIR_CPP23_FEATURES_VERIFIED 1
