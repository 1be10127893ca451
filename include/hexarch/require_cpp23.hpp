#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature checks for hexarch
 *
 * Fails the build early with a readable message when the standard library
 * lacks a C++23 facility hexarch relies on.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "hexarch requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI progress and error lines

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "hexarch requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> / VoidResult

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "hexarch requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: Indexed iteration over facts and CLI arguments

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "hexarch requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::string::contains (__cpp_lib_string_contains)
// =============================================================================
// Required for: Package keyword and name matching

#if !defined(__cpp_lib_string_contains) || __cpp_lib_string_contains < 202'011L
    #error "hexarch requires std::string::contains (__cpp_lib_string_contains >= 202011L)."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: Error messages and justifications

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "hexarch requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================
// Required for: Range algorithms and views

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "hexarch requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define HEXARCH_CPP23_FEATURES_VERIFIED 1
