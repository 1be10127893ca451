#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, qualified-name helpers
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hexarch {

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

}  // namespace hexarch

namespace hexarch::common {

// ============================================================================
// Qualified Names
// ============================================================================

/**
 * Simple name of a qualified name
 * "com.example.Order" -> "Order", "Order" -> "Order"
 */
[[nodiscard]] std::string_view simple_name(std::string_view qualified_name);

/**
 * Package part of a qualified name ("" for the default package)
 * "com.example.Order" -> "com.example"
 */
[[nodiscard]] std::string_view package_name(std::string_view qualified_name);

/**
 * Lower-case the first character ("OrderLine" -> "orderLine")
 */
[[nodiscard]] std::string lower_camel(std::string_view name);

/**
 * ASCII lower-case copy
 */
[[nodiscard]] std::string to_lower(std::string_view text);

/**
 * Split a dotted name into its segments ("a.b.c" -> {"a","b","c"})
 */
[[nodiscard]] std::vector<std::string> split_segments(std::string_view dotted);

/**
 * True if the package contains a segment equal to @p segment
 */
[[nodiscard]] bool has_package_segment(std::string_view package, std::string_view segment);

}  // namespace hexarch::common
