#pragma once

/**
 * @file version.hpp
 * @brief hexarch version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace hexarch {

/// hexarch version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document versions (embedded in inputs and outputs)
constexpr const char* kFactsSchemaVersion = "facts.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";
constexpr const char* kAuditSchemaVersion = "audit.v1";

}  // namespace hexarch
