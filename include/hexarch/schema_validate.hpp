#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON document loading and JSON Schema validation
 */

#include "hexarch/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace hexarch::common {

/**
 * Read and parse a JSON file.
 *
 * @param path File to read
 * @return Parsed document, or IOError / ParseError
 */
[[nodiscard]] hexarch::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write a JSON document (pretty-printed, trailing newline).
 *
 * @param path Destination file
 * @param payload Document to write
 * @return Empty on success, IOError on failure
 */
[[nodiscard]] hexarch::VoidResult write_json_file(const std::filesystem::path& path,
                                                  const nlohmann::json& payload);

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "hexarch:schema/<name>", resolved to
 * "<schema dir>/<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] hexarch::VoidResult validate_json(const nlohmann::json& j,
                                                const std::string& schema_path);

}  // namespace hexarch::common
