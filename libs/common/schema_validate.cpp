/**
 * @file schema_validate.cpp
 * @brief JSON file I/O and schema validation using valijson
 */

#include "hexarch/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <system_error>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace hexarch::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "hexarch:schema/";
constexpr std::string_view kDefsRefPrefix = "#/$defs/";

// valijson understands draft-07 "definitions" only.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
        schema.erase("$defs");
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsRefPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text;
}

}  // namespace

hexarch::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError",
                        "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

hexarch::VoidResult write_json_file(const std::filesystem::path& path,
                                    const nlohmann::json& payload)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError",
                "Failed to create directory " + path.parent_path().string() + ": " + ec.message()));
        }
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << payload.dump(2) << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

hexarch::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_json_file(schema_path);
    if (!schema_json) {
        return std::unexpected(Error::make("SchemaFileOpenFailed", schema_json.error().message));
    }
    rewrite_defs(*schema_json);

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> fetched;
    const auto fetch_doc = [&schema_dir, &fetched](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto name = uri.substr(kSchemaUriPrefix.size());
        auto doc = read_json_file(schema_dir / (name + ".schema.json"));
        if (!doc) {
            return nullptr;
        }
        rewrite_defs(*doc);
        fetched.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return fetched.back().get();
    };
    const auto free_doc = [](const nlohmann::json* /*doc*/) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        auto details = describe_errors(results);
        return std::unexpected(Error::make(
            "SchemaValidationFailed",
            details.empty() ? std::string("Schema validation failed.") : std::move(details)));
    }
    return {};
}

}  // namespace hexarch::common
