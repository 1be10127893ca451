/**
 * @file config.cpp
 * @brief config.v1 loading
 */

#include "hexarch/config.hpp"

#include "hexarch/schema_validate.hpp"
#include "hexarch/version.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace hexarch::config {

namespace {

[[nodiscard]] Error invalid(std::string message)
{
    return Error::make("InvalidConfig", std::move(message));
}

[[nodiscard]] hexarch::VoidResult parse_classification(const nlohmann::json& j,
                                                       ClassificationConfig& out)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("classification: must be an object"));
    }
    if (auto it = j.find("decision_policy"); it != j.end()) {
        const auto policy = it->is_string() ? it->get<std::string>() : std::string{};
        if (policy == "default") {
            out.decision_policy = classification::DecisionPolicyKind::kDefault;
        } else if (policy == "strict") {
            out.decision_policy = classification::DecisionPolicyKind::kStrict;
        } else {
            return std::unexpected(
                invalid("classification.decision_policy: expected 'default' or 'strict'"));
        }
    }
    if (auto it = j.find("priority_overrides"); it != j.end()) {
        if (!it->is_object()) {
            return std::unexpected(invalid("classification.priority_overrides: must be an object"));
        }
        const auto known = classification::known_criterion_ids();
        for (const auto& [id, value] : it->items()) {
            if (!std::ranges::binary_search(known, id)) {
                return std::unexpected(
                    invalid(std::format("classification.priority_overrides: unknown criterion '{}'", id)));
            }
            if (!value.is_number_integer()) {
                return std::unexpected(invalid(
                    std::format("classification.priority_overrides.{}: must be an integer", id)));
            }
            out.profile.set_priority(id, value.get<int>());
        }
    }
    return {};
}

[[nodiscard]] hexarch::VoidResult parse_audit(const nlohmann::json& j, AuditConfig& out)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("audit: must be an object"));
    }
    if (auto it = j.find("packages"); it != j.end()) {
        if (!it->is_array()) {
            return std::unexpected(invalid("audit.packages: must be an array"));
        }
        for (const auto& package : *it) {
            if (!package.is_string()) {
                return std::unexpected(invalid("audit.packages: must contain only strings"));
            }
            out.packages.push_back(package.get<std::string>());
        }
    }
    for (auto [key, flag] : {std::pair{"include_layer_violations", &out.include_layer_violations},
                             std::pair{"include_stability_violations", &out.include_stability_violations}}) {
        if (auto it = j.find(key); it != j.end()) {
            if (!it->is_boolean()) {
                return std::unexpected(invalid(std::format("audit.{}: must be a boolean", key)));
            }
            *flag = it->get<bool>();
        }
    }
    return {};
}

}  // namespace

hexarch::Result<AnalysisConfig> parse_config(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("configuration must be an object"));
    }
    if (j.contains("schema_version") && j.at("schema_version") != kConfigSchemaVersion) {
        return std::unexpected(invalid(std::format("schema_version: expected '{}'", kConfigSchemaVersion)));
    }

    AnalysisConfig config;
    if (j.contains("classification")) {
        if (auto r = parse_classification(j.at("classification"), config.classifier); !r) {
            return std::unexpected(r.error());
        }
    }
    if (j.contains("audit")) {
        if (auto r = parse_audit(j.at("audit"), config.audit); !r) {
            return std::unexpected(r.error());
        }
    }
    return config;
}

hexarch::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                            const std::string& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (!schema_dir.empty()) {
        const auto schema_path = std::filesystem::path(schema_dir) / "config.v1.schema.json";
        if (auto valid = common::validate_json(*document, schema_path.string()); !valid) {
            return std::unexpected(valid.error());
        }
    }
    return parse_config(*document);
}

}  // namespace hexarch::config
