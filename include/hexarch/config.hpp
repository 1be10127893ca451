#pragma once

/**
 * @file config.hpp
 * @brief Analysis configuration (config.v1)
 */

#include "hexarch/classification/classifier.hpp"
#include "hexarch/common.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexarch::config {

struct ClassificationConfig
{
    classification::DecisionPolicyKind decision_policy = classification::DecisionPolicyKind::kDefault;
    classification::CriteriaProfile profile;
};

struct AuditConfig
{
    std::vector<std::string> packages;  ///< Packages to report coupling / Lakos for (empty: all)
    bool include_layer_violations = true;
    bool include_stability_violations = true;
};

struct AnalysisConfig
{
    ClassificationConfig classifier;
    AuditConfig audit;

    [[nodiscard]] classification::ClassifierOptions classifier_options() const
    {
        return classification::ClassifierOptions{.decision_policy = classifier.decision_policy,
                                                 .profile = classifier.profile};
    }
};

/**
 * Convert a config.v1 document.
 *
 * Priority overrides must name a known criterion id.
 *
 * @return Configuration, or InvalidConfig
 */
[[nodiscard]] hexarch::Result<AnalysisConfig> parse_config(const nlohmann::json& j);

/**
 * Read, schema-validate and parse a configuration file.
 *
 * @param path config.v1 JSON file
 * @param schema_dir Directory holding config.v1.schema.json (empty: skip validation)
 */
[[nodiscard]] hexarch::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                                          const std::string& schema_dir);

}  // namespace hexarch::config
