/**
 * @file test_config.cpp
 * @brief Tests for config.v1 parsing and loading
 */

#include "hexarch/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hexarch::config::test {

namespace {

std::filesystem::path write_json(const std::string& name, const nlohmann::json& payload)
{
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << payload.dump(2);
    return path;
}

nlohmann::json full_config()
{
    return nlohmann::json{
        {"schema_version", "config.v1"},
        {"classification",
         {{"decision_policy", "strict"},
          {"priority_overrides", {{"port.package-in", 90}, {"domain.domain-enum", -5}}}}},
        {"audit",
         {{"packages", nlohmann::json::array({"com.shop.order", "com.shop.billing"})},
          {"include_layer_violations", false}}}
    };
}

}  // namespace

TEST(ConfigTest, EmptyDocumentGivesDefaults)
{
    auto config = parse_config(nlohmann::json::object());
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->classifier.decision_policy, classification::DecisionPolicyKind::kDefault);
    EXPECT_TRUE(config->classifier.profile.empty());
    EXPECT_TRUE(config->audit.packages.empty());
    EXPECT_TRUE(config->audit.include_layer_violations);
    EXPECT_TRUE(config->audit.include_stability_violations);
}

TEST(ConfigTest, ParsesEverySection)
{
    auto config = parse_config(full_config());
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->classifier.decision_policy, classification::DecisionPolicyKind::kStrict);
    EXPECT_EQ(config->classifier.profile.resolve("port.package-in", 60), 90);
    EXPECT_EQ(config->classifier.profile.resolve("domain.domain-enum", 65), -5);
    EXPECT_EQ(config->classifier.profile.resolve("port.package-out", 60), 60);

    EXPECT_EQ(config->audit.packages.size(), 2U);
    EXPECT_FALSE(config->audit.include_layer_violations);
    EXPECT_TRUE(config->audit.include_stability_violations);

    const auto options = config->classifier_options();
    EXPECT_EQ(options.decision_policy, classification::DecisionPolicyKind::kStrict);
    EXPECT_EQ(options.profile.overrides().size(), 2U);
}

TEST(ConfigTest, RejectsUnknownCriterion)
{
    auto document = full_config();
    document["classification"]["priority_overrides"]["port.naming-adapter"] = 10;
    auto config = parse_config(document);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "InvalidConfig");
    EXPECT_NE(config.error().message.find("unknown criterion 'port.naming-adapter'"), std::string::npos);
}

TEST(ConfigTest, RejectsNonIntegerPriority)
{
    auto document = full_config();
    document["classification"]["priority_overrides"]["port.package-in"] = 1.5;
    auto config = parse_config(document);
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().message.find("must be an integer"), std::string::npos);
}

TEST(ConfigTest, RejectsUnknownPolicy)
{
    auto document = full_config();
    document["classification"]["decision_policy"] = "majority";
    auto config = parse_config(document);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "InvalidConfig");
}

TEST(ConfigTest, RejectsWrongFlagType)
{
    auto document = full_config();
    document["audit"]["include_stability_violations"] = "yes";
    auto config = parse_config(document);
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().message.find("audit.include_stability_violations"), std::string::npos);
}

TEST(ConfigTest, LoadValidatesAgainstSchema)
{
    const auto valid = write_json("hexarch_config_valid.json", full_config());
    auto loaded = load_config(valid, HEXARCH_SCHEMA_DIR);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->classifier.decision_policy, classification::DecisionPolicyKind::kStrict);

    auto document = full_config();
    document["audit"]["colour"] = "blue";
    const auto invalid = write_json("hexarch_config_invalid.json", document);
    auto rejected = load_config(invalid, HEXARCH_SCHEMA_DIR);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, "SchemaValidationFailed");
}

TEST(ConfigTest, LoadReportsMissingFile)
{
    auto loaded = load_config("/nonexistent/hexarch/config.json", "");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, "IOError");
}

}  // namespace hexarch::config::test
