#pragma once

/**
 * @file facts.hpp
 * @brief Semantic facts produced by a source frontend (facts.v1)
 */

#include "hexarch/common.hpp"
#include "hexarch/graph.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hexarch::facts {

struct FieldFact
{
    std::string name;
    graph::TypeRef type;
    graph::Modifiers modifiers;
    std::vector<std::string> annotations;
};

struct MethodFact
{
    std::string name;
    graph::TypeRef return_type;
    std::vector<graph::TypeRef> parameters;
    graph::Modifiers modifiers;
    std::vector<std::string> annotations;
};

struct ConstructorFact
{
    std::vector<graph::TypeRef> parameters;
    graph::Modifiers modifiers;
};

struct TypeFact
{
    std::string qualified_name;
    graph::TypeForm form = graph::TypeForm::kClass;
    graph::Modifiers modifiers;
    std::vector<std::string> annotations;
    std::optional<graph::TypeRef> supertype;
    std::vector<graph::TypeRef> interfaces;
    std::vector<std::string> references;  ///< Extra dependencies seen by the frontend
    std::vector<FieldFact> fields;
    std::vector<MethodFact> methods;
    std::vector<ConstructorFact> constructors;
    std::vector<graph::RecordComponent> record_components;
};

struct SemanticFacts
{
    std::string base_namespace;
    std::string language_version;
    int source_unit_count = 0;
    std::vector<TypeFact> types;
};

/**
 * Convert a facts.v1 document into SemanticFacts.
 *
 * @return Facts, or InvalidFacts naming the offending JSON path
 */
[[nodiscard]] hexarch::Result<SemanticFacts> parse_facts(const nlohmann::json& j);

/**
 * Read, schema-validate and parse a facts file.
 *
 * @param path facts.v1 JSON file
 * @param schema_dir Directory holding facts.v1.schema.json (empty: skip validation)
 */
[[nodiscard]] hexarch::Result<SemanticFacts> load_facts(const std::filesystem::path& path,
                                                        const std::string& schema_dir);

}  // namespace hexarch::facts
