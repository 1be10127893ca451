/**
 * @file facts.cpp
 * @brief facts.v1 JSON parsing
 */

#include "hexarch/facts.hpp"

#include "hexarch/schema_validate.hpp"
#include "hexarch/version.hpp"

#include <cstdint>
#include <format>
#include <ranges>

namespace hexarch::facts {

namespace {

using Json = nlohmann::json;

[[nodiscard]] Error invalid(std::string_view path, std::string_view what)
{
    return Error::make("InvalidFacts", std::format("{}: {}", path, what));
}

[[nodiscard]] hexarch::Result<std::string> require_string(const Json& j,
                                                          std::string_view key,
                                                          std::string_view path)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(invalid(path, std::format("'{}' must be a string", key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] hexarch::Result<std::string> optional_string(const Json& j,
                                                           std::string_view key,
                                                           std::string_view path)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return std::string{};
    }
    if (!it->is_string()) {
        return std::unexpected(invalid(path, std::format("'{}' must be a string", key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] hexarch::Result<bool> optional_bool(const Json& j,
                                                  std::string_view key,
                                                  std::string_view path)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return false;
    }
    if (!it->is_boolean()) {
        return std::unexpected(invalid(path, std::format("'{}' must be a boolean", key)));
    }
    return it->get<bool>();
}

[[nodiscard]] hexarch::Result<std::vector<std::string>> string_list(const Json& j,
                                                                    std::string_view key,
                                                                    std::string_view path)
{
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it == j.end()) {
        return values;
    }
    if (!it->is_array()) {
        return std::unexpected(invalid(path, std::format("'{}' must be an array", key)));
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return std::unexpected(
                invalid(path, std::format("'{}' must contain only strings", key)));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

[[nodiscard]] hexarch::Result<graph::Modifiers> parse_modifiers(const Json& j,
                                                                std::string_view path)
{
    auto names = string_list(j, "modifiers", path);
    if (!names) {
        return std::unexpected(names.error());
    }
    graph::Modifiers modifiers;
    for (const auto& name : *names) {
        auto modifier = graph::parse_modifier(name);
        if (!modifier) {
            return std::unexpected(invalid(path, std::format("unknown modifier '{}'", name)));
        }
        modifiers.add(*modifier);
    }
    return modifiers;
}

[[nodiscard]] hexarch::Result<graph::TypeRef> parse_type_ref(const Json& j, const std::string& path)
{
    if (!j.is_object()) {
        return std::unexpected(invalid(path, "type reference must be an object"));
    }
    auto name = require_string(j, "name", path);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto array = optional_bool(j, "array", path);
    if (!array) {
        return std::unexpected(array.error());
    }
    graph::TypeRef ref{.name = std::move(*name), .arguments = {}, .array = *array};
    if (auto args = j.find("arguments"); args != j.end()) {
        if (!args->is_array()) {
            return std::unexpected(invalid(path, "'arguments' must be an array"));
        }
        for (auto [i, arg] : std::views::enumerate(*args)) {
            auto parsed = parse_type_ref(arg, std::format("{}.arguments[{}]", path, i));
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            ref.arguments.push_back(std::move(*parsed));
        }
    }
    return ref;
}

[[nodiscard]] hexarch::Result<std::vector<graph::TypeRef>>
parse_type_ref_list(const Json& j, std::string_view key, const std::string& path)
{
    std::vector<graph::TypeRef> refs;
    auto it = j.find(key);
    if (it == j.end()) {
        return refs;
    }
    if (!it->is_array()) {
        return std::unexpected(invalid(path, std::format("'{}' must be an array", key)));
    }
    for (auto [i, item] : std::views::enumerate(*it)) {
        auto ref = parse_type_ref(item, std::format("{}.{}[{}]", path, key, i));
        if (!ref) {
            return std::unexpected(ref.error());
        }
        refs.push_back(std::move(*ref));
    }
    return refs;
}

[[nodiscard]] hexarch::Result<FieldFact> parse_field(const Json& j, const std::string& path)
{
    auto name = require_string(j, "name", path);
    if (!name) {
        return std::unexpected(name.error());
    }
    if (!j.contains("type")) {
        return std::unexpected(invalid(path, "'type' is required"));
    }
    auto type = parse_type_ref(j.at("type"), path + ".type");
    if (!type) {
        return std::unexpected(type.error());
    }
    auto modifiers = parse_modifiers(j, path);
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    auto annotations = string_list(j, "annotations", path);
    if (!annotations) {
        return std::unexpected(annotations.error());
    }
    return FieldFact{.name = std::move(*name),
                     .type = std::move(*type),
                     .modifiers = *modifiers,
                     .annotations = std::move(*annotations)};
}

[[nodiscard]] hexarch::Result<MethodFact> parse_method(const Json& j, const std::string& path)
{
    auto name = require_string(j, "name", path);
    if (!name) {
        return std::unexpected(name.error());
    }
    graph::TypeRef return_type{.name = "void", .arguments = {}, .array = false};
    if (j.contains("return_type")) {
        auto parsed = parse_type_ref(j.at("return_type"), path + ".return_type");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        return_type = std::move(*parsed);
    }
    auto parameters = parse_type_ref_list(j, "parameters", path);
    if (!parameters) {
        return std::unexpected(parameters.error());
    }
    auto modifiers = parse_modifiers(j, path);
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    auto annotations = string_list(j, "annotations", path);
    if (!annotations) {
        return std::unexpected(annotations.error());
    }
    return MethodFact{.name = std::move(*name),
                      .return_type = std::move(return_type),
                      .parameters = std::move(*parameters),
                      .modifiers = *modifiers,
                      .annotations = std::move(*annotations)};
}

[[nodiscard]] hexarch::Result<ConstructorFact> parse_constructor(const Json& j,
                                                                 const std::string& path)
{
    auto parameters = parse_type_ref_list(j, "parameters", path);
    if (!parameters) {
        return std::unexpected(parameters.error());
    }
    auto modifiers = parse_modifiers(j, path);
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    return ConstructorFact{.parameters = std::move(*parameters), .modifiers = *modifiers};
}

template <typename T, typename Parser>
[[nodiscard]] hexarch::Result<std::vector<T>> parse_list(const Json& j,
                                                         std::string_view key,
                                                         const std::string& path,
                                                         Parser parser)
{
    std::vector<T> items;
    auto it = j.find(key);
    if (it == j.end()) {
        return items;
    }
    if (!it->is_array()) {
        return std::unexpected(invalid(path, std::format("'{}' must be an array", key)));
    }
    for (auto [i, item] : std::views::enumerate(*it)) {
        const auto item_path = std::format("{}.{}[{}]", path, key, i);
        if (!item.is_object()) {
            return std::unexpected(invalid(item_path, "must be an object"));
        }
        auto parsed = parser(item, item_path);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        items.push_back(std::move(*parsed));
    }
    return items;
}

[[nodiscard]] hexarch::Result<graph::RecordComponent> parse_component(const Json& j,
                                                                      const std::string& path)
{
    auto field = parse_field(j, path);
    if (!field) {
        return std::unexpected(field.error());
    }
    return graph::RecordComponent{.name = std::move(field->name), .type = std::move(field->type)};
}

[[nodiscard]] hexarch::Result<TypeFact> parse_type(const Json& j, const std::string& path)
{
    auto qualified_name = require_string(j, "qualified_name", path);
    if (!qualified_name) {
        return std::unexpected(qualified_name.error());
    }
    auto form_text = require_string(j, "form", path);
    if (!form_text) {
        return std::unexpected(form_text.error());
    }
    auto form = graph::parse_type_form(*form_text);
    if (!form) {
        return std::unexpected(invalid(path, std::format("unknown form '{}'", *form_text)));
    }

    TypeFact type{.qualified_name = std::move(*qualified_name), .form = *form};

    auto modifiers = parse_modifiers(j, path);
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    type.modifiers = *modifiers;

    auto annotations = string_list(j, "annotations", path);
    if (!annotations) {
        return std::unexpected(annotations.error());
    }
    type.annotations = std::move(*annotations);

    if (auto it = j.find("supertype"); it != j.end() && !it->is_null()) {
        auto supertype = parse_type_ref(*it, path + ".supertype");
        if (!supertype) {
            return std::unexpected(supertype.error());
        }
        type.supertype = std::move(*supertype);
    }

    auto interfaces = parse_type_ref_list(j, "interfaces", path);
    if (!interfaces) {
        return std::unexpected(interfaces.error());
    }
    type.interfaces = std::move(*interfaces);

    auto references = string_list(j, "references", path);
    if (!references) {
        return std::unexpected(references.error());
    }
    type.references = std::move(*references);

    auto fields = parse_list<FieldFact>(j, "fields", path, parse_field);
    if (!fields) {
        return std::unexpected(fields.error());
    }
    type.fields = std::move(*fields);

    auto methods = parse_list<MethodFact>(j, "methods", path, parse_method);
    if (!methods) {
        return std::unexpected(methods.error());
    }
    type.methods = std::move(*methods);

    auto constructors = parse_list<ConstructorFact>(j, "constructors", path, parse_constructor);
    if (!constructors) {
        return std::unexpected(constructors.error());
    }
    type.constructors = std::move(*constructors);

    auto components =
        parse_list<graph::RecordComponent>(j, "record_components", path, parse_component);
    if (!components) {
        return std::unexpected(components.error());
    }
    type.record_components = std::move(*components);

    return type;
}

}  // namespace

hexarch::Result<SemanticFacts> parse_facts(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("$", "facts document must be an object"));
    }
    if (j.contains("schema_version") && j.at("schema_version") != kFactsSchemaVersion) {
        return std::unexpected(invalid("$.schema_version",
                                       std::format("expected '{}'", kFactsSchemaVersion)));
    }

    SemanticFacts facts;
    auto base_namespace = optional_string(j, "base_namespace", "$");
    if (!base_namespace) {
        return std::unexpected(base_namespace.error());
    }
    facts.base_namespace = std::move(*base_namespace);
    auto language_version = optional_string(j, "language_version", "$");
    if (!language_version) {
        return std::unexpected(language_version.error());
    }
    facts.language_version = std::move(*language_version);
    if (auto it = j.find("source_unit_count"); it != j.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
            return std::unexpected(
                invalid("$", "'source_unit_count' must be a non-negative integer"));
        }
        facts.source_unit_count = it->get<decltype(facts.source_unit_count)>();
    }

    auto types = parse_list<TypeFact>(j, "types", "$", parse_type);
    if (!types) {
        return std::unexpected(types.error());
    }
    facts.types = std::move(*types);
    return facts;
}

hexarch::Result<SemanticFacts> load_facts(const std::filesystem::path& path,
                                          const std::string& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (!schema_dir.empty()) {
        const auto schema_path = std::filesystem::path(schema_dir) / "facts.v1.schema.json";
        if (auto valid = common::validate_json(*document, schema_path.string()); !valid) {
            return std::unexpected(valid.error());
        }
    }
    return parse_facts(*document);
}

}  // namespace hexarch::facts
