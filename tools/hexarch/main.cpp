/**
 * @file main.cpp
 * @brief hexarch CLI entry point
 *
 * Commands:
 *   graph     - Build the application graph and write its summary
 *   classify  - Classify every type (domain roles and ports)
 *   audit     - Classify and run the architecture queries
 *   version   - Show version information
 */

#include "hexarch/require_cpp23.hpp"

#include "hexarch/classification/classifier.hpp"
#include "hexarch/common.hpp"
#include "hexarch/config.hpp"
#include "hexarch/facts.hpp"
#include "hexarch/graph_builder.hpp"
#include "hexarch/report.hpp"
#include "hexarch/schema_validate.hpp"
#include "hexarch/version.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

namespace {

enum class Command {
    kGraph,
    kClassify,
    kAudit
};

[[nodiscard]] std::string_view command_name(Command command)
{
    switch (command) {
        case Command::kGraph:
            return "graph";
        case Command::kClassify:
            return "classify";
        case Command::kAudit:
            return "audit";
    }
    return "graph";
}

[[nodiscard]] std::string_view default_output(Command command)
{
    switch (command) {
        case Command::kGraph:
            return "graph.json";
        case Command::kClassify:
            return "classifications.json";
        case Command::kAudit:
            return "audit.json";
    }
    return "graph.json";
}

void print_version()
{
    std::println("hexarch {} ({})", hexarch::kVersion, hexarch::kBuildId);
    std::println("  facts:  {}", hexarch::kFactsSchemaVersion);
    std::println("  config: {}", hexarch::kConfigSchemaVersion);
    std::println("  audit:  {}", hexarch::kAuditSchemaVersion);
}

void print_help()
{
    std::print(R"(hexarch - DDD / hexagonal architecture analyzer

Usage: hexarch <command> [options]

Commands:
  graph       Build the application graph and write its summary
  classify    Classify every type as a domain role or a port
  audit       Classify and report cycles, coupling, aggregates and violations
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'hexarch <command> --help' for command-specific options.
)");
}

void print_command_help(Command command)
{
    std::print(R"(Usage: hexarch {0} [options]

Options:
  --facts FILE              Path to facts.v1 JSON (required)
  --config FILE             Analysis configuration (config.v1)
  --strict                  Use the strict decision policy (overrides config)
  --output FILE, -o         Output file (default: {1})
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --quiet, -q               Suppress progress output
  --help, -h                Show this help
)",
               command_name(command),
               default_output(command));
}

struct AnalysisOptions
{
    std::string facts;
    std::optional<std::string> config;
    std::string output;
    std::string schema_dir;
    bool strict;
    bool quiet;
    bool show_help;
};

/// Loaded inputs shared by every command
struct Pipeline
{
    hexarch::config::AnalysisConfig config;
    hexarch::graph::ApplicationGraph graph;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> hexarch::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            hexarch::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_analysis_option(std::string_view arg,
                                       std::span<char*> args,
                                       std::size_t index,
                                       AnalysisOptions& options,
                                       bool& skip_next) -> hexarch::Result<bool>
{
    std::string* target = nullptr;
    if (arg == "--facts") {
        target = &options.facts;
    } else if (arg == "--output" || arg == "-o") {
        target = &options.output;
    } else if (arg == "--schema-dir") {
        target = &options.schema_dir;
    } else if (arg == "--config") {
        auto value = read_option_value(args, index, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.config = *value;
        skip_next = true;
        return true;
    } else if (arg == "--strict") {
        options.strict = true;
        return true;
    } else if (arg == "--quiet" || arg == "-q") {
        options.quiet = true;
        return true;
    } else {
        return std::unexpected(
            hexarch::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }

    auto value = read_option_value(args, index, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    *target = *value;
    skip_next = true;
    return true;
}

[[nodiscard]] hexarch::Result<AnalysisOptions> parse_analysis_args(Command command,
                                                                   std::span<char*> args)
{
    AnalysisOptions options{.facts = std::string{},
                            .config = std::nullopt,
                            .output = std::string(default_output(command)),
                            .schema_dir = "schemas",
                            .strict = false,
                            .quiet = false,
                            .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_analysis_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
    }
    return options;
}

[[nodiscard]] hexarch::Result<Pipeline> load_pipeline(const AnalysisOptions& options)
{
    Pipeline pipeline;
    if (options.config) {
        auto config = hexarch::config::load_config(*options.config, options.schema_dir);
        if (!config) {
            return std::unexpected(config.error());
        }
        pipeline.config = std::move(*config);
    }
    if (options.strict) {
        pipeline.config.classifier.decision_policy = hexarch::classification::DecisionPolicyKind::kStrict;
    }

    auto facts = hexarch::facts::load_facts(options.facts, options.schema_dir);
    if (!facts) {
        return std::unexpected(facts.error());
    }
    auto graph = hexarch::facts::build_graph(*facts);
    if (!graph) {
        return std::unexpected(graph.error());
    }
    pipeline.graph = std::move(*graph);
    return pipeline;
}

void print_graph_lines(const hexarch::graph::ApplicationGraph& graph)
{
    const auto& style = graph.metadata().style;
    std::println("  types: {}", graph.type_nodes().size());
    std::println("  nodes: {}", graph.node_count());
    std::println("  edges: {} ({} derived)", graph.edge_count(), graph.derived_edges().size());
    std::println("  style: {} ({:.2f})", hexarch::graph::to_string(style.style), style.confidence);
}

[[nodiscard]] int write_output(const AnalysisOptions& options, const nlohmann::json& payload)
{
    if (auto result = hexarch::common::write_json_file(options.output, payload); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    if (!options.quiet) {
        std::println("  output: {}", options.output);
    }
    return 0;
}

[[nodiscard]] int run_graph(const AnalysisOptions& options, const Pipeline& pipeline)
{
    if (!options.quiet) {
        std::println("[graph] Built application graph");
        std::println("  facts: {}", options.facts);
        print_graph_lines(pipeline.graph);
    }
    return write_output(options, hexarch::report::graph_summary(pipeline.graph));
}

[[nodiscard]] int run_classify(const AnalysisOptions& options, const Pipeline& pipeline)
{
    const auto results =
        hexarch::classification::classify_all(pipeline.graph, pipeline.config.classifier_options());
    if (!options.quiet) {
        const auto summary = results.summary();
        std::println("[classify] Classified {} of {} types", summary.classified, summary.total);
        print_graph_lines(pipeline.graph);
        std::println("  unclassified: {}", summary.unclassified);
        std::println("  conflicts: {}", summary.conflicts);
        for (const auto& [role, count] : summary.by_role) {
            std::println("  {}: {}", role, count);
        }
    }
    return write_output(options, hexarch::report::classifications_to_json(pipeline.graph, results));
}

[[nodiscard]] int run_audit(const AnalysisOptions& options, const Pipeline& pipeline)
{
    const auto results =
        hexarch::classification::classify_all(pipeline.graph, pipeline.config.classifier_options());
    const auto audit = hexarch::report::build_audit(pipeline.graph, results, pipeline.config.audit);
    if (auto valid = hexarch::report::validate_audit(audit, options.schema_dir); !valid) {
        std::println(stderr, "Error: audit schema validation failed: {}", valid.error().message);
        return 1;
    }
    if (!options.quiet) {
        const auto& summary = audit.at("summary");
        std::println("[audit] Audited {} types", summary.at("types").get<std::size_t>());
        print_graph_lines(pipeline.graph);
        for (const auto* key :
             {"cycles", "aggregates", "bounded_contexts", "layer_violations", "stability_violations"}) {
            std::println("  {}: {}", key, summary.at(key).get<std::size_t>());
        }
    }
    return write_output(options, audit);
}

int cmd_analysis(Command command, int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analysis_args(command, args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_command_help(command);
        return 0;
    }
    if (options->facts.empty()) {
        std::println(stderr, "Error: --facts is required");
        print_command_help(command);
        return 1;
    }

    auto pipeline = load_pipeline(*options);
    if (!pipeline) {
        std::println(stderr, "Error: {}", pipeline.error().message);
        return 1;
    }
    switch (command) {
        case Command::kGraph:
            return run_graph(*options, *pipeline);
        case Command::kClassify:
            return run_classify(*options, *pipeline);
        case Command::kAudit:
            return run_audit(*options, *pipeline);
    }
    return 1;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "graph") {
            return cmd_analysis(Command::kGraph, sub_argc, sub_argv);
        }
        if (cmd == "classify") {
            return cmd_analysis(Command::kClassify, sub_argc, sub_argv);
        }
        if (cmd == "audit") {
            return cmd_analysis(Command::kAudit, sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
