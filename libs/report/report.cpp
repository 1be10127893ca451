/**
 * @file report.cpp
 * @brief JSON documents for graph summaries, classifications and audits
 */

#include "hexarch/report.hpp"

#include "hexarch/schema_validate.hpp"
#include "hexarch/version.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hexarch::report {

namespace {

using classification::ClassificationStatus;

[[nodiscard]] std::string_view node_kind_name(graph::NodeKind kind)
{
    switch (kind) {
        case graph::NodeKind::kType:
            return "type";
        case graph::NodeKind::kField:
            return "field";
        case graph::NodeKind::kMethod:
            return "method";
        case graph::NodeKind::kConstructor:
            return "constructor";
    }
    return "type";
}

[[nodiscard]] nlohmann::json style_to_json(const graph::DetectedStyle& style)
{
    return nlohmann::json{
        {"style",       std::string(graph::to_string(style.style))},
        {"confidence",  style.confidence             },
        {"description", style.description            },
        {"markers",     style.markers                }
    };
}

[[nodiscard]] nlohmann::json ids_to_json(const std::vector<graph::NodeId>& ids)
{
    auto array = nlohmann::json::array();
    for (const auto& id : ids) {
        array.push_back(id.value());
    }
    return array;
}

template <typename Role>
[[nodiscard]] nlohmann::json classification_to_json(const classification::Classification<Role>& result)
{
    nlohmann::json j = {
        {"status", std::string(classification::to_string(result.status))}
    };
    if (result.status != ClassificationStatus::kClassified) {
        if (!result.justification.empty()) {
            j["justification"] = result.justification;
        }
    } else {
        j["role"] = std::string(classification::to_string(*result.role));
        j["confidence"] = std::string(classification::to_string(result.confidence));
        j["criterion"] = result.criterion;
        j["priority"] = result.priority;
        j["justification"] = result.justification;
    }

    auto evidence = nlohmann::json::array();
    for (const auto& item : result.evidence) {
        evidence.push_back({
            {"kind",       std::string(classification::to_string(item.kind))},
            {"message",    item.message                        },
            {"references", ids_to_json(item.references)        }
        });
    }
    j["evidence"] = std::move(evidence);

    auto conflicts = nlohmann::json::array();
    for (const auto& conflict : result.conflicts) {
        conflicts.push_back({
            {"competing_role",       conflict.competing_role                                 },
            {"competing_criterion",  conflict.competing_criterion                            },
            {"competing_confidence", std::string(classification::to_string(conflict.competing_confidence))},
            {"competing_priority",   conflict.competing_priority                             },
            {"severity",             std::string(classification::to_string(conflict.severity))            },
            {"justification",        conflict.justification                                  }
        });
    }
    j["conflicts"] = std::move(conflicts);

    auto metadata = nlohmann::json::object();
    for (const auto& [key, value] : result.metadata) {
        metadata[key] = value;
    }
    j["metadata"] = std::move(metadata);
    return j;
}

[[nodiscard]] nlohmann::json lakos_to_json(const query::LakosMetrics& metrics)
{
    return nlohmann::json{
        {"component_count", metrics.component_count},
        {"ccd",             metrics.ccd            },
        {"acd",             metrics.acd            },
        {"nccd",            metrics.nccd           },
        {"racd",            metrics.racd           }
    };
}

[[nodiscard]] nlohmann::json coupling_to_json(const query::CouplingMetrics& metrics)
{
    return nlohmann::json{
        {"package",      metrics.package                },
        {"afferent",     metrics.afferent               },
        {"efferent",     metrics.efferent               },
        {"abstractness", metrics.abstractness           },
        {"instability",  metrics.instability()          },
        {"distance",     metrics.distance()             },
        {"zone",         std::string(query::to_string(metrics.zone()))}
    };
}

[[nodiscard]] std::vector<std::string> audited_packages(const graph::ApplicationGraph& graph,
                                                        const config::AuditConfig& options)
{
    if (!options.packages.empty()) {
        return options.packages;
    }
    return graph.indexes().packages();
}

[[nodiscard]] nlohmann::json cycles_to_json(const query::ArchitectureQuery& query)
{
    auto cycles = nlohmann::json::array();
    for (const auto& cycle : query.find_all_cycles()) {
        cycles.push_back({
            {"kind", std::string(query::to_string(cycle.kind))},
            {"path", cycle.path                  }
        });
    }
    return cycles;
}

[[nodiscard]] nlohmann::json aggregates_to_json(const query::ArchitectureQuery& query)
{
    auto aggregates = nlohmann::json::array();
    for (const auto& aggregate : query.find_aggregates()) {
        nlohmann::json j = {
            {"root",          aggregate.root         },
            {"entities",      aggregate.entities     },
            {"value_objects", aggregate.value_objects},
            {"cohesion",      query.aggregate_cohesion(aggregate.root).value_or(0.0)}
        };
        if (auto repository = query.find_repository_for_aggregate(aggregate.root)) {
            j["repository"] = *repository;
        } else {
            j["repository"] = nullptr;
        }
        aggregates.push_back(std::move(j));
    }
    return aggregates;
}

}  // namespace

nlohmann::json graph_summary(const graph::ApplicationGraph& graph)
{
    std::map<std::string, std::size_t> nodes_by_kind;
    for (const auto& [id, _] : graph.nodes()) {
        ++nodes_by_kind[std::string(node_kind_name(id.kind()))];
    }
    std::map<std::string, std::size_t> types_by_form;
    for (const auto* type : graph.type_nodes()) {
        ++types_by_form[std::string(graph::to_string(type->form))];
    }
    std::map<std::string, std::size_t> edges_by_kind;
    for (const auto& edge : graph.edges()) {
        ++edges_by_kind[std::string(graph::to_string(edge.kind))];
    }

    const auto& metadata = graph.metadata();
    return nlohmann::json{
        {"metadata",
         {{"base_namespace", metadata.base_namespace},
          {"language_version", metadata.language_version},
          {"source_unit_count", metadata.source_unit_count},
          {"style", style_to_json(metadata.style)}}                    },
        {"nodes",
         {{"total", graph.node_count()},
          {"by_kind", nodes_by_kind},
          {"types_by_form", types_by_form}}                            },
        {"edges",
         {{"total", graph.edge_count()},
          {"raw", graph.raw_edges().size()},
          {"derived", graph.derived_edges().size()},
          {"by_kind", edges_by_kind}}                                  }
    };
}

nlohmann::json classifications_to_json(const graph::ApplicationGraph& graph,
                                       const classification::ClassificationSet& results)
{
    auto types = nlohmann::json::array();
    for (const auto* type : graph.type_nodes()) {
        const auto* port = results.port(type->id);
        const auto* domain = results.domain(type->id);
        if (port == nullptr && domain == nullptr) {
            continue;
        }
        nlohmann::json entry = {
            {"type", type->qualified_name                  },
            {"form", std::string(graph::to_string(type->form))}
        };
        if (port != nullptr) {
            entry["port"] = classification_to_json(*port);
        }
        if (domain != nullptr) {
            entry["domain"] = classification_to_json(*domain);
        }
        types.push_back(std::move(entry));
    }

    const auto summary = results.summary();
    return nlohmann::json{
        {"summary",
         {{"total", summary.total},
          {"classified", summary.classified},
          {"unclassified", summary.unclassified},
          {"conflicts", summary.conflicts},
          {"by_role", summary.by_role}}},
        {"types", std::move(types)}
    };
}

nlohmann::json build_audit(const graph::ApplicationGraph& graph,
                           const classification::ClassificationSet& results,
                           const config::AuditConfig& options)
{
    const query::ArchitectureQuery query(graph, &results);

    auto coupling = nlohmann::json::array();
    auto package_lakos = nlohmann::json::array();
    for (const auto& package : audited_packages(graph, options)) {
        coupling.push_back(coupling_to_json(query.coupling_metrics(package)));
        auto lakos = lakos_to_json(query.lakos_metrics(package));
        lakos["package"] = package;
        package_lakos.push_back(std::move(lakos));
    }

    auto contexts = nlohmann::json::array();
    for (const auto& context : query.find_bounded_contexts()) {
        contexts.push_back({
            {"name",         context.name        },
            {"root_package", context.root_package},
            {"types",        context.types       }
        });
    }

    auto layer_violations = nlohmann::json::array();
    if (options.include_layer_violations) {
        for (const auto& violation : query.find_layer_violations()) {
            layer_violations.push_back({
                {"from",       violation.from_type                   },
                {"to",         violation.to_type                     },
                {"from_layer", std::string(query::to_string(violation.from_layer))},
                {"to_layer",   std::string(query::to_string(violation.to_layer))  }
            });
        }
    }

    auto stability_violations = nlohmann::json::array();
    if (options.include_stability_violations) {
        for (const auto& violation : query.find_stability_violations()) {
            stability_violations.push_back({
                {"from",             violation.from_type       },
                {"to",               violation.to_type         },
                {"from_instability", violation.from_instability},
                {"to_instability",   violation.to_instability  }
            });
        }
    }

    auto cycles = cycles_to_json(query);
    auto aggregates = aggregates_to_json(query);
    nlohmann::json summary = {
        {"types",                graph.type_nodes().size()  },
        {"cycles",               cycles.size()              },
        {"aggregates",           aggregates.size()          },
        {"bounded_contexts",     contexts.size()            },
        {"layer_violations",     layer_violations.size()    },
        {"stability_violations", stability_violations.size()}
    };

    return nlohmann::json{
        {"schema_version",       kAuditSchemaVersion                                          },
        {"tool",                 {{"name", "hexarch"}, {"version", kVersion}, {"build_id", kBuildId}}},
        {"style",                style_to_json(graph.metadata().style)                        },
        {"summary",              std::move(summary)                                           },
        {"cycles",               std::move(cycles)                                            },
        {"lakos",                {{"global", lakos_to_json(query.lakos_metrics())}, {"packages", std::move(package_lakos)}}},
        {"coupling",             std::move(coupling)                                          },
        {"aggregates",           std::move(aggregates)                                        },
        {"bounded_contexts",     std::move(contexts)                                          },
        {"layer_violations",     std::move(layer_violations)                                  },
        {"stability_violations", std::move(stability_violations)                              }
    };
}

hexarch::VoidResult validate_audit(const nlohmann::json& audit, const std::string& schema_dir)
{
    const auto schema_path = std::filesystem::path(schema_dir) / "audit.v1.schema.json";
    return common::validate_json(audit, schema_path.string());
}

}  // namespace hexarch::report
