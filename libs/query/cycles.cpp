/**
 * @file cycles.cpp
 * @brief Type, package and bounded-context cycles; bounded context listing
 */

#include "hexarch/architecture_query.hpp"

#include "cycle_detector.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <iterator>
#include <ranges>
#include <utility>

namespace hexarch::query {

namespace {

using Adjacency = std::map<std::string, std::set<std::string>>;

[[nodiscard]] std::vector<DependencyCycle> tag_cycles(std::vector<std::vector<std::string>> paths,
                                                      CycleKind kind)
{
    std::vector<DependencyCycle> cycles;
    cycles.reserve(paths.size());
    for (auto& path : paths) {
        cycles.push_back(DependencyCycle{.kind = kind, .path = std::move(path)});
    }
    return cycles;
}

/// Collapse type-level dependencies onto groups, dropping edges inside a group
[[nodiscard]] Adjacency group_adjacency(
    const Adjacency& types,
    const std::function<std::optional<std::string>(std::string_view)>& group_of)
{
    Adjacency groups;
    for (const auto& [from, targets] : types) {
        const auto from_group = group_of(from);
        if (!from_group) {
            continue;
        }
        for (const auto& to : targets) {
            const auto to_group = group_of(to);
            if (to_group && *to_group != *from_group) {
                groups[*from_group].insert(*to_group);
            }
        }
    }
    return groups;
}

}  // namespace

std::string_view to_string(CycleKind kind)
{
    switch (kind) {
        case CycleKind::kType:
            return "TYPE_LEVEL";
        case CycleKind::kPackage:
            return "PACKAGE_LEVEL";
        case CycleKind::kBoundedContext:
            return "BOUNDED_CONTEXT_LEVEL";
    }
    return "TYPE_LEVEL";
}

std::optional<std::string> bounded_context_of(std::string_view package)
{
    auto segments = common::split_segments(package);
    if (segments.size() < 3) {
        return std::nullopt;
    }
    return std::move(segments[2]);
}

ArchitectureQuery::ArchitectureQuery(const graph::ApplicationGraph& graph,
                                     const classification::ClassificationSet* classifications)
    : m_graph(&graph)
    , m_classifications(classifications)
{}

ArchitectureQuery::Adjacency ArchitectureQuery::reference_adjacency() const
{
    Adjacency adjacency;
    for (const auto* type : m_graph->type_nodes()) {
        adjacency.try_emplace(type->qualified_name);
    }
    for (const auto* edge : m_graph->edges(graph::EdgeKind::kReferences)) {
        if (edge->from.is_type() && edge->to.is_type()) {
            adjacency[std::string(edge->from.owner())].insert(std::string(edge->to.owner()));
        }
    }
    return adjacency;
}

std::vector<DependencyCycle> ArchitectureQuery::find_type_cycles() const
{
    return tag_cycles(detail::find_cycles(reference_adjacency()), CycleKind::kType);
}

std::vector<DependencyCycle> ArchitectureQuery::find_package_cycles() const
{
    const auto packages = group_adjacency(reference_adjacency(), [](std::string_view type) {
        return std::optional<std::string>(common::package_name(type));
    });
    return tag_cycles(detail::find_cycles(packages), CycleKind::kPackage);
}

std::vector<DependencyCycle> ArchitectureQuery::find_bounded_context_cycles() const
{
    const auto contexts = group_adjacency(reference_adjacency(), [](std::string_view type) {
        return bounded_context_of(common::package_name(type));
    });
    return tag_cycles(detail::find_cycles(contexts), CycleKind::kBoundedContext);
}

std::vector<DependencyCycle> ArchitectureQuery::find_all_cycles() const
{
    auto cycles = find_type_cycles();
    std::ranges::move(find_package_cycles(), std::back_inserter(cycles));
    std::ranges::move(find_bounded_context_cycles(), std::back_inserter(cycles));
    return cycles;
}

std::vector<BoundedContextInfo> ArchitectureQuery::find_bounded_contexts() const
{
    std::map<std::string, BoundedContextInfo> contexts;
    for (const auto* type : m_graph->type_nodes()) {
        const auto package = type->package_name();
        auto name = bounded_context_of(package);
        if (!name) {
            continue;
        }
        auto [it, inserted] = contexts.try_emplace(*name);
        if (inserted) {
            const auto segments = common::split_segments(package);
            it->second.name = *name;
            it->second.root_package = std::format("{}.{}.{}", segments[0], segments[1], segments[2]);
        }
        it->second.types.push_back(type->qualified_name);
    }
    std::vector<BoundedContextInfo> result;
    result.reserve(contexts.size());
    for (auto& info : contexts | std::views::values) {
        result.push_back(std::move(info));
    }
    return result;
}

}  // namespace hexarch::query
