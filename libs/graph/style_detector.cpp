/**
 * @file style_detector.cpp
 * @brief Package-organization style detection from package-name markers
 */

#include "hexarch/style.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hexarch::graph {

namespace {

constexpr double kMinimumScore = 0.3;

struct MarkerRule
{
    std::string_view marker;     ///< Counter key
    std::string_view needle_a;   ///< Substring of the lower-cased package
    std::string_view needle_b;   ///< Alternative substring (may be empty)
};

constexpr std::array<MarkerRule, 14> kMarkerRules = {{
    {"domain", "domain", ""},
    {"ports", "port", ""},
    {"adapters", "adapter", ""},
    {"core", "core", ""},
    {"application", "application", ""},
    {"infrastructure", "infrastructure", ""},
    {"controller", "controller", ""},
    {"service", "service", ""},
    {"repository", "repository", ""},
    {"model", "model", ""},
    {"entities", "entities", "entity"},
    {"usecases", "usecase", ""},
    {"gateways", "gateway", ""},
    {"frameworks", "framework", ""},
}};

struct Weight
{
    std::string_view marker;
    double weight;
};

struct StyleProfile
{
    ArchitectureStyle style;
    std::string_view label;
    std::array<Weight, 4> weights;
};

constexpr std::array<StyleProfile, 4> kProfiles = {{
    {ArchitectureStyle::kHexagonal,
     "hexagonal",
     {{{"domain", 0.4}, {"ports", 0.4}, {"adapters", 0.3}, {"", 0.0}}}},
    {ArchitectureStyle::kOnion,
     "onion",
     {{{"core", 0.4}, {"application", 0.3}, {"infrastructure", 0.3}, {"", 0.0}}}},
    {ArchitectureStyle::kLayered,
     "layered",
     {{{"controller", 0.3}, {"service", 0.3}, {"repository", 0.2}, {"model", 0.2}}}},
    {ArchitectureStyle::kClean,
     "clean architecture",
     {{{"entities", 0.35}, {"usecases", 0.35}, {"gateways", 0.2}, {"frameworks", 0.2}}}},
}};

struct Score
{
    double total = 0.0;
    std::vector<std::string> markers;
};

[[nodiscard]] std::map<std::string_view, int> count_markers(const ApplicationGraph& graph)
{
    std::map<std::string_view, int> counts;
    for (const auto* type : graph.type_nodes()) {
        const auto package = common::to_lower(type->package_name());
        for (const auto& rule : kMarkerRules) {
            if (package.contains(rule.needle_a)
                || (!rule.needle_b.empty() && package.contains(rule.needle_b))) {
                ++counts[rule.marker];
            }
        }
    }
    return counts;
}

[[nodiscard]] Score score_profile(const StyleProfile& profile,
                                  const std::map<std::string_view, int>& counts)
{
    Score score;
    for (const auto& [marker, weight] : profile.weights) {
        if (marker.empty()) {
            continue;
        }
        if (auto it = counts.find(marker); it != counts.end() && it->second > 0) {
            score.total += weight;
            score.markers.push_back(std::format("{} package", marker));
        }
    }
    return score;
}

[[nodiscard]] bool is_common_prefix(std::string_view segment)
{
    return segment == "com" || segment == "org" || segment == "io" || segment == "net";
}

// Skips up to two leading "com"/"org"/"io"/"net" segments
[[nodiscard]] std::optional<std::string> top_level_package(std::string_view package)
{
    const auto segments = common::split_segments(package);
    std::size_t start = 0;
    if (!segments.empty() && is_common_prefix(segments[0])) {
        start = 1;
    }
    if (segments.size() > start + 1 && is_common_prefix(segments[start])) {
        ++start;
    }
    if (start >= segments.size()) {
        return std::nullopt;
    }
    return segments[start];
}

[[nodiscard]] Score score_modular(const ApplicationGraph& graph)
{
    std::set<std::string> top_levels;
    for (const auto* type : graph.type_nodes()) {
        if (auto top = top_level_package(type->package_name())) {
            top_levels.insert(*top);
        }
    }
    Score score;
    if (top_levels.size() >= 3) {
        score.total = 0.4;
        score.markers.push_back(std::format("{} top-level packages", top_levels.size()));
    }
    return score;
}

[[nodiscard]] std::string describe(std::string_view label, const std::vector<std::string>& markers)
{
    std::string joined;
    for (const auto& marker : markers) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += marker;
    }
    return std::format("Found {} markers: {}", label, joined);
}

}  // namespace

DetectedStyle detect_style(const ApplicationGraph& graph)
{
    const auto counts = count_markers(graph);

    DetectedStyle best;
    double best_score = 0.0;
    const auto consider = [&best, &best_score](ArchitectureStyle style,
                                               std::string_view label,
                                               Score score) {
        if (score.total <= best_score) {
            return;
        }
        best_score = score.total;
        best = DetectedStyle{.style = style,
                             .confidence = std::min(1.0, score.total),
                             .description = describe(label, score.markers),
                             .markers = std::move(score.markers)};
    };

    for (const auto& profile : kProfiles) {
        consider(profile.style, profile.label, score_profile(profile, counts));
    }
    consider(ArchitectureStyle::kModularMonolith, "modular", score_modular(graph));

    if (best_score < kMinimumScore) {
        return DetectedStyle{.style = ArchitectureStyle::kUnknown,
                             .confidence = 0.0,
                             .description = "No architecture style markers found",
                             .markers = {}};
    }
    return best;
}

}  // namespace hexarch::graph
